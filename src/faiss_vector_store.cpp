#include "faiss_vector_store.hpp"
#include <faiss/IndexHNSW.h>
#include <faiss/index_io.h>
#include <faiss/impl/FaissAssert.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace app_retrieval {

static faiss::Index* make_hnsw_index(int dimension) {
    // Unit vectors under inner product give cosine similarity directly.
    auto idx = new faiss::IndexHNSWFlat(dimension, 32, faiss::METRIC_INNER_PRODUCT);
    idx->hnsw.efConstruction = 40;
    idx->hnsw.efSearch = 64;
    return idx;
}

FaissVectorStore::FaissVectorStore(int dimension) : dimension_(dimension) {
    index_.reset(make_hnsw_index(dimension));
}

FaissVectorStore::~FaissVectorStore() {
}

void FaissVectorStore::reset() {
    index_.reset(make_hnsw_index(dimension_));
    records_list_.clear();
}

void FaissVectorStore::add_records(const std::vector<std::shared_ptr<ApplicationRecord>>& records,
                                   const std::vector<std::vector<float>>& vectors) {
    if (records.size() != vectors.size()) {
        throw std::invalid_argument("records and vectors differ in length");
    }
    if (records.empty()) return;

    std::vector<float> vectors_flat;
    vectors_flat.reserve(records.size() * static_cast<size_t>(dimension_));
    for (const auto& vec : vectors) {
        if (static_cast<int>(vec.size()) != dimension_) {
            throw std::invalid_argument("vector dimension " + std::to_string(vec.size()) +
                                        " does not match index dimension " + std::to_string(dimension_));
        }
        vectors_flat.insert(vectors_flat.end(), vec.begin(), vec.end());
    }

    long num_to_add = static_cast<long>(records.size());

    faiss::fvec_renorm_L2(dimension_, num_to_add, vectors_flat.data());
    index_->add(num_to_add, vectors_flat.data());

    records_list_.insert(records_list_.end(), records.begin(), records.end());

    spdlog::info("✅ Added {} records to FAISS. Total: {}", num_to_add, index_->ntotal);
}

std::vector<FaissSearchResult> FaissVectorStore::search(const std::vector<float>& query_vector, int k) const {
    if (index_->ntotal == 0 || k <= 0) return {};
    if (static_cast<int>(query_vector.size()) != dimension_) {
        throw std::invalid_argument("query vector dimension mismatch");
    }

    int n = static_cast<int>(std::min<faiss::idx_t>(k, index_->ntotal));

    std::vector<float> query_copy = query_vector;
    faiss::fvec_renorm_L2(dimension_, 1, query_copy.data());

    std::vector<float> scores(n);
    std::vector<faiss::idx_t> indices(n);

    index_->search(1, query_copy.data(), n, scores.data(), indices.data());

    std::vector<FaissSearchResult> results;
    for (int i = 0; i < n; ++i) {
        if (indices[i] < 0 || indices[i] >= static_cast<faiss::idx_t>(records_list_.size())) continue;
        results.push_back({records_list_[indices[i]], scores[i]});
    }
    return results;
}

void FaissVectorStore::save(const std::string& path) const {
    fs::path dir(path);
    fs::create_directories(dir);

    faiss::write_index(index_.get(), (dir / "faiss.index").string().c_str());

    json metadata = json::array();
    for (const auto& rec : records_list_) {
        metadata.push_back(rec->to_json());
    }

    std::ofstream meta_file(dir / "metadata.json");
    if (!meta_file) throw std::runtime_error("Cannot write " + (dir / "metadata.json").string());
    meta_file << metadata.dump(2);
}

void FaissVectorStore::load(const std::string& path) {
    fs::path dir(path);
    if (!fs::exists(dir / "faiss.index") || !fs::exists(dir / "metadata.json")) {
        throw std::runtime_error("No index found at " + path);
    }

    std::unique_ptr<faiss::Index> loaded;
    try {
        loaded.reset(faiss::read_index((dir / "faiss.index").string().c_str()));
    } catch (const faiss::FaissException& e) {
        throw std::runtime_error(std::string("Failed to read faiss index: ") + e.what());
    }
    if (loaded->d != dimension_) {
        throw std::runtime_error("Index at " + path + " has dimension " + std::to_string(loaded->d) +
                                 ", expected " + std::to_string(dimension_));
    }

    std::ifstream meta_file(dir / "metadata.json");
    json metadata = json::parse(meta_file);
    if (!metadata.is_array() || static_cast<faiss::idx_t>(metadata.size()) != loaded->ntotal) {
        throw std::runtime_error("Index metadata at " + path + " does not match vector count");
    }

    index_ = std::move(loaded);
    records_list_.clear();

    for (const auto& j_rec : metadata) {
        records_list_.push_back(std::make_shared<ApplicationRecord>(ApplicationRecord::from_json(j_rec)));
    }
    spdlog::info("✅ Loaded FAISS index with {} records from {}", index_->ntotal, path);
}

size_t FaissVectorStore::size() const {
    return records_list_.size();
}

const std::vector<std::shared_ptr<ApplicationRecord>>& FaissVectorStore::get_all_records() const {
    return records_list_;
}

} // namespace app_retrieval

#include "application_index.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace app_retrieval {

ApplicationIndex::ApplicationIndex(int dimension)
    : vectors_(std::make_unique<FaissVectorStore>(dimension)) {}

ChannelResult ApplicationIndex::vector_search(const std::vector<float>& query_vector, int limit) {
    try {
        std::vector<Candidate> hits;
        for (const auto& res : vectors_->search(query_vector, limit)) {
            Candidate c;
            c.record = *res.record;
            c.score = res.faiss_score;
            c.distance = 1.0 - res.faiss_score;
            hits.push_back(std::move(c));
        }
        return ChannelResult::ok(std::move(hits));
    } catch (const std::exception& e) {
        return ChannelResult::failed(e.what());
    }
}

ChannelResult ApplicationIndex::lexical_search(const std::string& query_text,
                                               const std::vector<std::string>& fields,
                                               int limit) {
    if (lexical_.size() == 0) {
        return ChannelResult::degraded("lexical index is empty");
    }
    std::vector<Candidate> hits;
    for (const auto& hit : lexical_.search(query_text, fields, limit)) {
        Candidate c;
        c.record = *hit.record;
        c.score = hit.score;
        hits.push_back(std::move(c));
    }
    return ChannelResult::ok(std::move(hits));
}

void ApplicationIndex::rebuild(const std::vector<ApplicationRecord>& records,
                               const std::vector<std::vector<float>>& vectors) {
    if (records.size() != vectors.size()) {
        throw std::invalid_argument("records and vectors differ in length");
    }
    std::vector<std::shared_ptr<ApplicationRecord>> shared;
    shared.reserve(records.size());
    for (const auto& rec : records) shared.push_back(std::make_shared<ApplicationRecord>(rec));

    vectors_->reset();
    vectors_->add_records(shared, vectors);
    lexical_.rebuild(shared);
    spdlog::info("📇 Application index rebuilt: {} records", shared.size());
}

size_t ApplicationIndex::size() const {
    return vectors_->size();
}

void ApplicationIndex::save(const std::string& dir) const {
    vectors_->save(dir);
}

void ApplicationIndex::load(const std::string& dir) {
    vectors_->load(dir);
    lexical_.rebuild(vectors_->get_all_records());
}

} // namespace app_retrieval

#pragma once
#include <memory>
#include <string>
#include <vector>
#include "faiss_vector_store.hpp"
#include "lexical_index.hpp"
#include "search_index.hpp"

namespace app_retrieval {

// faiss HNSW for the dense channel, in-memory BM25 for the lexical channel.
// There is no built-in reranker, so hybrid_search stays unsupported.
class ApplicationIndex : public SearchIndex {
public:
    explicit ApplicationIndex(int dimension);

    ChannelResult vector_search(const std::vector<float>& query_vector, int limit) override;
    ChannelResult lexical_search(const std::string& query_text,
                                 const std::vector<std::string>& fields,
                                 int limit) override;

    void rebuild(const std::vector<ApplicationRecord>& records,
                 const std::vector<std::vector<float>>& vectors) override;

    size_t size() const override;

    void save(const std::string& dir) const override;
    void load(const std::string& dir) override;

private:
    std::unique_ptr<FaissVectorStore> vectors_;
    LexicalIndex lexical_;
};

} // namespace app_retrieval

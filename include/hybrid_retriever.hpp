#pragma once
#include <memory>
#include <string>
#include <vector>
#include "candidate.hpp"
#include "search_index.hpp"

namespace app_retrieval {

constexpr int kDefaultRrfK = 60;

// Text fields the lexical channel matches against.
extern const std::vector<std::string> kDefaultFtsColumns;

struct RetrievalTrace {
    std::string path; // "native", "rrf" or "dense_only"
    ChannelStatus native_status = ChannelStatus::Unsupported;
    ChannelStatus dense_status = ChannelStatus::Ok;
    ChannelStatus lexical_status = ChannelStatus::Unsupported;
    size_t dense_hits = 0;
    size_t lexical_hits = 0;
    double elapsed_ms = 0.0;
};

// Reciprocal Rank Fusion: an item at 1-indexed rank r in either list adds
// 1/(rrf_k + r). Field data merges last-write-wins, order is stable.
std::vector<Candidate> rrf_fuse(const std::vector<Candidate>& dense,
                                const std::vector<Candidate>& lexical,
                                int rrf_k = kDefaultRrfK);

class HybridRetriever {
public:
    explicit HybridRetriever(std::shared_ptr<SearchIndex> index, int rrf_k = kDefaultRrfK)
        : index_(std::move(index)), rrf_k_(rrf_k) {}

    // Native hybrid results when the index has them, RRF over the dense and
    // lexical channels otherwise. Throws std::runtime_error when the dense
    // channel fails.
    std::vector<Candidate> retrieve(const std::string& query,
                                    const std::vector<float>& query_vector,
                                    int candidate_k,
                                    RetrievalTrace* trace = nullptr);

    int rrf_k() const { return rrf_k_; }

private:
    std::shared_ptr<SearchIndex> index_;
    int rrf_k_;
};

} // namespace app_retrieval

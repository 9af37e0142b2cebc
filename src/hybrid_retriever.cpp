#include "hybrid_retriever.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace app_retrieval {

const std::vector<std::string> kDefaultFtsColumns = {
    "text", "context_bundle_text", "company", "role", "notes"
};

const char* to_string(ChannelStatus status) {
    switch (status) {
        case ChannelStatus::Ok: return "ok";
        case ChannelStatus::Degraded: return "degraded";
        case ChannelStatus::Unsupported: return "unsupported";
        case ChannelStatus::Failed: return "failed";
    }
    return "unknown";
}

std::vector<Candidate> rrf_fuse(const std::vector<Candidate>& dense,
                                const std::vector<Candidate>& lexical,
                                int rrf_k) {
    std::vector<Candidate> merged;
    std::unordered_map<std::string, size_t> slot;

    auto absorb = [&](const std::vector<Candidate>& list, bool is_dense) {
        for (size_t i = 0; i < list.size(); ++i) {
            const auto& hit = list[i];
            int rank = static_cast<int>(i) + 1;
            double contribution = 1.0 / (rrf_k + rank);

            auto it = slot.find(hit.id());
            if (it == slot.end()) {
                slot.emplace(hit.id(), merged.size());
                Candidate c = hit;
                c.hybrid_score = contribution;
                c.rank_dense = is_dense ? rank : 0;
                c.rank_lexical = is_dense ? 0 : rank;
                merged.push_back(std::move(c));
                continue;
            }

            Candidate& c = merged[it->second];
            c.record = hit.record;
            if (hit.score) c.score = hit.score;
            if (hit.distance) c.distance = hit.distance;
            c.hybrid_score = c.hybrid_score.value_or(0.0) + contribution;
            if (is_dense && c.rank_dense == 0) c.rank_dense = rank;
            if (!is_dense && c.rank_lexical == 0) c.rank_lexical = rank;
        }
    };

    absorb(dense, true);
    absorb(lexical, false);

    std::stable_sort(merged.begin(), merged.end(), [](const Candidate& a, const Candidate& b) {
        return a.hybrid_score.value_or(0.0) > b.hybrid_score.value_or(0.0);
    });
    return merged;
}

std::vector<Candidate> HybridRetriever::retrieve(const std::string& query,
                                                 const std::vector<float>& query_vector,
                                                 int candidate_k,
                                                 RetrievalTrace* trace) {
    auto start = std::chrono::high_resolution_clock::now();
    RetrievalTrace local;
    RetrievalTrace& t = trace ? *trace : local;

    auto finish = [&](std::vector<Candidate> out, const char* path) {
        t.path = path;
        auto end = std::chrono::high_resolution_clock::now();
        t.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
        spdlog::info("⏱️ Retrieval ({}) returned {} candidates in {:.2f} ms", path, out.size(), t.elapsed_ms);
        return out;
    };

    // 1. Native hybrid
    auto native = index_->hybrid_search(query, kDefaultFtsColumns, candidate_k);
    t.native_status = native.status;
    if (native.usable()) {
        return finish(std::move(native.hits), "native");
    }
    if (native.status == ChannelStatus::Unsupported) {
        spdlog::debug("Native hybrid search unavailable: {}", native.reason);
    } else if (native.status == ChannelStatus::Ok) {
        spdlog::debug("Native hybrid search returned no rows, using manual fusion");
    } else {
        spdlog::warn("⚠️ Native hybrid search {}: {}", to_string(native.status), native.reason);
    }

    // 2. Dense channel
    auto dense = index_->vector_search(query_vector, candidate_k);
    t.dense_status = dense.status;
    if (dense.status == ChannelStatus::Failed) {
        spdlog::error("Dense retrieval failed: {}", dense.reason);
        throw std::runtime_error("Dense retrieval failed: " + dense.reason);
    }
    for (size_t i = 0; i < dense.hits.size(); ++i) {
        dense.hits[i].rank_dense = static_cast<int>(i) + 1;
    }
    t.dense_hits = dense.hits.size();

    // 3. Lexical channel
    auto lexical = index_->lexical_search(query, kDefaultFtsColumns, candidate_k);
    t.lexical_status = lexical.status;
    t.lexical_hits = lexical.hits.size();
    if (!lexical.usable()) {
        if (lexical.status == ChannelStatus::Ok) {
            spdlog::debug("Lexical channel returned no rows, using dense results only");
        } else {
            spdlog::warn("⚠️ Lexical channel {} ({}), using dense results only",
                         to_string(lexical.status), lexical.reason);
        }
        return finish(std::move(dense.hits), "dense_only");
    }

    spdlog::debug("RRF over {} dense and {} lexical hits (k={})", dense.hits.size(), lexical.hits.size(), rrf_k_);
    return finish(rrf_fuse(dense.hits, lexical.hits, rrf_k_), "rrf");
}

} // namespace app_retrieval

#pragma once
#include <string>
#include <vector>
#include "application_record.hpp"
#include "candidate.hpp"

namespace app_retrieval {

enum class ChannelStatus { Ok, Degraded, Unsupported, Failed };

const char* to_string(ChannelStatus status);

// Outcome of one index channel. Degraded conditions travel as values.
struct ChannelResult {
    ChannelStatus status = ChannelStatus::Ok;
    std::string reason;
    std::vector<Candidate> hits;

    bool usable() const { return status == ChannelStatus::Ok && !hits.empty(); }

    static ChannelResult ok(std::vector<Candidate> hits) {
        return {ChannelStatus::Ok, "", std::move(hits)};
    }
    static ChannelResult degraded(std::string reason) {
        return {ChannelStatus::Degraded, std::move(reason), {}};
    }
    static ChannelResult unsupported(std::string reason = "not supported by index") {
        return {ChannelStatus::Unsupported, std::move(reason), {}};
    }
    static ChannelResult failed(std::string reason) {
        return {ChannelStatus::Failed, std::move(reason), {}};
    }
};

// Pluggable store answering nearest-by-vector and match-by-terms queries.
class SearchIndex {
public:
    virtual ~SearchIndex() = default;

    virtual ChannelResult vector_search(const std::vector<float>& query_vector, int limit) = 0;

    virtual ChannelResult lexical_search(const std::string& query_text,
                                         const std::vector<std::string>& fields,
                                         int limit) {
        return ChannelResult::unsupported();
    }

    // Combined dense+lexical query with a built-in reranker.
    virtual ChannelResult hybrid_search(const std::string& query_text,
                                        const std::vector<std::string>& fts_columns,
                                        int limit) {
        return ChannelResult::unsupported();
    }

    virtual void rebuild(const std::vector<ApplicationRecord>& records,
                         const std::vector<std::vector<float>>& vectors) = 0;

    virtual size_t size() const = 0;

    virtual void save(const std::string& dir) const = 0;
    virtual void load(const std::string& dir) = 0;
};

} // namespace app_retrieval

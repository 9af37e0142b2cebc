#pragma once
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "embedder.hpp"
#include "lexical_index.hpp"
#include "search_index.hpp"

namespace app_retrieval::test_support {

// Brute-force cosine for the dense channel, BM25 for the lexical one.
// Channel behaviour can be overridden per test.
class FakeSearchIndex : public SearchIndex {
public:
    std::optional<ChannelResult> dense_override;
    std::optional<ChannelResult> lexical_override;
    std::optional<ChannelResult> hybrid_override;
    int vector_calls = 0;
    int lexical_calls = 0;
    int last_limit = 0;

    ChannelResult vector_search(const std::vector<float>& query_vector, int limit) override {
        ++vector_calls;
        last_limit = limit;
        if (dense_override) return *dense_override;

        std::vector<Candidate> hits;
        for (size_t i = 0; i < records_.size(); ++i) {
            Candidate c;
            c.record = records_[i];
            c.score = cosine_similarity(query_vector, vectors_[i]);
            c.distance = 1.0 - *c.score;
            hits.push_back(std::move(c));
        }
        std::stable_sort(hits.begin(), hits.end(), [](const Candidate& a, const Candidate& b) {
            return *a.score > *b.score;
        });
        if (hits.size() > static_cast<size_t>(limit)) hits.resize(limit);
        return ChannelResult::ok(std::move(hits));
    }

    ChannelResult lexical_search(const std::string& query_text,
                                 const std::vector<std::string>& fields,
                                 int limit) override {
        ++lexical_calls;
        if (lexical_override) return *lexical_override;

        std::vector<Candidate> hits;
        for (const auto& hit : lexical_.search(query_text, fields, limit)) {
            Candidate c;
            c.record = *hit.record;
            c.score = hit.score;
            hits.push_back(std::move(c));
        }
        return ChannelResult::ok(std::move(hits));
    }

    ChannelResult hybrid_search(const std::string& query_text,
                                const std::vector<std::string>& fts_columns,
                                int limit) override {
        if (hybrid_override) return *hybrid_override;
        return SearchIndex::hybrid_search(query_text, fts_columns, limit);
    }

    void rebuild(const std::vector<ApplicationRecord>& records,
                 const std::vector<std::vector<float>>& vectors) override {
        records_ = records;
        vectors_ = vectors;
        std::vector<std::shared_ptr<ApplicationRecord>> shared;
        for (const auto& r : records_) shared.push_back(std::make_shared<ApplicationRecord>(r));
        lexical_.rebuild(shared);
    }

    size_t size() const override { return records_.size(); }

    void save(const std::string&) const override { ++saves_; }
    void load(const std::string&) override {}

    int saves() const { return saves_; }

private:
    std::vector<ApplicationRecord> records_;
    std::vector<std::vector<float>> vectors_;
    LexicalIndex lexical_;
    mutable int saves_ = 0;
};

inline Candidate make_candidate(const std::string& id, double score = 0.5) {
    Candidate c;
    c.record.app_id = id;
    c.record.company = id;
    c.score = score;
    return c;
}

} // namespace app_retrieval::test_support

#pragma once
#include <optional>
#include <string>
#include "application_record.hpp"

namespace app_retrieval {

// One retrieval hit plus the transient scores attached along the pipeline.
struct Candidate {
    ApplicationRecord record;

    std::optional<double> score;        // index similarity (cosine / bm25)
    std::optional<double> distance;
    std::optional<double> hybrid_score; // rrf sum or native reranker score
    int rank_dense = 0;                 // 1-indexed, 0 = absent
    int rank_lexical = 0;

    double base_score = 0.0;
    double lexical_overlap = 0.0;
    double bandit_prior = 0.0;
    double memory_short = 0.0;
    double memory_long = 0.0;
    double final_score = 0.0;

    const std::string& id() const { return record.app_id; }
};

} // namespace app_retrieval

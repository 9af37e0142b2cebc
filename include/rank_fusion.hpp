#pragma once
#include <string>
#include <vector>
#include "bandit_model.hpp"
#include "candidate.hpp"
#include "memory/memory_store.hpp"

namespace app_retrieval {

struct FusionWeights {
    double base = 0.48;
    double lexical = 0.22;
    double bandit = 0.20;
    double memory_short = 0.06;
    double memory_long = 0.04;

    double sum() const { return base + lexical + bandit + memory_short + memory_long; }
};

// <= 0 -> 0, <= 1 -> raw, otherwise squashed into (0.5, 1).
double normalize_base_score(double raw);

// hybrid score, else similarity, else 1/(1+max(0,distance)), else 0.
double display_score(const Candidate& c);

// Fraction of distinct lowercase query terms that appear as substrings of the
// candidate's descriptive fields.
double lexical_overlap_score(const std::string& query, const ApplicationRecord& rec);

// Mean posterior reward over the candidate's existing method and tag arms.
double bandit_prior_for(const ApplicationRecord& rec, const ThompsonModel& model);

// Scores every candidate and returns them sorted by final_score, descending
// and stable. Does not truncate.
std::vector<Candidate> fuse(std::vector<Candidate> candidates,
                            const std::string& query,
                            const ThompsonModel& model,
                            const ScoreMap& memory_short,
                            const ScoreMap& memory_long,
                            const FusionWeights& weights = FusionWeights{});

} // namespace app_retrieval

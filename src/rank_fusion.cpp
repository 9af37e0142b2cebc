#include "rank_fusion.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <unordered_set>

namespace app_retrieval {

double normalize_base_score(double raw) {
    if (raw <= 0.0) return 0.0;
    if (raw <= 1.0) return raw;
    return raw / (1.0 + raw);
}

double display_score(const Candidate& c) {
    if (c.hybrid_score) return *c.hybrid_score;
    if (c.score) return *c.score;
    if (c.distance) return 1.0 / (1.0 + std::max(0.0, *c.distance));
    return 0.0;
}

double lexical_overlap_score(const std::string& query, const ApplicationRecord& rec) {
    std::unordered_set<std::string> terms;
    for (auto& t : split_whitespace(to_lower_ascii(query))) terms.insert(std::move(t));
    if (terms.empty()) return 0.0;

    std::string haystack = to_lower_ascii(join({rec.company, rec.role, rec.application_method,
                                                join(rec.tags, " "), rec.context_bundle_text,
                                                rec.notes}, " "));
    size_t hit = 0;
    for (const auto& t : terms) {
        if (haystack.find(t) != std::string::npos) ++hit;
    }
    return std::min(1.0, static_cast<double>(hit) / static_cast<double>(terms.size()));
}

double bandit_prior_for(const ApplicationRecord& rec, const ThompsonModel& model) {
    double total = 0.0;
    int count = 0;
    if (const Arm* arm = model.find("method:" + rec.application_method)) {
        total += arm->mean_reward();
        ++count;
    }
    for (const auto& tag : rec.tags) {
        if (const Arm* arm = model.find("cat:" + tag)) {
            total += arm->mean_reward();
            ++count;
        }
    }
    return count == 0 ? 0.5 : total / count;
}

std::vector<Candidate> fuse(std::vector<Candidate> candidates,
                            const std::string& query,
                            const ThompsonModel& model,
                            const ScoreMap& memory_short,
                            const ScoreMap& memory_long,
                            const FusionWeights& weights) {
    auto lookup = [](const ScoreMap& m, const std::string& id) {
        auto it = m.find(id);
        return it == m.end() ? 0.0 : it->second;
    };

    for (auto& c : candidates) {
        c.base_score = normalize_base_score(display_score(c));
        c.lexical_overlap = lexical_overlap_score(query, c.record);
        c.bandit_prior = bandit_prior_for(c.record, model);
        c.memory_short = lookup(memory_short, c.id());
        c.memory_long = lookup(memory_long, c.id());
        c.final_score = weights.base * c.base_score
                      + weights.lexical * c.lexical_overlap
                      + weights.bandit * c.bandit_prior
                      + weights.memory_short * c.memory_short
                      + weights.memory_long * c.memory_long;
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.final_score > b.final_score;
    });
    return candidates;
}

} // namespace app_retrieval

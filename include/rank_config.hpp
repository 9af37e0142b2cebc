#pragma once
#include <algorithm>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "rank_fusion.hpp"

namespace app_retrieval {

struct RankConfig {
    std::string data_dir = "data";
    std::string log_dir = "logs";
    std::string index_dir = "data/index";

    int embedding_dims = 1536;
    int rrf_k = 60;
    double half_life_days = 14.0;

    int query_overfetch = 8;
    int query_min_candidates = 40;
    int retrieve_overfetch = 12;
    int retrieve_min_candidates = 60;

    FusionWeights fusion_weights;

    int port = 5002;
    std::string log_level = "info";

    // Where the config was read from; empty when running on defaults.
    std::string source_path;

    std::string applications_path() const { return data_dir + "/applications.jsonl"; }
    std::string arms_path() const { return data_dir + "/arms.json"; }
    std::string session_path() const { return data_dir + "/session.json"; }
    std::string feedback_ledger_path() const { return data_dir + "/feedback_batch_seen.json"; }
    std::string tracker_ledger_path() const { return data_dir + "/tracker_feedback_seen.json"; }
    std::string events_path() const { return log_dir + "/events.jsonl"; }
    std::string memory_short_path() const { return data_dir + "/memory_short.jsonl"; }
    std::string memory_long_path() const { return data_dir + "/memory_long.jsonl"; }

    int query_candidate_k(int k) const { return std::max(k * query_overfetch, query_min_candidates); }
    int retrieve_candidate_k(int k) const { return std::max(k * retrieve_overfetch, retrieve_min_candidates); }

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;

    nlohmann::json to_json() const;
    static RankConfig from_json(const nlohmann::json& j);
};

// Reads the first config found among `explicit_path` (when given) and the
// standard locations. Missing or unreadable files fall back to defaults.
RankConfig load_rank_config(const std::string& explicit_path = "");

} // namespace app_retrieval

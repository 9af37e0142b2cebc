#include "rank_config.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace app_retrieval {

using json = nlohmann::json;

void RankConfig::validate() const {
    if (embedding_dims <= 0) throw std::invalid_argument("embedding_dims must be positive");
    if (rrf_k < 0) throw std::invalid_argument("rrf_k must be non-negative");
    if (half_life_days <= 0.0) throw std::invalid_argument("half_life_days must be positive");
    if (query_overfetch < 1 || retrieve_overfetch < 1) {
        throw std::invalid_argument("overfetch factors must be at least 1");
    }
    if (query_min_candidates < 1 || retrieve_min_candidates < 1) {
        throw std::invalid_argument("minimum candidate counts must be at least 1");
    }
    const double weights[] = {fusion_weights.base, fusion_weights.lexical, fusion_weights.bandit,
                              fusion_weights.memory_short, fusion_weights.memory_long};
    for (double w : weights) {
        if (w < 0.0) throw std::invalid_argument("fusion weights must be non-negative");
    }
    if (std::abs(fusion_weights.sum() - 1.0) > 1e-6) {
        spdlog::warn("⚠️ Fusion weights sum to {:.4f}, final scores will not stay in [0, 1]", fusion_weights.sum());
    }
    if (port <= 0 || port > 65535) throw std::invalid_argument("port out of range");
}

json RankConfig::to_json() const {
    return json{
        {"data_dir", data_dir},
        {"log_dir", log_dir},
        {"index_dir", index_dir},
        {"embedding_dims", embedding_dims},
        {"rrf_k", rrf_k},
        {"half_life_days", half_life_days},
        {"query_overfetch", query_overfetch},
        {"query_min_candidates", query_min_candidates},
        {"retrieve_overfetch", retrieve_overfetch},
        {"retrieve_min_candidates", retrieve_min_candidates},
        {"fusion_weights", {
            {"base", fusion_weights.base},
            {"lexical", fusion_weights.lexical},
            {"bandit", fusion_weights.bandit},
            {"memory_short", fusion_weights.memory_short},
            {"memory_long", fusion_weights.memory_long}
        }},
        {"port", port},
        {"log_level", log_level}
    };
}

RankConfig RankConfig::from_json(const json& j) {
    if (!j.is_object()) throw std::invalid_argument("config root must be an object");

    RankConfig cfg;
    cfg.data_dir = j.value("data_dir", cfg.data_dir);
    cfg.log_dir = j.value("log_dir", cfg.log_dir);
    cfg.index_dir = j.value("index_dir", cfg.data_dir + "/index");
    cfg.embedding_dims = j.value("embedding_dims", cfg.embedding_dims);
    cfg.rrf_k = j.value("rrf_k", cfg.rrf_k);
    cfg.half_life_days = j.value("half_life_days", cfg.half_life_days);
    cfg.query_overfetch = j.value("query_overfetch", cfg.query_overfetch);
    cfg.query_min_candidates = j.value("query_min_candidates", cfg.query_min_candidates);
    cfg.retrieve_overfetch = j.value("retrieve_overfetch", cfg.retrieve_overfetch);
    cfg.retrieve_min_candidates = j.value("retrieve_min_candidates", cfg.retrieve_min_candidates);

    if (j.contains("fusion_weights")) {
        const auto& w = j["fusion_weights"];
        if (!w.is_object()) throw std::invalid_argument("fusion_weights must be an object");
        cfg.fusion_weights.base = w.value("base", cfg.fusion_weights.base);
        cfg.fusion_weights.lexical = w.value("lexical", cfg.fusion_weights.lexical);
        cfg.fusion_weights.bandit = w.value("bandit", cfg.fusion_weights.bandit);
        cfg.fusion_weights.memory_short = w.value("memory_short", cfg.fusion_weights.memory_short);
        cfg.fusion_weights.memory_long = w.value("memory_long", cfg.fusion_weights.memory_long);
    }

    cfg.port = j.value("port", cfg.port);
    cfg.log_level = j.value("log_level", cfg.log_level);
    cfg.validate();
    return cfg;
}

RankConfig load_rank_config(const std::string& explicit_path) {
    std::vector<std::string> search_paths;
    if (!explicit_path.empty()) search_paths.push_back(explicit_path);
    search_paths.insert(search_paths.end(), {
        "app_retrieval.json",          // 1. Current Working Directory
        "../app_retrieval.json",       // 2. Parent Directory (build/)
        "config/app_retrieval.json",   // 3. Config Directory
        "../../app_retrieval.json"     // 4. Project Root (from build/Release)
    });

    std::ifstream f;
    std::string found_path;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) {
            found_path = path;
            break;
        }
        f.clear();
    }

    if (found_path.empty()) {
        if (!explicit_path.empty()) {
            spdlog::warn("⚠️ Config {} not found, using defaults", explicit_path);
        } else {
            spdlog::info("No app_retrieval.json found, using defaults");
        }
        return RankConfig{};
    }

    try {
        auto j = json::parse(f);
        RankConfig cfg = RankConfig::from_json(j);
        cfg.source_path = found_path;
        spdlog::info("⚙️ Config loaded from {} (data_dir={}, dims={})", found_path, cfg.data_dir, cfg.embedding_dims);
        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to parse config {}: {}. Using defaults.", found_path, e.what());
        return RankConfig{};
    }
}

} // namespace app_retrieval

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "rank_config.hpp"

using namespace app_retrieval;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST(RankConfigTest, Defaults) {
    RankConfig cfg;
    EXPECT_EQ(cfg.embedding_dims, 1536);
    EXPECT_EQ(cfg.rrf_k, 60);
    EXPECT_DOUBLE_EQ(cfg.half_life_days, 14.0);
    EXPECT_EQ(cfg.port, 5002);
    EXPECT_EQ(cfg.applications_path(), "data/applications.jsonl");
    EXPECT_EQ(cfg.events_path(), "logs/events.jsonl");
    EXPECT_EQ(cfg.feedback_ledger_path(), "data/feedback_batch_seen.json");
    EXPECT_NO_THROW(cfg.validate());
}

TEST(RankConfigTest, CandidateCounts) {
    RankConfig cfg;
    EXPECT_EQ(cfg.query_candidate_k(1), 40);
    EXPECT_EQ(cfg.query_candidate_k(10), 80);
    EXPECT_EQ(cfg.retrieve_candidate_k(2), 60);
    EXPECT_EQ(cfg.retrieve_candidate_k(10), 120);
}

TEST(RankConfigTest, FromJsonOverrides) {
    json j = {
        {"data_dir", "/tmp/apps"},
        {"rrf_k", 30},
        {"half_life_days", 7.0},
        {"fusion_weights", {{"base", 0.5}, {"lexical", 0.2}}}
    };
    auto cfg = RankConfig::from_json(j);
    EXPECT_EQ(cfg.data_dir, "/tmp/apps");
    EXPECT_EQ(cfg.index_dir, "/tmp/apps/index");
    EXPECT_EQ(cfg.rrf_k, 30);
    EXPECT_DOUBLE_EQ(cfg.half_life_days, 7.0);
    EXPECT_DOUBLE_EQ(cfg.fusion_weights.base, 0.5);
    EXPECT_DOUBLE_EQ(cfg.fusion_weights.bandit, 0.20);
    EXPECT_EQ(cfg.arms_path(), "/tmp/apps/arms.json");

    auto round = RankConfig::from_json(cfg.to_json());
    EXPECT_EQ(round.rrf_k, 30);
    EXPECT_EQ(round.index_dir, "/tmp/apps/index");
}

TEST(RankConfigTest, InvalidValuesThrow) {
    EXPECT_THROW(RankConfig::from_json(json{{"embedding_dims", 0}}), std::invalid_argument);
    EXPECT_THROW(RankConfig::from_json(json{{"half_life_days", -1.0}}), std::invalid_argument);
    EXPECT_THROW(RankConfig::from_json(json{{"fusion_weights", {{"base", -0.1}}}}), std::invalid_argument);
    EXPECT_THROW(RankConfig::from_json(json{{"port", 70000}}), std::invalid_argument);
    EXPECT_THROW(RankConfig::from_json(json::array()), std::invalid_argument);
}

TEST(RankConfigTest, LoadFromExplicitPath) {
    fs::path dir = fs::path(::testing::TempDir()) / "rank_config_load";
    fs::create_directories(dir);
    fs::path file = dir / "app_retrieval.json";
    {
        std::ofstream out(file);
        out << R"({"data_dir": "custom", "port": 6001})";
    }

    auto cfg = load_rank_config(file.string());
    EXPECT_EQ(cfg.data_dir, "custom");
    EXPECT_EQ(cfg.port, 6001);
    EXPECT_EQ(cfg.source_path, file.string());
}

TEST(RankConfigTest, CorruptConfigFallsBackToDefaults) {
    fs::path dir = fs::path(::testing::TempDir()) / "rank_config_corrupt";
    fs::create_directories(dir);
    fs::path file = dir / "app_retrieval.json";
    {
        std::ofstream out(file);
        out << "{ not json";
    }

    auto cfg = load_rank_config(file.string());
    EXPECT_EQ(cfg.data_dir, "data");
    EXPECT_TRUE(cfg.source_path.empty());
}

#include <gtest/gtest.h>
#include "rank_fusion.hpp"

using namespace app_retrieval;

namespace {

Candidate candidate(const std::string& id) {
    Candidate c;
    c.record.app_id = id;
    return c;
}

} // namespace

// ─── Base score ───────────────────────────────────────────────

TEST(RankFusionTest, NormalizeBaseScore) {
    EXPECT_DOUBLE_EQ(normalize_base_score(-3.0), 0.0);
    EXPECT_DOUBLE_EQ(normalize_base_score(0.0), 0.0);
    EXPECT_DOUBLE_EQ(normalize_base_score(0.42), 0.42);
    EXPECT_DOUBLE_EQ(normalize_base_score(1.0), 1.0);
    EXPECT_DOUBLE_EQ(normalize_base_score(3.0), 0.75);
}

TEST(RankFusionTest, DisplayScorePrecedence) {
    Candidate c = candidate("a");
    EXPECT_DOUBLE_EQ(display_score(c), 0.0);

    c.distance = 1.0;
    EXPECT_DOUBLE_EQ(display_score(c), 0.5);
    c.distance = -2.0;
    EXPECT_DOUBLE_EQ(display_score(c), 1.0);

    c.score = 0.3;
    EXPECT_DOUBLE_EQ(display_score(c), 0.3);

    c.hybrid_score = 0.03;
    EXPECT_DOUBLE_EQ(display_score(c), 0.03);
}

// ─── Lexical overlap ──────────────────────────────────────────

TEST(RankFusionTest, LexicalOverlapCountsDistinctTerms) {
    ApplicationRecord rec;
    rec.company = "DeepMind";
    rec.role = "Senior ML Engineer";
    rec.tags = {"ai"};

    EXPECT_DOUBLE_EQ(lexical_overlap_score("senior ml engineer", rec), 1.0);
    EXPECT_DOUBLE_EQ(lexical_overlap_score("senior senior sales", rec), 0.5);
    EXPECT_DOUBLE_EQ(lexical_overlap_score("", rec), 0.0);
    // substring match
    EXPECT_DOUBLE_EQ(lexical_overlap_score("mind", rec), 1.0);
}

TEST(RankFusionTest, LexicalOverlapIgnoresRagText) {
    ApplicationRecord rec;
    rec.rag_text = "kubernetes";
    EXPECT_DOUBLE_EQ(lexical_overlap_score("kubernetes", rec), 0.0);
    rec.context_bundle_text = "tags=kubernetes";
    EXPECT_DOUBLE_EQ(lexical_overlap_score("kubernetes", rec), 1.0);
}

// ─── Bandit prior ─────────────────────────────────────────────

TEST(RankFusionTest, BanditPriorDefaultsToHalf) {
    ApplicationRecord rec;
    rec.tags = {"ai"};
    rec.application_method = "ashby";
    EXPECT_DOUBLE_EQ(bandit_prior_for(rec, ThompsonModel()), 0.5);
}

TEST(RankFusionTest, BanditPriorAveragesExistingArms) {
    ThompsonModel model;
    model.record_reward({"cat:ai"}, 1.0);        // mean 2/3
    model.record_reward({"method:ashby"}, 0.0);  // mean 1/3

    ApplicationRecord rec;
    rec.tags = {"ai", "unknown"};
    rec.application_method = "ashby";
    EXPECT_NEAR(bandit_prior_for(rec, model), 0.5, 1e-12);

    rec.application_method = "lever";
    EXPECT_NEAR(bandit_prior_for(rec, model), 2.0 / 3.0, 1e-12);
}

// ─── Fusion ───────────────────────────────────────────────────

TEST(RankFusionTest, DefaultWeightsSumToOne) {
    FusionWeights w;
    EXPECT_NEAR(w.sum(), 1.0, 1e-12);
}

TEST(RankFusionTest, AllOnesSignalsGiveOne) {
    ThompsonModel model;
    for (int i = 0; i < 5000; ++i) model.record_reward({"cat:ai"}, 1.0);

    Candidate c = candidate("a");
    c.record.role = "ml";
    c.record.tags = {"ai"};
    c.record.application_method = "unseen";
    c.hybrid_score = 1.0;

    auto fused = fuse({c}, "ml", model, {{"a", 1.0}}, {{"a", 1.0}});
    ASSERT_EQ(fused.size(), 1u);
    EXPECT_NEAR(fused[0].base_score, 1.0, 1e-12);
    EXPECT_NEAR(fused[0].lexical_overlap, 1.0, 1e-12);
    EXPECT_NEAR(fused[0].final_score, 1.0, 1e-3);
}

TEST(RankFusionTest, FinalScoreIsWeightedSum) {
    Candidate c = candidate("a");
    c.score = 0.6;
    auto fused = fuse({c}, "nothing", ThompsonModel(), {{"a", 0.5}}, {});
    EXPECT_NEAR(fused[0].final_score, 0.48 * 0.6 + 0.20 * 0.5 + 0.06 * 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(fused[0].memory_long, 0.0);
}

TEST(RankFusionTest, SortsDescendingAndStable) {
    Candidate a = candidate("a");
    a.score = 0.2;
    Candidate b = candidate("b");
    b.score = 0.9;
    Candidate c = candidate("c");
    c.score = 0.2;

    auto fused = fuse({a, b, c}, "q", ThompsonModel(), {}, {});
    ASSERT_EQ(fused.size(), 3u);
    EXPECT_EQ(fused[0].id(), "b");
    EXPECT_EQ(fused[1].id(), "a");
    EXPECT_EQ(fused[2].id(), "c");
}

TEST(RankFusionTest, CustomWeights) {
    FusionWeights w;
    w.base = 0.0;
    w.lexical = 1.0;
    w.bandit = 0.0;
    w.memory_short = 0.0;
    w.memory_long = 0.0;

    Candidate hit = candidate("hit");
    hit.record.company = "Acme";
    Candidate miss = candidate("miss");
    miss.score = 1.0;

    auto fused = fuse({miss, hit}, "acme", ThompsonModel(), {}, {}, w);
    EXPECT_EQ(fused[0].id(), "hit");
    EXPECT_DOUBLE_EQ(fused[0].final_score, 1.0);
    EXPECT_DOUBLE_EQ(fused[1].final_score, 0.0);
}

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include "bandit_model.hpp"

using namespace app_retrieval;
namespace fs = std::filesystem;

class BanditModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::path(::testing::TempDir()) /
               ("bandit_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    std::string arms_path() const { return (dir_ / "arms.json").string(); }

    fs::path dir_;
};

// ─── Outcomes ─────────────────────────────────────────────────

TEST(OutcomeTest, RewardTable) {
    EXPECT_DOUBLE_EQ(reward_for(Outcome::Blocked), 0.0);
    EXPECT_DOUBLE_EQ(reward_for(Outcome::NoResponse), 0.05);
    EXPECT_DOUBLE_EQ(reward_for(Outcome::Rejected), 0.2);
    EXPECT_DOUBLE_EQ(reward_for(Outcome::Response), 0.5);
    EXPECT_DOUBLE_EQ(reward_for(Outcome::Interview), 0.8);
    EXPECT_DOUBLE_EQ(reward_for(Outcome::Offer), 1.0);
}

TEST(OutcomeTest, ParseRoundTripsNames) {
    EXPECT_EQ(parse_outcome("interview"), Outcome::Interview);
    EXPECT_EQ(std::string(to_string(Outcome::NoResponse)), "no_response");
    EXPECT_FALSE(parse_outcome("ghosted").has_value());
    EXPECT_FALSE(parse_outcome("Offer").has_value());
}

TEST(OutcomeTest, BootstrapStatusMap) {
    EXPECT_EQ(bootstrap_outcome_for_status("Applied"), Outcome::NoResponse);
    EXPECT_EQ(bootstrap_outcome_for_status("Blocked"), Outcome::Blocked);
    EXPECT_EQ(bootstrap_outcome_for_status("Rejected"), Outcome::Rejected);
    EXPECT_EQ(bootstrap_outcome_for_status("Offer"), Outcome::Offer);
    EXPECT_FALSE(bootstrap_outcome_for_status("Draft").has_value());
    EXPECT_FALSE(bootstrap_outcome_for_status("Closed").has_value());
    EXPECT_FALSE(bootstrap_outcome_for_status("Interviewing").has_value());
}

// ─── Arm ──────────────────────────────────────────────────────

TEST(ArmTest, UpdateAccumulates) {
    Arm arm;
    arm.name = "cat:ai";
    arm.update(0.8);
    EXPECT_DOUBLE_EQ(arm.alpha, 1.8);
    EXPECT_NEAR(arm.beta, 1.2, 1e-12);
    EXPECT_EQ(arm.pulls, 1);
    EXPECT_DOUBLE_EQ(arm.total_reward, 0.8);
}

TEST(ArmTest, RewardIsClamped) {
    Arm arm;
    arm.update(3.0);
    arm.update(-2.0);
    EXPECT_DOUBLE_EQ(arm.alpha, 2.0);
    EXPECT_DOUBLE_EQ(arm.beta, 2.0);
    EXPECT_DOUBLE_EQ(arm.total_reward, 1.0);
}

TEST(ArmTest, FreshArmMeanIsHalf) {
    Arm arm;
    EXPECT_DOUBLE_EQ(arm.mean_reward(), 0.5);
    EXPECT_DOUBLE_EQ(arm.confidence(), 1.0);
}

TEST(ArmTest, SampleStaysInUnitInterval) {
    std::mt19937 rng(7);
    Arm skewed;
    skewed.alpha = 2.0;
    skewed.beta = 5.0;
    for (int i = 0; i < 1000; ++i) {
        double s = skewed.sample(rng);
        EXPECT_GE(s, 0.0);
        EXPECT_LE(s, 1.0);
    }
}

TEST(ArmTest, ConvergesAfterManyOffers) {
    Arm arm;
    for (int i = 0; i < 100; ++i) arm.update(reward_for(Outcome::Offer));
    EXPECT_GT(arm.mean_reward(), 0.95);
}

// ─── ThompsonModel ────────────────────────────────────────────

TEST_F(BanditModelTest, RecordOutcomeTouchesTagAndMethodArms) {
    ThompsonModel model;
    auto touched = model.record_outcome({"ai", "remote"}, "ashby", Outcome::Response);
    EXPECT_EQ(touched, (std::vector<std::string>{"cat:ai", "cat:remote", "method:ashby"}));
    ASSERT_NE(model.find("cat:ai"), nullptr);
    EXPECT_EQ(model.find("cat:ai")->pulls, 1);
    EXPECT_EQ(model.find("cat:mobile"), nullptr);
}

TEST_F(BanditModelTest, PersistsAcrossLoads) {
    ThompsonModel model;
    model.record_outcome({"ai"}, "lever", Outcome::Interview);
    model.save(arms_path());

    auto reloaded = ThompsonModel::load(arms_path());
    ASSERT_EQ(reloaded.size(), 2u);
    EXPECT_EQ(reloaded.arms()[0].name, "cat:ai");
    EXPECT_EQ(reloaded.find("cat:ai")->pulls, 1);
    EXPECT_DOUBLE_EQ(reloaded.find("method:lever")->alpha, 1.8);
    EXPECT_FALSE(fs::exists(arms_path() + ".tmp"));
}

TEST_F(BanditModelTest, SavedFileIsFlatMapOfArms) {
    ThompsonModel model;
    model.record_outcome({}, "direct", Outcome::Offer);
    model.save(arms_path());

    std::ifstream in(arms_path());
    auto j = nlohmann::json::parse(in);
    ASSERT_TRUE(j.contains("method:direct"));
    const auto& arm = j["method:direct"];
    EXPECT_EQ(arm["name"], "method:direct");
    EXPECT_DOUBLE_EQ(arm["alpha"].get<double>(), 2.0);
    EXPECT_DOUBLE_EQ(arm["beta"].get<double>(), 1.0);
    EXPECT_EQ(arm["pulls"].get<int>(), 1);
    EXPECT_DOUBLE_EQ(arm["total_reward"].get<double>(), 1.0);
}

TEST_F(BanditModelTest, CorruptFileMeansNoHistory) {
    {
        std::ofstream out(arms_path());
        out << "{not json";
    }
    auto model = ThompsonModel::load(arms_path());
    EXPECT_TRUE(model.empty());

    {
        std::ofstream out(arms_path());
        out << R"(["cat:ai"])";
    }
    EXPECT_TRUE(ThompsonModel::load(arms_path()).empty());
}

TEST_F(BanditModelTest, ArmsBelowPriorAreCorrupt) {
    const char* bad_arms[] = {
        R"({"cat:ai": {"name": "cat:ai", "alpha": 0.5, "beta": 1.0, "pulls": 0, "total_reward": 0.0}})",
        R"({"cat:ai": {"name": "cat:ai", "alpha": 1.0, "beta": 0.9, "pulls": 0, "total_reward": 0.0}})",
        R"({"cat:ai": {"name": "cat:ai", "alpha": 2.0, "beta": 1.0, "pulls": -1, "total_reward": 1.0}})",
        R"({"cat:ai": {"name": "cat:ai", "alpha": 2.0, "beta": 1.0, "pulls": 1, "total_reward": -1.0}})",
    };
    for (const char* content : bad_arms) {
        {
            std::ofstream out(arms_path());
            out << content;
        }
        EXPECT_TRUE(ThompsonModel::load(arms_path()).empty()) << content;
    }

    {
        std::ofstream out(arms_path());
        out << R"({"cat:ai": {"name": "cat:ai", "alpha": 1.0, "beta": 1.0, "pulls": 0, "total_reward": 0.0}})";
    }
    EXPECT_EQ(ThompsonModel::load(arms_path()).size(), 1u);
}

TEST_F(BanditModelTest, MissingFileMeansNoHistory) {
    EXPECT_TRUE(ThompsonModel::load(arms_path()).empty());
}

TEST_F(BanditModelTest, RecommendReturnsTopKSortedBySample) {
    ThompsonModel model;
    for (int i = 0; i < 50; ++i) model.record_outcome({"winner"}, "ashby", Outcome::Offer);
    for (int i = 0; i < 50; ++i) model.record_outcome({"loser"}, "workday", Outcome::Blocked);

    std::mt19937 rng(42);
    auto top = model.recommend(2, rng);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_GE(top[0].sample, top[1].sample);
    std::set<std::string> names = {top[0].name, top[1].name};
    EXPECT_EQ(names, (std::set<std::string>{"cat:winner", "method:ashby"}));

    EXPECT_EQ(model.recommend(10, rng).size(), 4u);
    EXPECT_TRUE(ThompsonModel().recommend(3, rng).empty());
}

TEST_F(BanditModelTest, StatsSortedByMean) {
    ThompsonModel model;
    model.record_outcome({"low"}, "m1", Outcome::Blocked);
    model.record_outcome({"high"}, "m2", Outcome::Offer);

    auto rows = model.stats();
    ASSERT_EQ(rows.size(), 4u);
    for (size_t i = 1; i < rows.size(); ++i) {
        EXPECT_GE(rows[i - 1].mean_reward, rows[i].mean_reward);
    }
    EXPECT_TRUE(rows.front().name == "cat:high" || rows.front().name == "method:m2");

    auto j = rows.front().to_json();
    EXPECT_DOUBLE_EQ(j["mean_reward"].get<double>(), 0.667);
    // One pull: sqrt(2 ln 2 / 2)
    EXPECT_DOUBLE_EQ(j["confidence"].get<double>(), 0.833);
}

TEST_F(BanditModelTest, BootstrapReplaysStatuses) {
    ApplicationRecord applied;
    applied.status = "Applied";
    applied.tags = {"ai", "infra"};
    applied.application_method = "ashby";
    ApplicationRecord draft;
    draft.status = "Draft";
    draft.tags = {"mobile"};
    ApplicationRecord offer;
    offer.status = "Offer";
    offer.tags = {"ai"};
    offer.application_method = "direct";

    ThompsonModel model;
    EXPECT_EQ(model.bootstrap_from_records({applied, draft, offer}), 2);
    EXPECT_NE(model.find("cat:ai"), nullptr);
    EXPECT_NE(model.find("cat:infra"), nullptr);
    EXPECT_EQ(model.find("cat:mobile"), nullptr);
    EXPECT_EQ(model.find("cat:ai")->pulls, 2);
    EXPECT_NEAR(model.find("cat:ai")->total_reward, 1.05, 1e-12);
}

TEST_F(BanditModelTest, ApplyDeltasCreatesMissingArms) {
    ThompsonModel model;
    ArmDelta d;
    d.add(0.5);
    d.add(0.8);
    model.apply_deltas({{"cat:new", d}});
    const Arm* arm = model.find("cat:new");
    ASSERT_NE(arm, nullptr);
    EXPECT_EQ(arm->pulls, 2);
    EXPECT_DOUBLE_EQ(arm->alpha, 2.3);
    EXPECT_NEAR(arm->beta, 1.7, 1e-12);
}

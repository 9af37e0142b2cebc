#pragma once
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "application_record.hpp"

namespace app_retrieval {

enum class Outcome { Blocked, NoResponse, Rejected, Response, Interview, Offer };

std::optional<Outcome> parse_outcome(const std::string& s);
const char* to_string(Outcome outcome);

// Reward in [0, 1] fed to the Beta update.
double reward_for(Outcome outcome);

// Implicit outcome of a tracker status when seeding the model.
std::optional<Outcome> bootstrap_outcome_for_status(const std::string& status);

// Comma separated list of valid outcome names, for error messages.
std::string valid_outcomes_list();

struct Arm {
    std::string name;
    double alpha = 1.0;
    double beta = 1.0;
    int pulls = 0;
    double total_reward = 0.0;

    double mean_reward() const { return alpha / (alpha + beta); }

    // UCB-style bonus, shrinks with pulls.
    double confidence() const;

    // One Beta(alpha, beta) draw via two gamma samples.
    double sample(std::mt19937& rng) const;

    void update(double reward);

    nlohmann::ordered_json to_json() const;
    static Arm from_json(const std::string& name, const nlohmann::ordered_json& j);
};

struct ArmStats {
    std::string name;
    double mean_reward;
    int pulls;
    double alpha;
    double beta;
    double total_reward;
    double confidence;

    nlohmann::json to_json() const;
};

struct ArmSample {
    std::string name;
    double sample;
};

// Accumulated increments for one arm, applied in a single save.
struct ArmDelta {
    double alpha = 0.0;
    double beta = 0.0;
    int pulls = 0;
    double total_reward = 0.0;

    void add(double reward);
};

// Thompson Sampling over "cat:<tag>" and "method:<channel>" arms. A value
// object: load, mutate, then save explicitly.
class ThompsonModel {
public:
    ThompsonModel() = default;

    // Missing or corrupt files yield an empty model.
    static ThompsonModel load(const std::string& path);
    void save(const std::string& path) const;

    static std::vector<std::string> arm_names_for(const std::vector<std::string>& tags,
                                                  const std::string& method);

    // Returns the touched arm names.
    std::vector<std::string> record_outcome(const std::vector<std::string>& tags,
                                            const std::string& method,
                                            Outcome outcome);
    void record_reward(const std::vector<std::string>& arm_names, double reward);

    void apply_deltas(const std::vector<std::pair<std::string, ArmDelta>>& deltas);

    std::vector<ArmSample> recommend(int k, std::mt19937& rng) const;
    std::vector<ArmStats> stats() const;

    // Replays tracker statuses as outcomes. Returns the number of records used.
    int bootstrap_from_records(const std::vector<ApplicationRecord>& records);

    const Arm* find(const std::string& name) const;
    const std::vector<Arm>& arms() const { return arms_; }
    bool empty() const { return arms_.empty(); }
    size_t size() const { return arms_.size(); }

private:
    Arm& get_or_create(const std::string& name);

    std::vector<Arm> arms_; // insertion order
    std::unordered_map<std::string, size_t> index_;
};

} // namespace app_retrieval

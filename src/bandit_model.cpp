#include "bandit_model.hpp"
#include "atomic_file.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace app_retrieval {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

struct OutcomeInfo {
    Outcome outcome;
    const char* name;
    double reward;
};

const OutcomeInfo kOutcomes[] = {
    {Outcome::Blocked, "blocked", 0.0},
    {Outcome::NoResponse, "no_response", 0.05},
    {Outcome::Rejected, "rejected", 0.2},
    {Outcome::Response, "response", 0.5},
    {Outcome::Interview, "interview", 0.8},
    {Outcome::Offer, "offer", 1.0},
};

double round_to(double v, int places) {
    double scale = std::pow(10.0, places);
    return std::round(v * scale) / scale;
}

} // namespace

std::optional<Outcome> parse_outcome(const std::string& s) {
    for (const auto& info : kOutcomes) {
        if (s == info.name) return info.outcome;
    }
    return std::nullopt;
}

const char* to_string(Outcome outcome) {
    for (const auto& info : kOutcomes) {
        if (info.outcome == outcome) return info.name;
    }
    return "unknown";
}

double reward_for(Outcome outcome) {
    for (const auto& info : kOutcomes) {
        if (info.outcome == outcome) return info.reward;
    }
    return 0.0;
}

std::optional<Outcome> bootstrap_outcome_for_status(const std::string& status) {
    if (status == "Applied") return Outcome::NoResponse;
    if (status == "Blocked") return Outcome::Blocked;
    if (status == "Rejected") return Outcome::Rejected;
    if (status == "Offer") return Outcome::Offer;
    return std::nullopt;
}

std::string valid_outcomes_list() {
    std::vector<std::string> names;
    for (const auto& info : kOutcomes) names.push_back(info.name);
    std::sort(names.begin(), names.end());
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ", ";
        out += names[i];
    }
    return out;
}

// --- Arm ---

double Arm::confidence() const {
    if (pulls == 0) return 1.0;
    double n = pulls + 1.0;
    return std::sqrt(2.0 * std::log(std::max(1.0, n)) / n);
}

double Arm::sample(std::mt19937& rng) const {
    std::gamma_distribution<double> gamma_a(alpha, 1.0);
    std::gamma_distribution<double> gamma_b(beta, 1.0);
    double x = gamma_a(rng);
    double y = gamma_b(rng);
    if (x + y <= 0.0) return mean_reward();
    return x / (x + y);
}

void Arm::update(double reward) {
    reward = std::clamp(reward, 0.0, 1.0);
    alpha += reward;
    beta += 1.0 - reward;
    pulls += 1;
    total_reward += reward;
}

ordered_json Arm::to_json() const {
    return ordered_json{
        {"name", name},
        {"alpha", alpha},
        {"beta", beta},
        {"pulls", pulls},
        {"total_reward", total_reward}
    };
}

Arm Arm::from_json(const std::string& name, const ordered_json& j) {
    if (!j.is_object()) throw std::invalid_argument("arm '" + name + "' is not an object");
    Arm arm;
    arm.name = j.value("name", name);
    arm.alpha = j.value("alpha", 1.0);
    arm.beta = j.value("beta", 1.0);
    arm.pulls = j.value("pulls", 0);
    arm.total_reward = j.value("total_reward", 0.0);
    // Arms start at Beta(1, 1) and only grow
    if (!(arm.alpha >= 1.0) || !(arm.beta >= 1.0)) {
        throw std::invalid_argument("arm '" + name + "' has alpha or beta below 1");
    }
    if (arm.pulls < 0 || !(arm.total_reward >= 0.0)) {
        throw std::invalid_argument("arm '" + name + "' has negative counters");
    }
    return arm;
}

json ArmStats::to_json() const {
    return json{
        {"arm", name},
        {"pulls", pulls},
        {"mean_reward", round_to(mean_reward, 3)},
        {"alpha", round_to(alpha, 2)},
        {"beta", round_to(beta, 2)},
        {"total_reward", round_to(total_reward, 2)},
        {"confidence", round_to(confidence, 3)}
    };
}

void ArmDelta::add(double reward) {
    reward = std::clamp(reward, 0.0, 1.0);
    alpha += reward;
    beta += 1.0 - reward;
    pulls += 1;
    total_reward += reward;
}

// --- ThompsonModel ---

ThompsonModel ThompsonModel::load(const std::string& path) {
    ThompsonModel model;
    auto content = AtomicFile::read(path);
    if (!content) return model;

    try {
        auto data = ordered_json::parse(*content);
        if (!data.is_object()) throw std::invalid_argument("arm map is not an object");
        ThompsonModel parsed;
        for (const auto& [name, value] : data.items()) {
            Arm arm = Arm::from_json(name, value);
            parsed.index_[name] = parsed.arms_.size();
            arm.name = name;
            parsed.arms_.push_back(std::move(arm));
        }
        return parsed;
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Arm state at {} is unreadable ({}), starting with no history", path, e.what());
        return model;
    }
}

void ThompsonModel::save(const std::string& path) const {
    ordered_json data = ordered_json::object();
    for (const auto& arm : arms_) {
        data[arm.name] = arm.to_json();
    }
    AtomicFile::write(path, data.dump(2));
    spdlog::debug("Saved {} arms to {}", arms_.size(), path);
}

Arm& ThompsonModel::get_or_create(const std::string& name) {
    auto it = index_.find(name);
    if (it != index_.end()) return arms_[it->second];
    index_[name] = arms_.size();
    Arm arm;
    arm.name = name;
    arms_.push_back(std::move(arm));
    return arms_.back();
}

const Arm* ThompsonModel::find(const std::string& name) const {
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : &arms_[it->second];
}

std::vector<std::string> ThompsonModel::arm_names_for(const std::vector<std::string>& tags,
                                                      const std::string& method) {
    std::vector<std::string> names;
    names.reserve(tags.size() + 1);
    for (const auto& tag : tags) names.push_back("cat:" + tag);
    names.push_back("method:" + method);
    return names;
}

std::vector<std::string> ThompsonModel::record_outcome(const std::vector<std::string>& tags,
                                                       const std::string& method,
                                                       Outcome outcome) {
    auto names = arm_names_for(tags, method);
    record_reward(names, reward_for(outcome));
    return names;
}

void ThompsonModel::record_reward(const std::vector<std::string>& arm_names, double reward) {
    for (const auto& name : arm_names) {
        get_or_create(name).update(reward);
    }
}

void ThompsonModel::apply_deltas(const std::vector<std::pair<std::string, ArmDelta>>& deltas) {
    for (const auto& [name, d] : deltas) {
        Arm& arm = get_or_create(name);
        arm.alpha += d.alpha;
        arm.beta += d.beta;
        arm.pulls += d.pulls;
        arm.total_reward += d.total_reward;
    }
}

std::vector<ArmSample> ThompsonModel::recommend(int k, std::mt19937& rng) const {
    if (arms_.empty() || k <= 0) return {};
    std::vector<ArmSample> sampled;
    sampled.reserve(arms_.size());
    for (const auto& arm : arms_) {
        sampled.push_back({arm.name, arm.sample(rng)});
    }
    std::stable_sort(sampled.begin(), sampled.end(), [](const ArmSample& a, const ArmSample& b) {
        return a.sample > b.sample;
    });
    if (sampled.size() > static_cast<size_t>(k)) sampled.resize(k);
    return sampled;
}

std::vector<ArmStats> ThompsonModel::stats() const {
    std::vector<ArmStats> rows;
    rows.reserve(arms_.size());
    for (const auto& arm : arms_) {
        rows.push_back({arm.name, arm.mean_reward(), arm.pulls, arm.alpha, arm.beta, arm.total_reward,
                        arm.confidence()});
    }
    std::stable_sort(rows.begin(), rows.end(), [](const ArmStats& a, const ArmStats& b) {
        return a.mean_reward > b.mean_reward;
    });
    return rows;
}

int ThompsonModel::bootstrap_from_records(const std::vector<ApplicationRecord>& records) {
    int used = 0;
    for (const auto& rec : records) {
        auto outcome = bootstrap_outcome_for_status(rec.status);
        if (!outcome) continue;
        record_outcome(rec.tags, rec.application_method, *outcome);
        ++used;
    }
    spdlog::info("🎰 Bandit bootstrapped from {} of {} records ({} arms)", used, records.size(), arms_.size());
    return used;
}

} // namespace app_retrieval

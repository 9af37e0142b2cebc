#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "application_record.hpp"
#include "text_utils.hpp"

namespace app_retrieval {

constexpr double kDefaultHalfLifeDays = 14.0;
constexpr double kDefaultScoreHint = 0.35;
constexpr double kDefaultPriority = 0.4;

using ScoreMap = std::unordered_map<std::string, double>;

// Append-only event memory. An empty app_id is stored as null.
struct EpisodicEntry {
    std::string ts;
    std::string app_id;
    std::string event_type;
    std::optional<std::string> outcome;
    double score_hint = kDefaultScoreHint;
    std::string text;

    nlohmann::json to_json() const;
    static EpisodicEntry from_json(const nlohmann::json& j);
};

// Per-application snapshot, rewritten on every build.
struct SemanticEntry {
    std::string ts;
    std::string app_id;
    std::string company;
    std::string role;
    std::string status;
    std::string application_method;
    std::vector<std::string> tags;
    double priority = kDefaultPriority;
    std::string summary;

    nlohmann::json to_json() const;
    static SemanticEntry from_json(const nlohmann::json& j);
};

double score_hint_for_outcome(const std::optional<std::string>& outcome);
double priority_for_status(const std::string& status);

EpisodicEntry build_short_memory_entry(const std::string& app_id,
                                       const std::string& event_type,
                                       const std::string& msg,
                                       const std::string& ts,
                                       const std::optional<std::string>& outcome = std::nullopt);

SemanticEntry build_long_memory_entry(const ApplicationRecord& rec, const std::string& ts);

// Missing file reads as empty. Blank, malformed and non-object lines are skipped.
std::vector<nlohmann::json> load_jsonl(const std::string& path);
void append_jsonl(const std::string& path, const nlohmann::json& row);

// exp(-ln2 * age / half_life) * score_hint, clamped to [0, 1], max per app.
// Entries whose timestamp does not parse are ignored.
ScoreMap recency_scores(const std::vector<EpisodicEntry>& entries,
                        TimePoint now,
                        double half_life_days = kDefaultHalfLifeDays);

// priority clamped to [0, 1], max per app.
ScoreMap priority_scores(const std::vector<SemanticEntry>& entries);

class MemoryStore {
public:
    MemoryStore(std::string short_path, std::string long_path)
        : short_path_(std::move(short_path)), long_path_(std::move(long_path)) {}

    std::vector<EpisodicEntry> load_episodic() const;
    std::vector<SemanticEntry> load_semantic() const;

    // Raw episodic rows, for replaying outcomes.
    std::vector<nlohmann::json> load_episodic_rows() const;

    void append(const EpisodicEntry& entry) const;
    void ensure_episodic() const;

    // Replaces the semantic snapshot with one entry per record.
    void rebuild_semantic(const std::vector<ApplicationRecord>& records, const std::string& ts) const;

    const std::string& short_path() const { return short_path_; }
    const std::string& long_path() const { return long_path_; }

private:
    std::string short_path_;
    std::string long_path_;
};

} // namespace app_retrieval

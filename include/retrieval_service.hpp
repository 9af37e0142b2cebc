#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "bandit_model.hpp"
#include "contracts.hpp"
#include "embedder.hpp"
#include "event_journal.hpp"
#include "hybrid_retriever.hpp"
#include "memory/memory_store.hpp"
#include "rank_config.hpp"
#include "search_index.hpp"

namespace app_retrieval {

struct BuildReport {
    size_t rows = 0;
    size_t records = 0;
    size_t duplicates = 0;
    size_t errors = 0;
    bool bootstrapped = false;
    size_t arms = 0;

    nlohmann::json to_json() const;
};

struct FeedbackReport {
    std::string app_id;
    std::string company;
    std::string role;
    Outcome outcome = Outcome::NoResponse;
    std::vector<std::string> arms;

    nlohmann::json to_json() const;
};

struct BatchReport {
    std::string source;
    size_t processed = 0;
    size_t skipped = 0;
    size_t arms_touched = 0;
    size_t new_seen = 0;

    nlohmann::json to_json() const;
};

struct SyncReport {
    size_t processed = 0;
    size_t skipped = 0;

    nlohmann::json to_json() const;
};

struct StatusEntry {
    std::string app_id;
    std::string company;
    std::string role;
    std::string method;
    std::vector<std::string> tags;
};

// Per-status counts (canonical statuses first, then the rest by name) and
// the applications still waiting as Draft or stuck as Blocked.
struct StatusReport {
    std::vector<std::pair<std::string, size_t>> counts;
    std::vector<StatusEntry> drafts;
    std::vector<StatusEntry> blocked;
    size_t total = 0;

    nlohmann::json to_json() const;
};

struct ArmRecommendation {
    std::string name;
    double sample;
    double mean_reward;
    int pulls;
    double alpha;
    double beta;

    nlohmann::json to_json() const;
};

// Thumb vote -> outcome; throws ContractError for unknown votes.
Outcome outcome_from_thumb(const std::string& vote);

// Explicit outcome in a tracker row, read from Status, Response, Interview
// Stage and Response Type. nullopt when the row says nothing conclusive.
std::optional<Outcome> infer_tracker_outcome(const nlohmann::json& row);

// Outcome carried by an event or episodic row: the "outcome" field, or an
// "outcome=<name>" token in the message of an "outcome" event.
std::optional<Outcome> parse_outcome_from_row(const nlohmann::json& row);

// Command layer over the index, the bandit arms and the memory logs. Persisted
// state is loaded at the start of each command and written at its end.
class RetrievalService {
public:
    using IndexFactory = std::function<std::shared_ptr<SearchIndex>(int dims)>;

    explicit RetrievalService(RankConfig config, IndexFactory factory = {});

    // Rebuilds records, memory, bandit seed and index from tracker rows
    // (a JSON array of objects keyed by tracker column names).
    BuildReport build(const nlohmann::json& tracker_rows);

    std::vector<Candidate> query(const std::string& q, int k, RetrievalTrace* trace = nullptr);
    std::vector<RetrieveItem> retrieve(const RetrieveRequest& request, RetrievalTrace* trace = nullptr);

    FeedbackReport feedback(const std::string& app_id, const std::string& outcome);
    FeedbackReport thumb_feedback(const std::optional<std::string>& app_id, const std::string& vote);

    // source: "memory_short" (default) or "events".
    BatchReport feedback_batch(const std::string& source = "memory_short");

    // Feeds explicit tracker outcomes into the arms. Rows already synced with
    // the same outcome and response columns are skipped.
    SyncReport sync_tracker_feedback(const nlohmann::json& tracker_rows);

    StatusReport status() const;

    std::vector<ArmRecommendation> recommend(int k);
    std::vector<ArmStats> stats() const;

    nlohmann::json log_event(const std::string& app_id, const std::string& event_type, const std::string& msg);
    nlohmann::json recent_events(size_t limit = 50) const;

    const RankConfig& config() const { return config_; }
    void seed(unsigned int value) { rng_.seed(value); }

private:
    std::shared_ptr<SearchIndex> index();
    std::vector<Candidate> rank(std::vector<Candidate> candidates, const std::string& q) const;

    std::vector<ApplicationRecord> load_records() const;
    std::unordered_map<std::string, ApplicationRecord> load_app_lookup() const;
    void write_records(const std::vector<ApplicationRecord>& records) const;

    nlohmann::json load_session_state() const;
    void remember_recent_results(const std::string& source, const std::string& q,
                                 const std::vector<std::string>& app_ids) const;
    std::string resolve_thumb_app_id(const std::optional<std::string>& app_id) const;
    std::optional<std::string> latest_app_id() const;

    RankConfig config_;
    HashingEmbedder embedder_;
    IndexFactory factory_;
    std::shared_ptr<SearchIndex> index_;
    MemoryStore memory_;
    EventJournal journal_;
    std::mt19937 rng_;
};

} // namespace app_retrieval

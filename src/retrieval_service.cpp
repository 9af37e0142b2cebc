#include "retrieval_service.hpp"
#include "application_index.hpp"
#include "atomic_file.hpp"
#include "rank_fusion.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <set>
#include <stdexcept>
#include <tuple>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace app_retrieval {

using json = nlohmann::json;

json BuildReport::to_json() const {
    return json{
        {"rows", rows},
        {"records", records},
        {"duplicates", duplicates},
        {"errors", errors},
        {"bootstrapped", bootstrapped},
        {"arms", arms}
    };
}

json FeedbackReport::to_json() const {
    return json{
        {"app_id", app_id},
        {"company", company},
        {"role", role},
        {"outcome", to_string(outcome)},
        {"reward", reward_for(outcome)},
        {"arms", arms}
    };
}

json BatchReport::to_json() const {
    return json{
        {"source", source},
        {"processed", processed},
        {"skipped", skipped},
        {"arms_touched", arms_touched},
        {"new_seen", new_seen}
    };
}

json SyncReport::to_json() const {
    return json{
        {"processed", processed},
        {"skipped", skipped}
    };
}

static json entry_to_json(const StatusEntry& e) {
    return json{
        {"app_id", e.app_id},
        {"company", e.company},
        {"role", e.role},
        {"method", e.method},
        {"tags", e.tags}
    };
}

json StatusReport::to_json() const {
    json j_counts = json::array();
    for (const auto& [status, n] : counts) {
        j_counts.push_back({{"status", status}, {"count", n}});
    }
    json j_drafts = json::array();
    for (const auto& e : drafts) j_drafts.push_back(entry_to_json(e));
    json j_blocked = json::array();
    for (const auto& e : blocked) j_blocked.push_back(entry_to_json(e));
    return json{
        {"counts", j_counts},
        {"drafts", j_drafts},
        {"blocked", j_blocked},
        {"total", total}
    };
}

json ArmRecommendation::to_json() const {
    return json{
        {"arm", name},
        {"sample", sample},
        {"mean_reward", mean_reward},
        {"pulls", pulls},
        {"alpha", alpha},
        {"beta", beta}
    };
}

Outcome outcome_from_thumb(const std::string& vote) {
    static const std::unordered_map<std::string, Outcome> mapping = {
        {"up", Outcome::Response},
        {"thumbs_up", Outcome::Response},
        {"+1", Outcome::Response},
        {"\xF0\x9F\x91\x8D", Outcome::Response},    // thumbs up emoji
        {"down", Outcome::NoResponse},
        {"thumbs_down", Outcome::NoResponse},
        {"-1", Outcome::NoResponse},
        {"\xF0\x9F\x91\x8E", Outcome::NoResponse},  // thumbs down emoji
    };
    auto it = mapping.find(to_lower_ascii(trim(vote)));
    if (it == mapping.end()) {
        throw ContractError("Unknown thumb vote. Use one of: up, down, thumbs_up, thumbs_down, +1, -1 or the thumb emoji.");
    }
    return it->second;
}

namespace {

std::string column(const json& row, const char* key) {
    if (!row.is_object() || !row.contains(key) || row[key].is_null()) return "";
    if (row[key].is_string()) return row[key].get<std::string>();
    return row[key].dump();
}

bool contains_any(const std::string& text, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (text.find(n) != std::string::npos) return true;
    }
    return false;
}

std::set<std::string> load_seen_keys(const std::string& path) {
    std::set<std::string> keys;
    auto content = AtomicFile::read(path);
    if (!content) return keys;
    json ledger = json::parse(*content, nullptr, false);
    if (!ledger.is_array()) {
        spdlog::warn("⚠️ Ledger at {} is unreadable, replaying from scratch", path);
        return keys;
    }
    for (const auto& k : ledger) {
        if (k.is_string()) keys.insert(k.get<std::string>());
    }
    return keys;
}

void save_seen_keys(const std::string& path, const std::set<std::string>& keys) {
    json ledger = json::array();
    for (const auto& k : keys) ledger.push_back(k);
    AtomicFile::write(path, ledger.dump(2, ' ', true));
}

} // namespace

std::optional<Outcome> infer_tracker_outcome(const json& row) {
    const std::string status = normalize_status(column(row, "Status"));
    const std::string combined = join({to_lower_ascii(trim(column(row, "Response"))),
                                       to_lower_ascii(trim(column(row, "Interview Stage"))),
                                       to_lower_ascii(trim(column(row, "Response Type")))}, " | ");

    if (status == "Offer" || contains_any(combined, {"offer"})) return Outcome::Offer;
    if (status == "Rejected" || contains_any(combined, {"reject"})) return Outcome::Rejected;
    if (status == "Blocked" || contains_any(combined, {"blocked", "captcha"})) return Outcome::Blocked;

    // Softer signals only count once the application went out
    if (status != "Applied") return std::nullopt;
    if (contains_any(combined, {"interview", "phone screen", "screening", "onsite", "final round"})) {
        return Outcome::Interview;
    }
    if (contains_any(combined, {"recruiter", "reached out", "reply", "responded", "response"})) {
        return Outcome::Response;
    }
    return std::nullopt;
}

std::optional<Outcome> parse_outcome_from_row(const json& row) {
    if (row.contains("outcome") && row["outcome"].is_string()) {
        if (auto o = parse_outcome(to_lower_ascii(trim(row["outcome"].get<std::string>())))) return o;
    }
    std::string type = row.contains("type") && row["type"].is_string() ? trim(row["type"].get<std::string>()) : "";
    if (type != "outcome") return std::nullopt;
    std::string msg = row.contains("msg") && row["msg"].is_string() ? row["msg"].get<std::string>() : "";
    for (const auto& token : split_whitespace(msg)) {
        if (token.rfind("outcome=", 0) == 0) {
            if (auto o = parse_outcome(to_lower_ascii(trim(token.substr(8))))) return o;
        }
    }
    return std::nullopt;
}

RetrievalService::RetrievalService(RankConfig config, IndexFactory factory)
    : config_(std::move(config)),
      embedder_(config_.embedding_dims),
      factory_(std::move(factory)),
      memory_(config_.memory_short_path(), config_.memory_long_path()),
      journal_(config_.events_path(), memory_),
      rng_(std::random_device{}())
{
    if (!factory_) {
        factory_ = [](int dims) { return std::make_shared<ApplicationIndex>(dims); };
    }
}

std::shared_ptr<SearchIndex> RetrievalService::index() {
    if (index_) return index_;
    auto idx = factory_(embedder_.dims());
    idx->load(config_.index_dir);
    index_ = idx;
    return index_;
}

// --- Records ---

std::vector<ApplicationRecord> RetrievalService::load_records() const {
    std::vector<ApplicationRecord> out;
    for (const auto& row : load_jsonl(config_.applications_path())) {
        auto rec = ApplicationRecord::from_json(row);
        if (!rec.app_id.empty()) out.push_back(std::move(rec));
    }
    return out;
}

std::unordered_map<std::string, ApplicationRecord> RetrievalService::load_app_lookup() const {
    std::unordered_map<std::string, ApplicationRecord> out;
    for (auto& rec : load_records()) {
        std::string id = rec.app_id;
        out.emplace(std::move(id), std::move(rec));
    }
    return out;
}

void RetrievalService::write_records(const std::vector<ApplicationRecord>& records) const {
    std::string content;
    for (const auto& rec : records) {
        content += rec.to_json().dump(-1, ' ', true);
        content += '\n';
    }
    AtomicFile::write(config_.applications_path(), content);
}

// --- Build ---

BuildReport RetrievalService::build(const json& tracker_rows) {
    if (!tracker_rows.is_array()) throw ContractError("tracker rows must be a JSON array");

    fs::create_directories(config_.data_dir);
    fs::create_directories(config_.log_dir);
    fs::create_directories(config_.index_dir);

    BuildReport report;
    report.rows = tracker_rows.size();
    const std::string now = utc_now_iso();

    std::vector<ApplicationRecord> records;
    for (const auto& row : tracker_rows) {
        try {
            records.push_back(record_from_tracker_row(row, now));
        } catch (const std::exception& e) {
            auto column = [&row](const char* key) -> std::string {
                if (!row.is_object() || !row.contains(key) || !row[key].is_string()) return "";
                return row[key].get<std::string>();
            };
            std::string who = column("Company") + " / " + column("Role");
            journal_.append("", "ingest_error", "Failed to ingest " + who + ": " + e.what());
            ++report.errors;
        }
    }
    size_t before = records.size();
    records = dedupe_records(records);
    report.duplicates = before - records.size();
    report.records = records.size();

    write_records(records);
    memory_.rebuild_semantic(records, now);
    memory_.ensure_episodic();

    auto model = ThompsonModel::load(config_.arms_path());
    if (model.empty()) {
        model.bootstrap_from_records(records);
        model.save(config_.arms_path());
        report.bootstrapped = true;
    }
    report.arms = model.size();

    std::vector<std::vector<float>> vectors;
    vectors.reserve(records.size());
    for (const auto& rec : records) vectors.push_back(embedder_.embed_record(rec));

    auto idx = factory_(embedder_.dims());
    idx->rebuild(records, vectors);
    idx->save(config_.index_dir);
    index_ = idx;

    journal_.append("", "build_ok", "Indexed " + std::to_string(records.size()) + " applications");
    spdlog::info("✅ Built {} applications ({} duplicates, {} errors)", report.records, report.duplicates, report.errors);
    return report;
}

// --- Retrieval ---

std::vector<Candidate> RetrievalService::rank(std::vector<Candidate> candidates, const std::string& q) const {
    auto model = ThompsonModel::load(config_.arms_path());
    auto short_scores = recency_scores(memory_.load_episodic(), std::chrono::system_clock::now(),
                                       config_.half_life_days);
    auto long_scores = priority_scores(memory_.load_semantic());
    return fuse(std::move(candidates), q, model, short_scores, long_scores, config_.fusion_weights);
}

std::vector<Candidate> RetrievalService::query(const std::string& q, int k, RetrievalTrace* trace) {
    auto req = build_retrieve_request(q, k);
    auto query_vec = embedder_.embed(req.query);

    HybridRetriever retriever(index(), config_.rrf_k);
    auto candidates = retriever.retrieve(req.query, query_vec, config_.query_candidate_k(req.k), trace);

    auto ranked = rank(std::move(candidates), req.query);
    if (ranked.size() > static_cast<size_t>(req.k)) ranked.resize(req.k);

    std::vector<std::string> ids;
    for (const auto& c : ranked) ids.push_back(c.id());
    remember_recent_results("query", req.query, ids);
    return ranked;
}

std::vector<RetrieveItem> RetrievalService::retrieve(const RetrieveRequest& request, RetrievalTrace* trace) {
    validate_retrieve_request(request);
    auto query_vec = embedder_.embed(trim(request.query));

    HybridRetriever retriever(index(), config_.rrf_k);
    auto candidates = retriever.retrieve(request.query, query_vec, config_.retrieve_candidate_k(request.k), trace);

    // Filters run before fusion and truncation
    auto keep = [&request](const Candidate& c) {
        if (request.status && to_lower_ascii(c.record.status) != to_lower_ascii(trim(*request.status))) return false;
        if (request.method && to_lower_ascii(c.record.application_method) != to_lower_ascii(trim(*request.method))) return false;
        return true;
    };
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&keep](const Candidate& c) { return !keep(c); }),
                     candidates.end());

    auto ranked = rank(std::move(candidates), request.query);
    if (ranked.size() > static_cast<size_t>(request.k)) ranked.resize(request.k);

    std::vector<RetrieveItem> items;
    items.reserve(ranked.size());
    for (const auto& c : ranked) items.push_back(RetrieveItem::from_candidate(c));
    items = validate_retrieve_payload(items);

    std::vector<std::string> ids;
    for (const auto& item : items) ids.push_back(item.app_id);
    remember_recent_results("retrieve", request.query, ids);
    return items;
}

// --- Session ---

json RetrievalService::load_session_state() const {
    auto content = AtomicFile::read(config_.session_path());
    if (!content) return json::object();
    json data = json::parse(*content, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        spdlog::warn("⚠️ Session state at {} is unreadable, ignoring it", config_.session_path());
        return json::object();
    }
    return data;
}

void RetrievalService::remember_recent_results(const std::string& source, const std::string& q,
                                               const std::vector<std::string>& app_ids) const {
    json state = load_session_state();
    json ids = json::array();
    for (const auto& id : app_ids) {
        if (!id.empty()) ids.push_back(id);
    }
    state["last_results"] = {
        {"source", source},
        {"query", q},
        {"app_ids", ids},
        {"ts", utc_now_iso()}
    };
    AtomicFile::write(config_.session_path(), state.dump(2, ' ', true));
}

std::optional<std::string> RetrievalService::latest_app_id() const {
    std::optional<std::string> best;
    std::tuple<std::string, std::string, std::string> best_key;
    for (const auto& rec : load_records()) {
        auto key = std::make_tuple(rec.date_applied, rec.updated_at, rec.app_id);
        if (key > best_key) {
            best_key = key;
            best = rec.app_id;
        }
    }
    return best;
}

std::string RetrievalService::resolve_thumb_app_id(const std::optional<std::string>& app_id) const {
    if (app_id && !trim(*app_id).empty()) return trim(*app_id);

    json state = load_session_state();
    if (state.contains("last_results") && state["last_results"].is_object()) {
        const auto& last = state["last_results"];
        if (last.contains("app_ids") && last["app_ids"].is_array()) {
            for (const auto& id : last["app_ids"]) {
                if (id.is_string() && !id.get<std::string>().empty()) return id.get<std::string>();
            }
        }
    }

    if (auto fallback = latest_app_id()) return *fallback;

    throw ContractError("Cannot infer app_id for thumb feedback. Run query/retrieve first or pass app_id.");
}

// --- Feedback ---

FeedbackReport RetrievalService::feedback(const std::string& app_id, const std::string& outcome_name) {
    auto outcome = parse_outcome(outcome_name);
    if (!outcome) {
        throw ContractError("Unknown outcome '" + outcome_name + "'. Valid: " + valid_outcomes_list());
    }

    auto lookup = load_app_lookup();
    if (lookup.empty()) throw std::runtime_error("Index not built. Run build first.");
    auto it = lookup.find(app_id);
    if (it == lookup.end()) throw ContractError("app_id '" + app_id + "' not found in index.");
    const auto& rec = it->second;

    auto model = ThompsonModel::load(config_.arms_path());
    FeedbackReport report;
    report.app_id = app_id;
    report.company = rec.company;
    report.role = rec.role;
    report.outcome = *outcome;
    report.arms = model.record_outcome(rec.tags, rec.application_method, *outcome);
    model.save(config_.arms_path());

    journal_.append(app_id, "outcome",
                    std::string("outcome=") + to_string(*outcome) +
                    " tags=" + join(rec.tags, ";") + " method=" + rec.application_method,
                    std::string(to_string(*outcome)));

    spdlog::info("✅ Recorded outcome={} for {} / {}", to_string(*outcome), rec.company, rec.role);
    return report;
}

FeedbackReport RetrievalService::thumb_feedback(const std::optional<std::string>& app_id, const std::string& vote) {
    Outcome outcome = outcome_from_thumb(vote);
    return feedback(resolve_thumb_app_id(app_id), to_string(outcome));
}

BatchReport RetrievalService::feedback_batch(const std::string& source) {
    std::vector<json> rows;
    if (source == "events") {
        rows = journal_.load();
    } else if (source == "memory_short" || source.empty()) {
        rows = memory_.load_episodic_rows();
    } else {
        throw ContractError("Unknown feedback source '" + source + "'. Valid: events, memory_short");
    }

    auto lookup = load_app_lookup();
    if (lookup.empty()) throw std::runtime_error("Index not built. Run build first.");

    std::set<std::string> seen_keys = load_seen_keys(config_.feedback_ledger_path());

    BatchReport report;
    report.source = source.empty() ? "memory_short" : source;

    std::vector<std::pair<std::string, ArmDelta>> deltas;
    std::unordered_map<std::string, size_t> delta_slot;
    auto bump = [&](const std::string& name, double reward) {
        auto it = delta_slot.find(name);
        if (it == delta_slot.end()) {
            delta_slot.emplace(name, deltas.size());
            deltas.emplace_back(name, ArmDelta{});
            deltas.back().second.add(reward);
        } else {
            deltas[it->second].second.add(reward);
        }
    };

    std::unordered_set<std::string> batch_seen;
    std::vector<std::string> new_seen;
    for (const auto& row : rows) {
        std::string app_id = row.contains("app_id") && row["app_id"].is_string() ? row["app_id"].get<std::string>() : "";
        auto outcome = parse_outcome_from_row(row);
        std::string ts = row.contains("ts") && row["ts"].is_string() ? row["ts"].get<std::string>() : "";
        if (app_id.empty() || !outcome) {
            ++report.skipped;
            continue;
        }

        std::string key = app_id + "|" + to_string(*outcome) + "|" + ts;
        if (batch_seen.count(key) || seen_keys.count(key)) {
            ++report.skipped;
            continue;
        }
        batch_seen.insert(key);
        new_seen.push_back(key);

        auto it = lookup.find(app_id);
        if (it == lookup.end()) {
            ++report.skipped;
            continue;
        }

        double reward = reward_for(*outcome);
        for (const auto& name : ThompsonModel::arm_names_for(it->second.tags, it->second.application_method)) {
            bump(name, reward);
        }
        ++report.processed;
    }

    auto model = ThompsonModel::load(config_.arms_path());
    model.apply_deltas(deltas);
    model.save(config_.arms_path());

    report.arms_touched = deltas.size();
    report.new_seen = new_seen.size();
    if (!new_seen.empty()) {
        seen_keys.insert(new_seen.begin(), new_seen.end());
        save_seen_keys(config_.feedback_ledger_path(), seen_keys);
    }

    journal_.append("", "feedback_batch",
                    "source=" + report.source +
                    " processed=" + std::to_string(report.processed) +
                    " skipped=" + std::to_string(report.skipped) +
                    " arms_touched=" + std::to_string(report.arms_touched) +
                    " new_seen=" + std::to_string(report.new_seen));

    spdlog::info("✅ Replayed feedback batch: processed={} skipped={} arms={}",
                 report.processed, report.skipped, report.arms_touched);
    return report;
}

SyncReport RetrievalService::sync_tracker_feedback(const json& tracker_rows) {
    if (!tracker_rows.is_array()) throw ContractError("tracker rows must be a JSON array");

    auto lookup = load_app_lookup();
    auto seen_keys = load_seen_keys(config_.tracker_ledger_path());
    auto model = ThompsonModel::load(config_.arms_path());
    const std::string now = utc_now_iso();

    SyncReport report;
    for (const auto& row : tracker_rows) {
        if (!row.is_object()) {
            ++report.skipped;
            continue;
        }
        auto outcome = infer_tracker_outcome(row);
        if (!outcome) {
            ++report.skipped;
            continue;
        }

        ApplicationRecord rec = record_from_tracker_row(row, now);
        const std::string response_type = trim(column(row, "Response Type"));
        const std::string key = to_lower_ascii(join({rec.app_id, to_string(*outcome), rec.status,
                                                     trim(column(row, "Response")),
                                                     trim(column(row, "Interview Stage")),
                                                     response_type}, "|"));
        if (seen_keys.count(key)) {
            ++report.skipped;
            continue;
        }

        // Indexed tags and method win over the raw row
        auto it = lookup.find(rec.app_id);
        const auto& tags = it != lookup.end() ? it->second.tags : rec.tags;
        const auto& method = it != lookup.end() ? it->second.application_method : rec.application_method;

        model.record_outcome(tags, method, *outcome);
        journal_.append(rec.app_id, "tracker_outcome_sync",
                        std::string("outcome=") + to_string(*outcome) +
                        " status=" + rec.status + " method=" + method +
                        " tags=" + join(tags, ";") + " response_type=" + response_type,
                        std::string(to_string(*outcome)));
        seen_keys.insert(key);
        ++report.processed;
    }

    model.save(config_.arms_path());
    save_seen_keys(config_.tracker_ledger_path(), seen_keys);
    journal_.append("", "tracker_feedback_sync",
                    "processed=" + std::to_string(report.processed) +
                    " skipped=" + std::to_string(report.skipped));

    spdlog::info("✅ Synced tracker feedback: processed={} skipped={}", report.processed, report.skipped);
    return report;
}

// --- Status ---

StatusReport RetrievalService::status() const {
    if (!fs::exists(config_.applications_path())) {
        throw std::runtime_error("Index not built. Run build first.");
    }
    static const std::vector<std::string> kCanonical = {
        "Applied", "Draft", "Blocked", "Closed", "Rejected", "Offer"
    };

    StatusReport report;
    std::map<std::string, size_t> counts;
    for (const auto& rec : load_records()) {
        std::string s = rec.status.empty() ? "Unknown" : rec.status;
        ++counts[s];
        ++report.total;
        StatusEntry entry{rec.app_id, rec.company, rec.role, rec.application_method, rec.tags};
        if (s == "Draft") report.drafts.push_back(std::move(entry));
        else if (s == "Blocked") report.blocked.push_back(std::move(entry));
    }

    for (const auto& s : kCanonical) {
        auto it = counts.find(s);
        report.counts.emplace_back(s, it == counts.end() ? 0 : it->second);
    }
    for (const auto& [s, n] : counts) {
        if (std::find(kCanonical.begin(), kCanonical.end(), s) == kCanonical.end()) {
            report.counts.emplace_back(s, n);
        }
    }
    return report;
}

// --- Bandit views ---

std::vector<ArmRecommendation> RetrievalService::recommend(int k) {
    if (k < 1) throw ContractError("k must be at least 1");
    auto model = ThompsonModel::load(config_.arms_path());
    std::vector<ArmRecommendation> out;
    for (const auto& s : model.recommend(k, rng_)) {
        const Arm* arm = model.find(s.name);
        out.push_back({s.name, s.sample, arm->mean_reward(), arm->pulls, arm->alpha, arm->beta});
    }
    return out;
}

std::vector<ArmStats> RetrievalService::stats() const {
    return ThompsonModel::load(config_.arms_path()).stats();
}

// --- Events ---

json RetrievalService::log_event(const std::string& app_id, const std::string& event_type, const std::string& msg) {
    if (trim(event_type).empty()) throw ContractError("event type must be a non-empty string");
    auto row = journal_.append(trim(app_id), trim(event_type), msg);
    spdlog::info("✅ Logged '{}' for {}", event_type, app_id.empty() ? "-" : app_id);
    return row;
}

json RetrievalService::recent_events(size_t limit) const {
    return journal_.recent(limit);
}

} // namespace app_retrieval

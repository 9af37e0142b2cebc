#include "memory/memory_store.hpp"
#include "atomic_file.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <spdlog/spdlog.h>

namespace app_retrieval {

using json = nlohmann::json;

namespace {

std::string str_field(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) return "";
    return j[key].get<std::string>();
}

// Missing, non-numeric and zero values fall back to the default.
double num_field_or(const json& j, const char* key, double fallback) {
    if (!j.contains(key) || !j[key].is_number()) return fallback;
    double v = j[key].get<double>();
    return v == 0.0 ? fallback : v;
}

json nullable(const std::string& s) {
    return s.empty() ? json(nullptr) : json(s);
}

} // namespace

json EpisodicEntry::to_json() const {
    return json{
        {"kind", "episodic"},
        {"ts", ts},
        {"app_id", nullable(app_id)},
        {"event_type", event_type},
        {"outcome", outcome ? json(*outcome) : json(nullptr)},
        {"score_hint", score_hint},
        {"text", text}
    };
}

EpisodicEntry EpisodicEntry::from_json(const json& j) {
    EpisodicEntry e;
    e.ts = str_field(j, "ts");
    e.app_id = str_field(j, "app_id");
    e.event_type = str_field(j, "event_type");
    if (j.contains("outcome") && j["outcome"].is_string()) e.outcome = j["outcome"].get<std::string>();
    e.score_hint = num_field_or(j, "score_hint", kDefaultScoreHint);
    e.text = str_field(j, "text");
    return e;
}

json SemanticEntry::to_json() const {
    return json{
        {"kind", "semantic"},
        {"ts", ts},
        {"app_id", nullable(app_id)},
        {"company", company},
        {"role", role},
        {"status", status},
        {"application_method", application_method},
        {"tags", tags},
        {"priority", priority},
        {"summary", summary}
    };
}

SemanticEntry SemanticEntry::from_json(const json& j) {
    SemanticEntry e;
    e.ts = str_field(j, "ts");
    e.app_id = str_field(j, "app_id");
    e.company = str_field(j, "company");
    e.role = str_field(j, "role");
    e.status = str_field(j, "status");
    e.application_method = str_field(j, "application_method");
    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& t : j["tags"]) {
            if (t.is_string()) e.tags.push_back(t.get<std::string>());
        }
    }
    e.priority = num_field_or(j, "priority", kDefaultPriority);
    e.summary = str_field(j, "summary");
    return e;
}

double score_hint_for_outcome(const std::optional<std::string>& outcome) {
    static const std::unordered_map<std::string, double> weights = {
        {"blocked", 0.2},
        {"no_response", 0.3},
        {"rejected", 0.4},
        {"response", 0.7},
        {"interview", 0.9},
        {"offer", 1.0},
    };
    if (!outcome) return kDefaultScoreHint;
    auto it = weights.find(trim(*outcome));
    return it == weights.end() ? kDefaultScoreHint : it->second;
}

double priority_for_status(const std::string& status) {
    static const std::unordered_map<std::string, double> priorities = {
        {"Offer", 1.0},
        {"Applied", 0.8},
        {"Rejected", 0.5},
        {"Blocked", 0.3},
        {"Draft", 0.2},
        {"Closed", 0.1},
    };
    auto it = priorities.find(status);
    return it == priorities.end() ? kDefaultPriority : it->second;
}

EpisodicEntry build_short_memory_entry(const std::string& app_id,
                                       const std::string& event_type,
                                       const std::string& msg,
                                       const std::string& ts,
                                       const std::optional<std::string>& outcome) {
    EpisodicEntry e;
    e.ts = ts;
    e.app_id = app_id;
    e.event_type = event_type;
    e.outcome = outcome;
    e.score_hint = score_hint_for_outcome(outcome);
    e.text = msg;
    return e;
}

SemanticEntry build_long_memory_entry(const ApplicationRecord& rec, const std::string& ts) {
    SemanticEntry e;
    e.ts = ts;
    e.app_id = rec.app_id;
    e.company = rec.company;
    e.role = rec.role;
    e.status = rec.status;
    e.application_method = rec.application_method;
    e.tags = rec.tags;
    e.priority = priority_for_status(rec.status);
    e.summary = trim(join({rec.company, rec.role, join(rec.tags, " "),
                           rec.application_method, utf8_safe_substr(rec.notes, 240)}, " "));
    return e;
}

std::vector<json> load_jsonl(const std::string& path) {
    std::vector<json> rows;
    std::ifstream in(path);
    if (!in) return rows;

    std::string line;
    size_t skipped = 0;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;
        json item = json::parse(line, nullptr, false);
        if (item.is_discarded() || !item.is_object()) {
            ++skipped;
            continue;
        }
        rows.push_back(std::move(item));
    }
    if (skipped > 0) spdlog::debug("Skipped {} malformed lines in {}", skipped, path);
    return rows;
}

void append_jsonl(const std::string& path, const json& row) {
    AtomicFile::append_line(path, row.dump(-1, ' ', true));
}

ScoreMap recency_scores(const std::vector<EpisodicEntry>& entries, TimePoint now, double half_life_days) {
    const double half_life = std::max(0.1, half_life_days);
    ScoreMap by_app;
    for (const auto& e : entries) {
        if (e.app_id.empty()) continue;
        auto ts = parse_iso_utc(e.ts);
        if (!ts) continue;

        double age_days = std::chrono::duration<double>(now - *ts).count() / 86400.0;
        age_days = std::max(0.0, age_days);
        double decay = std::exp(-std::log(2.0) * age_days / half_life);
        double score = std::clamp(decay * e.score_hint, 0.0, 1.0);

        auto it = by_app.find(e.app_id);
        if (it == by_app.end()) by_app.emplace(e.app_id, score);
        else it->second = std::max(it->second, score);
    }
    return by_app;
}

ScoreMap priority_scores(const std::vector<SemanticEntry>& entries) {
    ScoreMap by_app;
    for (const auto& e : entries) {
        if (e.app_id.empty()) continue;
        double priority = std::clamp(e.priority, 0.0, 1.0);
        auto it = by_app.find(e.app_id);
        if (it == by_app.end()) by_app.emplace(e.app_id, priority);
        else it->second = std::max(it->second, priority);
    }
    return by_app;
}

// --- MemoryStore ---

std::vector<EpisodicEntry> MemoryStore::load_episodic() const {
    std::vector<EpisodicEntry> out;
    for (const auto& row : load_jsonl(short_path_)) out.push_back(EpisodicEntry::from_json(row));
    return out;
}

std::vector<SemanticEntry> MemoryStore::load_semantic() const {
    std::vector<SemanticEntry> out;
    for (const auto& row : load_jsonl(long_path_)) out.push_back(SemanticEntry::from_json(row));
    return out;
}

std::vector<json> MemoryStore::load_episodic_rows() const {
    return load_jsonl(short_path_);
}

void MemoryStore::append(const EpisodicEntry& entry) const {
    append_jsonl(short_path_, entry.to_json());
}

void MemoryStore::ensure_episodic() const {
    AtomicFile::touch(short_path_);
}

void MemoryStore::rebuild_semantic(const std::vector<ApplicationRecord>& records, const std::string& ts) const {
    std::string content;
    for (const auto& rec : records) {
        content += build_long_memory_entry(rec, ts).to_json().dump(-1, ' ', true);
        content += '\n';
    }
    AtomicFile::write(long_path_, content);
    spdlog::info("🧠 Semantic memory rebuilt: {} entries", records.size());
}

} // namespace app_retrieval

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace app_retrieval {

// One tracked application as stored in applications.jsonl and the index metadata.
struct ApplicationRecord {
    std::string app_id;
    std::string company;
    std::string role;
    std::string status;
    std::string date_applied;
    std::string follow_up_date;
    std::string url;
    std::string application_method = "direct";
    std::vector<std::string> tags;
    std::string notes;
    std::string context_bundle_text;
    std::string rag_text;
    std::vector<std::string> evidence;
    std::string updated_at;

    nlohmann::json to_json() const;
    static ApplicationRecord from_json(const nlohmann::json& j);
};

std::string slug(const std::string& s);
std::string stable_id(const std::string& company, const std::string& role, const std::string& url);
std::vector<std::string> parse_tags(const std::string& tag_str);
std::string normalize_status(const std::string& status);

// Stable lowercase ATS key inferred from a career page URL ("direct" when unknown).
std::string infer_application_method(const std::string& url);

// Builds a record from a tracker row keyed by the tracker's column names
// ("Company", "Role", "Status", "Career Page URL", "Tags", ...).
ApplicationRecord record_from_tracker_row(const nlohmann::json& row, const std::string& updated_at);

// First occurrence of each app_id wins.
std::vector<ApplicationRecord> dedupe_records(const std::vector<ApplicationRecord>& records);

} // namespace app_retrieval

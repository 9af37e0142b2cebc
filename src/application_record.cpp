#include "application_record.hpp"
#include "text_utils.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <regex>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace app_retrieval {

using json = nlohmann::json;

json ApplicationRecord::to_json() const {
    auto sanitize_list = [](const std::vector<std::string>& items) {
        std::vector<std::string> out;
        out.reserve(items.size());
        for (const auto& item : items) out.push_back(sanitize_utf8(item));
        return out;
    };
    return json{
        {"app_id", sanitize_utf8(app_id)},
        {"company", sanitize_utf8(company)},
        {"role", sanitize_utf8(role)},
        {"status", sanitize_utf8(status)},
        {"date_applied", sanitize_utf8(date_applied)},
        {"follow_up_date", sanitize_utf8(follow_up_date)},
        {"url", sanitize_utf8(url)},
        {"application_method", sanitize_utf8(application_method)},
        {"tags", sanitize_list(tags)},
        {"notes", sanitize_utf8(notes)},
        {"context_bundle_text", sanitize_utf8(context_bundle_text)},
        {"rag_text", sanitize_utf8(rag_text)},
        {"evidence", sanitize_list(evidence)},
        {"updated_at", sanitize_utf8(updated_at)}
    };
}

ApplicationRecord ApplicationRecord::from_json(const json& j) {
    ApplicationRecord rec;
    auto safe_get = [&](const std::string& key) -> std::string {
        if (!j.contains(key) || !j[key].is_string()) return "";
        return j[key].get<std::string>();
    };
    auto safe_list = [&](const std::string& key) {
        std::vector<std::string> out;
        if (!j.contains(key) || !j[key].is_array()) return out;
        for (const auto& v : j[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
        return out;
    };

    rec.app_id = safe_get("app_id");
    rec.company = safe_get("company");
    rec.role = safe_get("role");
    rec.status = safe_get("status");
    rec.date_applied = safe_get("date_applied");
    rec.follow_up_date = safe_get("follow_up_date");
    rec.url = safe_get("url");
    rec.application_method = safe_get("application_method");
    if (rec.application_method.empty()) rec.application_method = "direct";
    rec.tags = safe_list("tags");
    rec.notes = safe_get("notes");
    rec.context_bundle_text = safe_get("context_bundle_text");
    // Index rows carry the document under "text"
    rec.rag_text = safe_get("rag_text");
    if (rec.rag_text.empty()) rec.rag_text = safe_get("text");
    rec.evidence = safe_list("evidence");
    if (rec.evidence.empty() && j.contains("artifacts") && j["artifacts"].is_object()) {
        const auto& artifacts = j["artifacts"];
        if (artifacts.contains("evidence") && artifacts["evidence"].is_array()) {
            for (const auto& v : artifacts["evidence"]) {
                if (v.is_string()) rec.evidence.push_back(v.get<std::string>());
            }
        }
    }
    rec.updated_at = safe_get("updated_at");
    return rec;
}

std::string slug(const std::string& s) {
    std::string lowered = to_lower_ascii(trim(s));
    std::string out;
    bool pending_dash = false;
    for (char ch : lowered) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) && c < 0x80) {
            if (pending_dash && !out.empty()) out += '-';
            pending_dash = false;
            out += ch;
        } else {
            pending_dash = true;
        }
    }
    return out.empty() ? "unknown" : out;
}

static std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::string hex;
    hex.reserve(len * 2);
    char buf[3];
    for (unsigned int i = 0; i < len; ++i) {
        std::snprintf(buf, sizeof(buf), "%02x", digest[i]);
        hex += buf;
    }
    return hex;
}

std::string stable_id(const std::string& company, const std::string& role, const std::string& url) {
    std::string prefix = slug(company) + "__" + slug(role);
    std::string base = prefix + "__" + trim(url);
    return prefix + "__" + sha256_hex(base).substr(0, 10);
}

std::vector<std::string> parse_tags(const std::string& tag_str) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= tag_str.size()) {
        size_t end = tag_str.find(';', start);
        if (end == std::string::npos) end = tag_str.size();
        std::string part = trim(tag_str.substr(start, end - start));
        if (!part.empty()) out.push_back(part);
        start = end + 1;
    }
    return out;
}

std::string normalize_status(const std::string& status) {
    static const std::unordered_map<std::string, std::string> mapping = {
        {"applied", "Applied"},
        {"draft", "Draft"},
        {"in progress", "Draft"},
        {"closed", "Closed"},
        {"blocked", "Blocked"},
        {"rejected", "Rejected"},
        {"offer", "Offer"},
    };
    std::string key = to_lower_ascii(trim(status));
    auto it = mapping.find(key);
    if (it != mapping.end()) return it->second;
    std::string kept = trim(status);
    return kept.empty() ? "Draft" : kept;
}

std::string infer_application_method(const std::string& url) {
    // Ordered by specificity
    static const std::vector<std::pair<std::string, std::regex>> ats_patterns = {
        {"mercor", std::regex(R"(work\.mercor\.com)")},
        {"ashby", std::regex(R"(ashbyhq\.com)")},
        {"greenhouse", std::regex(R"(greenhouse\.io|job-boards\.greenhouse\.io)")},
        {"lever", std::regex(R"(jobs\.lever\.co)")},
        {"wellfound", std::regex(R"(wellfound\.com|angel\.co)")},
        {"workday", std::regex(R"(myworkdayjobs\.com|workday\.com)")},
        {"linkedin", std::regex(R"(linkedin\.com/jobs)")},
    };
    std::string lowered = to_lower_ascii(url);
    for (const auto& [name, pattern] : ats_patterns) {
        if (std::regex_search(lowered, pattern)) return name;
    }
    return "direct";
}

static std::string row_field(const json& row, const std::string& key) {
    if (!row.contains(key) || row[key].is_null()) return "";
    if (row[key].is_string()) return row[key].get<std::string>();
    return row[key].dump();
}

ApplicationRecord record_from_tracker_row(const json& row, const std::string& updated_at) {
    if (!row.is_object()) throw std::invalid_argument("tracker row must be an object");

    ApplicationRecord rec;
    rec.company = trim(row_field(row, "Company"));
    rec.role = trim(row_field(row, "Role"));
    rec.url = trim(row_field(row, "Career Page URL"));
    rec.status = normalize_status(row_field(row, "Status"));
    rec.tags = parse_tags(row_field(row, "Tags"));
    rec.app_id = stable_id(rec.company, rec.role, rec.url);
    rec.application_method = infer_application_method(rec.url);
    rec.date_applied = trim(row_field(row, "Date Applied"));
    rec.follow_up_date = trim(row_field(row, "Follow Up Date"));
    rec.notes = row_field(row, "Notes");
    rec.updated_at = updated_at;

    std::vector<std::string> rag_lines = {
        "Company: " + rec.company,
        "Role: " + rec.role,
        "Status: " + rec.status,
        "Application Method: " + rec.application_method,
        "Career Page URL: " + rec.url,
        "Tags: " + join(rec.tags, ";"),
        "Notes: " + rec.notes,
        "Cover Letter Used: " + row_field(row, "Cover Letter Used"),
    };
    rec.rag_text = join(rag_lines, "\n");

    std::vector<std::string> bundle = {
        "company=" + rec.company,
        "role=" + rec.role,
        "status=" + rec.status,
        "method=" + rec.application_method,
        "tags=" + join(rec.tags, " "),
        "location=" + row_field(row, "Location"),
        "salary=" + row_field(row, "Salary Range"),
        "signals=" + utf8_safe_substr(row_field(row, "What Worked"), 160),
    };
    rec.context_bundle_text = trim(join(bundle, " | "));

    // Submission artifacts resolved upstream
    if (row.contains("evidence") && row["evidence"].is_array()) {
        for (const auto& v : row["evidence"]) {
            if (v.is_string()) rec.evidence.push_back(v.get<std::string>());
        }
    }
    return rec;
}

std::vector<ApplicationRecord> dedupe_records(const std::vector<ApplicationRecord>& records) {
    std::vector<ApplicationRecord> out;
    std::unordered_set<std::string> seen;
    for (const auto& rec : records) {
        if (rec.app_id.empty() || seen.count(rec.app_id)) continue;
        seen.insert(rec.app_id);
        out.push_back(rec);
    }
    return out;
}

} // namespace app_retrieval

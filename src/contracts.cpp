#include "contracts.hpp"
#include "text_utils.hpp"
#include <cmath>

namespace app_retrieval {

using json = nlohmann::json;

namespace {

double round4(double v) {
    return std::round(v * 10000.0) / 10000.0;
}

bool is_string_list(const json& v) {
    if (!v.is_array()) return false;
    for (const auto& e : v) {
        if (!e.is_string()) return false;
    }
    return true;
}

std::optional<std::string> blank_to_none(const std::optional<std::string>& v) {
    if (!v) return std::nullopt;
    std::string t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

void validate_filter(const std::optional<std::string>& value, const char* key) {
    if (value && utf8_length(trim(*value)) > kMaxFilterChars) {
        throw ContractError(std::string("retrieve request ") + key + " exceeds 120 characters");
    }
}

RetrieveItem canonicalize(RetrieveItem item) {
    item.score = round4(item.score);
    item.context = utf8_prefix(item.context, kMaxContextChars);
    return item;
}

} // namespace

json RetrieveRequest::to_json() const {
    return json{
        {"query", query},
        {"k", k},
        {"status", status ? json(*status) : json(nullptr)},
        {"method", method ? json(*method) : json(nullptr)}
    };
}

void validate_retrieve_request(const RetrieveRequest& req) {
    if (trim(req.query).empty()) {
        throw ContractError("retrieve request query must be a non-empty string");
    }
    if (utf8_length(req.query) > kMaxQueryChars) {
        throw ContractError("retrieve request query exceeds 512 characters");
    }
    if (req.k < kMinK || req.k > kMaxK) {
        throw ContractError("retrieve request k must be in [1, 200]");
    }
    validate_filter(req.status, "status");
    validate_filter(req.method, "method");
}

RetrieveRequest build_retrieve_request(const std::string& query,
                                       int k,
                                       const std::optional<std::string>& status,
                                       const std::optional<std::string>& method) {
    RetrieveRequest req;
    req.query = trim(query);
    req.k = k;
    req.status = blank_to_none(status);
    req.method = blank_to_none(method);
    validate_retrieve_request(req);
    return req;
}

int k_from_json(const json& body, int fallback) {
    if (!body.is_object() || !body.contains("k")) return fallback;
    const auto& k = body["k"];
    if (!k.is_number_integer()) throw ContractError("retrieve request k must be an integer");
    // Unsigned values above LLONG_MAX would wrap through long long
    if (k.is_number_unsigned() && k.get<unsigned long long>() > static_cast<unsigned long long>(kMaxK)) {
        throw ContractError("retrieve request k must be in [1, 200]");
    }
    auto raw = k.get<long long>();
    if (raw < kMinK || raw > kMaxK) throw ContractError("retrieve request k must be in [1, 200]");
    return static_cast<int>(raw);
}

RetrieveRequest retrieve_request_from_json(const json& j) {
    if (!j.is_object()) throw ContractError("retrieve request must be an object");

    if (!j.contains("query") || !j["query"].is_string()) {
        throw ContractError("retrieve request query must be a non-empty string");
    }
    int k = k_from_json(j, 5);

    auto filter = [&j](const char* key) -> std::optional<std::string> {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        if (!j[key].is_string()) {
            throw ContractError(std::string("retrieve request ") + key + " must be a string or null");
        }
        return j[key].get<std::string>();
    };

    return build_retrieve_request(j["query"].get<std::string>(), k, filter("status"), filter("method"));
}

json RetrieveItem::to_json() const {
    return json{
        {"app_id", app_id},
        {"company", company},
        {"role", role},
        {"status", status},
        {"method", method},
        {"tags", tags},
        {"score", score},
        {"context", context},
        {"evidence", evidence}
    };
}

RetrieveItem RetrieveItem::from_candidate(const Candidate& c) {
    RetrieveItem item;
    item.app_id = c.record.app_id;
    item.company = c.record.company;
    item.role = c.record.role;
    item.status = c.record.status;
    item.method = c.record.application_method;
    item.tags = c.record.tags;
    item.score = round4(c.final_score);
    item.context = utf8_prefix(c.record.context_bundle_text, kMaxContextChars);
    item.evidence = c.record.evidence;
    return item;
}

RetrieveItem validate_retrieve_item(const json& j) {
    if (!j.is_object()) throw ContractError("retrieve result item must be an object");

    RetrieveItem item;
    const std::pair<const char*, std::string*> strings[] = {
        {"app_id", &item.app_id},
        {"company", &item.company},
        {"role", &item.role},
        {"status", &item.status},
        {"method", &item.method},
        {"context", &item.context},
    };
    for (const auto& [key, dest] : strings) {
        if (!j.contains(key) || !j[key].is_string()) {
            throw ContractError(std::string("retrieve result item ") + key + " must be a string");
        }
        *dest = j[key].get<std::string>();
    }

    if (!j.contains("tags") || !is_string_list(j["tags"])) {
        throw ContractError("retrieve result item tags must be a list[str]");
    }
    if (!j.contains("evidence") || !is_string_list(j["evidence"])) {
        throw ContractError("retrieve result item evidence must be a list[str]");
    }
    item.tags = j["tags"].get<std::vector<std::string>>();
    item.evidence = j["evidence"].get<std::vector<std::string>>();

    if (!j.contains("score") || !j["score"].is_number()) {
        throw ContractError("retrieve result item score must be numeric");
    }
    item.score = j["score"].get<double>();
    if (item.score < 0.0) throw ContractError("retrieve result item score must be non-negative");

    return canonicalize(std::move(item));
}

std::vector<RetrieveItem> validate_retrieve_payload(const json& payload) {
    if (!payload.is_array()) throw ContractError("retrieve payload must be a list");
    if (payload.size() > kMaxResults) throw ContractError("retrieve payload cannot exceed 200 results");

    std::vector<RetrieveItem> out;
    out.reserve(payload.size());
    for (const auto& item : payload) out.push_back(validate_retrieve_item(item));
    return out;
}

std::vector<RetrieveItem> validate_retrieve_payload(const std::vector<RetrieveItem>& items) {
    if (items.size() > kMaxResults) throw ContractError("retrieve payload cannot exceed 200 results");

    std::vector<RetrieveItem> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        if (!std::isfinite(item.score) || item.score < 0.0) {
            throw ContractError("retrieve result item score must be non-negative");
        }
        out.push_back(canonicalize(item));
    }
    return out;
}

json build_retrieve_envelope(const RetrieveRequest& request,
                             const std::vector<RetrieveItem>& results,
                             const std::string& provider) {
    validate_retrieve_request(request);
    auto validated = validate_retrieve_payload(results);
    std::string name = trim(provider);
    if (name.empty()) throw ContractError("provider must be a non-empty string");

    json items = json::array();
    for (const auto& item : validated) items.push_back(item.to_json());

    return json{
        {"contract", kRetrieveContract},
        {"contract_version", kRetrieveContractVersion},
        {"provider", name},
        {"generated_at", utc_now_iso()},
        {"request", request.to_json()},
        {"results", items}
    };
}

} // namespace app_retrieval

#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "candidate.hpp"

namespace app_retrieval {

constexpr const char* kRetrieveContract = "rag.retrieve.v1";
constexpr const char* kRetrieveContractVersion = "2026-02-19";
constexpr const char* kLocalProvider = "local_fusion_v1";

constexpr size_t kMaxQueryChars = 512;
constexpr int kMinK = 1;
constexpr int kMaxK = 200;
constexpr size_t kMaxFilterChars = 120;
constexpr size_t kMaxContextChars = 320;
constexpr size_t kMaxResults = 200;

// Request or payload that does not satisfy the retrieve contract.
class ContractError : public std::invalid_argument {
public:
    explicit ContractError(const std::string& what) : std::invalid_argument(what) {}
};

struct RetrieveRequest {
    std::string query;
    int k = 5;
    std::optional<std::string> status;
    std::optional<std::string> method;

    nlohmann::json to_json() const;
};

// Trims inputs (blank filters become absent) and validates.
RetrieveRequest build_retrieve_request(const std::string& query,
                                       int k,
                                       const std::optional<std::string>& status = std::nullopt,
                                       const std::optional<std::string>& method = std::nullopt);

void validate_retrieve_request(const RetrieveRequest& req);

// Reads "k" from a request body: absent gives `fallback`; booleans, floats and
// values outside [1, 200] throw ContractError.
int k_from_json(const nlohmann::json& body, int fallback);

// Parses and validates a JSON request object ({"query", "k", "status", "method"}).
RetrieveRequest retrieve_request_from_json(const nlohmann::json& j);

struct RetrieveItem {
    std::string app_id;
    std::string company;
    std::string role;
    std::string status;
    std::string method;
    std::vector<std::string> tags;
    double score = 0.0;
    std::string context;
    std::vector<std::string> evidence;

    nlohmann::json to_json() const;
    static RetrieveItem from_candidate(const Candidate& c);
};

// Checks field types and a non-negative score, then canonicalizes: score
// rounded to 4 places, context capped at 320 characters.
RetrieveItem validate_retrieve_item(const nlohmann::json& item);
std::vector<RetrieveItem> validate_retrieve_payload(const nlohmann::json& payload);
std::vector<RetrieveItem> validate_retrieve_payload(const std::vector<RetrieveItem>& items);

nlohmann::json build_retrieve_envelope(const RetrieveRequest& request,
                                       const std::vector<RetrieveItem>& results,
                                       const std::string& provider = kLocalProvider);

} // namespace app_retrieval

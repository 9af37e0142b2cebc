#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

#include "contracts.hpp"
#include "rank_config.hpp"
#include "retrieval_service.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace app_retrieval;

class AppRetrievalServer {
public:
    explicit AppRetrievalServer(RankConfig config)
        : port_(config.port),
          server_(),
          service_(std::make_unique<RetrievalService>(std::move(config)))
    {
        setup_routes();
    }

    void run() {
        spdlog::info("🚀 Starting app retrieval backend on port {}", port_);
        if (!server_.listen("127.0.0.1", port_)) {
            spdlog::error("❌ Could not bind 127.0.0.1:{}", port_);
        }
    }

private:
    int port_;
    httplib::Server server_;
    std::unique_ptr<RetrievalService> service_;
    // One command at a time: persisted state is read and written whole.
    std::mutex service_mutex_;

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status": "ok"})", "application/json");
        });

        server_.Post("/build", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "build", [&] { return service_->build(load_tracker_rows(req)).to_json(); });
        });

        server_.Post("/query", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "query", [&] { return handle_query(req); });
        });

        server_.Post("/retrieve", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "retrieve", [&] { return handle_retrieve(req); });
        });

        server_.Post("/feedback", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "feedback", [&] {
                auto body = json::parse(req.body);
                auto report = service_->feedback(require_string(body, "app_id"), require_string(body, "outcome"));
                return report.to_json();
            });
        });

        server_.Post("/feedback/thumb", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "thumb feedback", [&] {
                auto body = json::parse(req.body);
                std::optional<std::string> app_id;
                if (body.contains("app_id") && body["app_id"].is_string()) app_id = body["app_id"].get<std::string>();
                auto report = service_->thumb_feedback(app_id, require_string(body, "vote"));
                return report.to_json();
            });
        });

        server_.Post("/feedback/batch", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "feedback batch", [&] {
                json body = req.body.empty() ? json::object() : json::parse(req.body);
                return service_->feedback_batch(body.value("source", std::string("memory_short"))).to_json();
            });
        });

        server_.Post("/feedback/sync", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "tracker sync", [&] {
                return service_->sync_tracker_feedback(load_tracker_rows(req)).to_json();
            });
        });

        server_.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            handle(res, "status", [&] { return service_->status().to_json(); });
        });

        server_.Get("/recommend", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "recommend", [&] {
                int k = req.has_param("k") ? parse_int(req.get_param_value("k"), "k") : 8;
                json arms = json::array();
                for (const auto& r : service_->recommend(k)) arms.push_back(r.to_json());
                return json{{"recommendations", arms}};
            });
        });

        server_.Get("/stats", [this](const httplib::Request&, httplib::Response& res) {
            handle(res, "stats", [&] {
                json arms = json::array();
                for (const auto& s : service_->stats()) arms.push_back(s.to_json());
                return json{{"arms", arms}};
            });
        });

        server_.Post("/events", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "log event", [&] {
                auto body = json::parse(req.body);
                std::string msg = body.contains("msg") && body["msg"].is_string() ? body["msg"].get<std::string>() : "";
                return service_->log_event(require_string(body, "app_id"), require_string(body, "type"), msg);
            });
        });

        server_.Get("/events", [this](const httplib::Request& req, httplib::Response& res) {
            handle(res, "events", [&] {
                int limit = req.has_param("limit") ? parse_int(req.get_param_value("limit"), "limit") : 50;
                if (limit < 1) throw ContractError("limit must be at least 1");
                return service_->recent_events(static_cast<size_t>(limit));
            });
        });
    }

    // Runs one command under the service lock and maps failures to HTTP codes.
    void handle(httplib::Response& res, const char* what, const std::function<json()>& fn) {
        try {
            json out;
            {
                std::lock_guard<std::mutex> lock(service_mutex_);
                out = fn();
            }
            res.set_content(out.dump(), "application/json");
        } catch (const json::exception& e) {
            spdlog::warn("⚠️ Bad {} request: {}", what, e.what());
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        } catch (const std::invalid_argument& e) {
            spdlog::warn("⚠️ Rejected {} request: {}", what, e.what());
            res.status = 400;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("❌ {} failed: {}", what, e.what());
            res.status = 500;
            res.set_content(json{{"error", e.what()}}.dump(), "application/json");
        }
    }

    // Tracker rows from a bare array, {"rows": [...]} or {"tracker_path": "..."}.
    static json load_tracker_rows(const httplib::Request& req) {
        auto body = json::parse(req.body);
        if (body.is_array()) return body;
        if (body.contains("rows")) return body["rows"];
        if (body.contains("tracker_path") && body["tracker_path"].is_string()) {
            std::string path = body["tracker_path"].get<std::string>();
            std::ifstream f(path);
            if (!f) throw std::runtime_error("Tracker export not found: " + path);
            return json::parse(f);
        }
        throw ContractError("request needs 'rows' or 'tracker_path'");
    }

    json handle_query(const httplib::Request& req) {
        auto body = json::parse(req.body);
        int k = k_from_json(body, 8);
        RetrievalTrace trace;
        auto results = service_->query(require_string(body, "query"), k, &trace);

        json rows = json::array();
        for (const auto& c : results) {
            rows.push_back({
                {"app_id", c.record.app_id},
                {"company", c.record.company},
                {"role", c.record.role},
                {"status", c.record.status},
                {"method", c.record.application_method},
                {"tags", c.record.tags},
                {"score", c.final_score},
                {"signals", {
                    {"base", c.base_score},
                    {"lexical", c.lexical_overlap},
                    {"bandit", c.bandit_prior},
                    {"memory_short", c.memory_short},
                    {"memory_long", c.memory_long}
                }}
            });
        }
        return json{{"results", rows}, {"retrieval_path", trace.path}};
    }

    json handle_retrieve(const httplib::Request& req) {
        auto body = json::parse(req.body);
        bool envelope = body.value("envelope", false);
        auto request = retrieve_request_from_json(body);
        auto items = service_->retrieve(request);
        if (envelope) {
            return build_retrieve_envelope(request, items);
        }
        json out = json::array();
        for (const auto& item : items) out.push_back(item.to_json());
        return out;
    }

    static std::string require_string(const json& body, const char* key) {
        if (!body.is_object() || !body.contains(key) || !body[key].is_string()) {
            throw ContractError(std::string("'") + key + "' must be a string");
        }
        return body[key].get<std::string>();
    }

    static int parse_int(const std::string& raw, const char* name) {
        try {
            size_t used = 0;
            int v = std::stoi(raw, &used);
            if (used != raw.size()) throw std::invalid_argument(raw);
            return v;
        } catch (const std::exception&) {
            throw ContractError(std::string(name) + " must be an integer");
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    RankConfig config = load_rank_config(argc > 1 ? argv[1] : "");
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    AppRetrievalServer server(std::move(config));
    server.run();
    return 0;
}

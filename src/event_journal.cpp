#include "event_journal.hpp"
#include "text_utils.hpp"
#include <spdlog/spdlog.h>

namespace app_retrieval {

using json = nlohmann::json;

json EventJournal::append(const std::string& app_id,
                          const std::string& event_type,
                          const std::string& msg,
                          const std::optional<std::string>& outcome) const {
    const std::string ts = utc_now_iso();
    json row = {
        {"ts", ts},
        {"app_id", app_id.empty() ? json(nullptr) : json(app_id)},
        {"type", event_type},
        {"msg", msg}
    };
    if (outcome) row["outcome"] = *outcome;

    append_jsonl(events_path_, row);
    memory_.append(build_short_memory_entry(app_id, event_type, msg, ts, outcome));
    spdlog::debug("Event {} for {}", event_type, app_id.empty() ? "-" : app_id);
    return row;
}

std::vector<json> EventJournal::load() const {
    return load_jsonl(events_path_);
}

json EventJournal::recent(size_t limit) const {
    auto rows = load();
    json j_list = json::array();
    // Return in reverse order (newest first)
    for (auto it = rows.rbegin(); it != rows.rend() && j_list.size() < limit; ++it) {
        j_list.push_back(*it);
    }
    return j_list;
}

} // namespace app_retrieval

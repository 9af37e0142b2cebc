#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memory/memory_store.hpp"

namespace app_retrieval {

// Operational event log (events.jsonl). Every event is mirrored into the
// episodic memory log so recency scoring sees it.
class EventJournal {
public:
    EventJournal(std::string events_path, MemoryStore memory)
        : events_path_(std::move(events_path)), memory_(std::move(memory)) {}

    // Returns the written event row.
    nlohmann::json append(const std::string& app_id,
                          const std::string& event_type,
                          const std::string& msg,
                          const std::optional<std::string>& outcome = std::nullopt) const;

    std::vector<nlohmann::json> load() const;

    // Newest first, at most `limit` rows.
    nlohmann::json recent(size_t limit = 50) const;

    const std::string& path() const { return events_path_; }

private:
    std::string events_path_;
    MemoryStore memory_;
};

} // namespace app_retrieval

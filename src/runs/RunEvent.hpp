#pragma once

#include "core/TimeUtil.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace weft {
namespace runs {

using json = nlohmann::json;

enum class EventLevel {
    Info,
    Warn,
    Error
};

std::string toString(EventLevel level);
std::optional<EventLevel> parseEventLevel(const std::string& name);

/**
 * One entry of a run's event log
 *
 * `message` names the event ("node_start", "node_output", "run_summary",
 * ...); `data` carries its payload. Events are immutable once appended.
 */
struct RunEvent {
    TimePoint timestamp;
    EventLevel level = EventLevel::Info;
    std::string message;
    json data = json::object();

    static RunEvent make(EventLevel level, std::string message, json data = json::object());

    /**
     * {"timestamp": ISO-8601, "level", "message", "data"}
     */
    json toJson() const;

    /**
     * Inverse of toJson. Throws ValidationError on malformed input.
     */
    static RunEvent fromJson(const json& j);

    bool operator==(const RunEvent& other) const;
};

} // namespace runs
} // namespace weft

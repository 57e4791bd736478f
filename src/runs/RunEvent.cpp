#include "runs/RunEvent.hpp"
#include "core/Errors.hpp"

namespace weft {
namespace runs {

std::string toString(EventLevel level) {
    switch (level) {
        case EventLevel::Info:  return "info";
        case EventLevel::Warn:  return "warn";
        case EventLevel::Error: return "error";
    }
    return "info";
}

std::optional<EventLevel> parseEventLevel(const std::string& name) {
    if (name == "info") return EventLevel::Info;
    if (name == "warn") return EventLevel::Warn;
    if (name == "error") return EventLevel::Error;
    return std::nullopt;
}

RunEvent RunEvent::make(EventLevel level, std::string message, json data) {
    RunEvent event;
    event.timestamp = nowMillis();
    event.level = level;
    event.message = std::move(message);
    event.data = std::move(data);
    return event;
}

json RunEvent::toJson() const {
    json j;
    j["timestamp"] = formatIsoTimestamp(timestamp);
    j["level"] = toString(level);
    j["message"] = message;
    j["data"] = data;
    return j;
}

RunEvent RunEvent::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("event", "must be an object");
    }
    RunEvent event;
    try {
        event.timestamp = parseIsoTimestamp(j.at("timestamp").get<std::string>());
    } catch (const std::exception& e) {
        throw ValidationError("timestamp", e.what());
    }
    auto level = parseEventLevel(j.value("level", ""));
    if (!level) {
        throw ValidationError("level", "must be one of: info, warn, error");
    }
    event.level = *level;
    event.message = j.value("message", "");
    event.data = j.value("data", json::object());
    return event;
}

bool RunEvent::operator==(const RunEvent& other) const {
    return timestamp == other.timestamp && level == other.level &&
           message == other.message && data == other.data;
}

} // namespace runs
} // namespace weft

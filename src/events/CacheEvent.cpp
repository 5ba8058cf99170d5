#include "memocache/events/CacheEvent.hpp"
#include <array>
#include <utility>

namespace memocache {
namespace events {

namespace {
constexpr std::array<std::pair<EventType, const char*>, 12> kEventNames = {{
    {EventType::Initialized, "INITIALIZED"},
    {EventType::ReadStart, "READ_START"},
    {EventType::ReadDone, "READ_DONE"},
    {EventType::ReadError, "READ_ERROR"},
    {EventType::ReadKeyNotFound, "READ_KEY_NOT_FOUND"},
    {EventType::ReadTimeout, "READ_TIMEOUT"},
    {EventType::JsonParsingFailed, "JSON_PARSING_FAILED"},
    {EventType::WriteStart, "WRITE_START"},
    {EventType::WriteDone, "WRITE_DONE"},
    {EventType::WriteError, "WRITE_ERROR"},
    {EventType::WriteFailed, "WRITE_FAILED"},
    {EventType::JsonStringifyFailed, "JSON_STRINGIFY_FAILED"},
}};
} // namespace

const char* toString(EventType type) {
    for (const auto& entry : kEventNames) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return "UNKNOWN";
}

std::optional<EventType> eventTypeFromString(const std::string& name) {
    for (const auto& entry : kEventNames) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

nlohmann::json CacheEvent::toJson() const {
    nlohmann::json j = {
        {"type", toString(type)},
        {"key", key},
        {"normalizedKey", normalizedKey}
    };

    nlohmann::json timersJson = nlohmann::json::object();
    if (timers.network) {
        timersJson["network"] = timers.network->count();
    }
    if (timers.total) {
        timersJson["total"] = timers.total->count();
    }
    if (!timersJson.empty()) {
        j["timers"] = timersJson;
    }
    if (data) {
        j["data"] = *data;
    }
    if (error) {
        j["error"] = *error;
    }
    if (ttlSeconds) {
        j["ttl"] = *ttlSeconds;
    }
    return j;
}

} // namespace events
} // namespace memocache

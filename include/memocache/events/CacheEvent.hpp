#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace memocache {
namespace events {

enum class EventType {
    Initialized,
    ReadStart,
    ReadDone,
    ReadError,
    ReadKeyNotFound,
    ReadTimeout,
    JsonParsingFailed,
    WriteStart,
    WriteDone,
    WriteError,
    WriteFailed,
    JsonStringifyFailed
};

// "INITIALIZED", "READ_START", ...
const char* toString(EventType type);
std::optional<EventType> eventTypeFromString(const std::string& name);

// Durations measured for one call. network is absent when no network call
// was made (e.g. serialization failed before the write).
struct EventTimers {
    std::optional<std::chrono::microseconds> network;
    std::optional<std::chrono::microseconds> total;
};

// CacheEvent: one diagnostic record emitted by the adapter
struct CacheEvent {
    EventType type;
    std::string key;            // Logical key as given by the caller
    std::string normalizedKey;  // Key sent to the transport
    EventTimers timers;
    std::optional<std::string> data;   // Raw/serialized payload, config for INITIALIZED
    std::optional<std::string> error;  // Error text for failures
    std::optional<std::int64_t> ttlSeconds; // Writes only

    nlohmann::json toJson() const;
};

// Per-request data forwarded to the sink with every event of that request
struct RequestContext {
    std::string requestId;
    std::unordered_map<std::string, std::string> tags;

    nlohmann::json toJson() const {
        return {
            {"requestId", requestId},
            {"tags", tags}
        };
    }
};

// Monotonic stopwatch used for the network/total timers
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}

    // Freezes the elapsed time on first call; later calls return the same value.
    std::chrono::microseconds stop() {
        if (!stopped_) {
            elapsed_ = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start_);
            stopped_ = true;
        }
        return elapsed_;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::microseconds elapsed_{0};
    bool stopped_ = false;
};

} // namespace events
} // namespace memocache

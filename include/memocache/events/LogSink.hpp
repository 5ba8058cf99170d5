#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "memocache/events/CacheEvent.hpp"

namespace memocache {
namespace events {

// Receiver of adapter events. log() may be called concurrently from the
// caller thread, transport threads and the timer thread. context is null for
// events raised outside a request (INITIALIZED).
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(const CacheEvent& event, const RequestContext* context) = 0;
};

// Used when the adapter is constructed without a sink
class NullLogSink : public ILogSink {
public:
    void log(const CacheEvent& event, const RequestContext* context) override {
        (void)event; (void)context;
    }
};

// Writes each event as one JSON line through spdlog.
// Failures go out at warn (READ_TIMEOUT, READ_ERROR, WRITE_ERROR, WRITE_FAILED,
// JSON_*_FAILED), INITIALIZED at info, everything else at debug.
class SpdlogLogSink : public ILogSink {
public:
    // Uses the library logger (logging::getLogger()) when logger is null.
    explicit SpdlogLogSink(std::shared_ptr<spdlog::logger> logger = nullptr);

    void log(const CacheEvent& event, const RequestContext* context) override;

    static spdlog::level::level_enum levelFor(EventType type);

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace events
} // namespace memocache

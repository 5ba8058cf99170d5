#include "memocache/events/LogSink.hpp"
#include "memocache/logging/Logging.hpp"

namespace memocache {
namespace events {

SpdlogLogSink::SpdlogLogSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : logging::getLogger()) {}

spdlog::level::level_enum SpdlogLogSink::levelFor(EventType type) {
    switch (type) {
        case EventType::Initialized:
            return spdlog::level::info;
        case EventType::ReadTimeout:
        case EventType::ReadError:
        case EventType::JsonParsingFailed:
        case EventType::WriteError:
        case EventType::WriteFailed:
        case EventType::JsonStringifyFailed:
            return spdlog::level::warn;
        case EventType::ReadStart:
        case EventType::ReadDone:
        case EventType::ReadKeyNotFound:
        case EventType::WriteStart:
        case EventType::WriteDone:
            return spdlog::level::debug;
    }
    return spdlog::level::info;
}

void SpdlogLogSink::log(const CacheEvent& event, const RequestContext* context) {
    const auto level = levelFor(event.type);
    if (!logger_->should_log(level)) {
        return;
    }
    nlohmann::json j = event.toJson();
    if (context) {
        j["context"] = context->toJson();
    }
    logger_->log(level, "{} {}", toString(event.type),
                 j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace events
} // namespace memocache

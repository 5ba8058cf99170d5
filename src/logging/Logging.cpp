#include "memocache/logging/Logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <mutex>
#include <vector>

namespace memocache {
namespace logging {

namespace {
std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

std::shared_ptr<spdlog::logger> initialize(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(loggerMutex());

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.filePath.empty()) {
        std::filesystem::path path(config.filePath);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.filePath, config.maxFileSize, config.maxFiles));
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(config.pattern);
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    logger->debug("Logging initialized: console={}, file='{}'", config.console, config.filePath);
    return logger;
}

std::shared_ptr<spdlog::logger> getLogger() {
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    std::lock_guard<std::mutex> lock(loggerMutex());
    if (auto logger = spdlog::get(kLoggerName)) {
        return logger;
    }
    auto logger = spdlog::stdout_color_mt(kLoggerName);
    logger->set_pattern(LoggingConfig{}.pattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace logging
} // namespace memocache

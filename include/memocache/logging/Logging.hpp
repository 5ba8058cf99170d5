#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace memocache {
namespace logging {

// Name of the library-wide spdlog logger
constexpr const char* kLoggerName = "memocache";

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";
    bool console = true;            // Colored stdout sink
    std::string filePath;           // Rotating file sink, empty = disabled
    size_t maxFileSize = 1024 * 1024 * 5;
    size_t maxFiles = 2;
};

// (Re)creates the "memocache" logger with the requested sinks and registers it.
// Throws spdlog::spdlog_ex if a sink cannot be created.
std::shared_ptr<spdlog::logger> initialize(const LoggingConfig& config);

// Returns the "memocache" logger, creating a console logger on first use.
std::shared_ptr<spdlog::logger> getLogger();

} // namespace logging
} // namespace memocache

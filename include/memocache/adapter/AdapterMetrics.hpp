#pragma once
#include <cstddef>
#include <nlohmann/json.hpp>

namespace memocache {
namespace adapter {

// AdapterMetrics: counters of one CacheAdapter, by outcome
struct AdapterMetrics {
    size_t readCount = 0;          // get() calls
    size_t hitCount = 0;           // READ_DONE
    size_t missCount = 0;          // READ_KEY_NOT_FOUND
    size_t timeoutCount = 0;       // READ_TIMEOUT
    size_t readErrorCount = 0;     // READ_ERROR
    size_t parseFailureCount = 0;  // JSON_PARSING_FAILED
    size_t writeCount = 0;         // set() calls that reached serialization
    size_t writeDoneCount = 0;     // WRITE_DONE
    size_t writeErrorCount = 0;    // WRITE_ERROR
    size_t writeFailedCount = 0;   // WRITE_FAILED
    size_t stringifyFailureCount = 0; // JSON_STRINGIFY_FAILED
    size_t skippedWriteCount = 0;  // set() with an absent value

    double hitRate() const {
        const size_t settled = hitCount + missCount + timeoutCount + readErrorCount + parseFailureCount;
        return settled == 0 ? 0.0 : static_cast<double>(hitCount) / static_cast<double>(settled);
    }

    nlohmann::json toJson() const {
        return {
            {"readCount", readCount},
            {"hitCount", hitCount},
            {"missCount", missCount},
            {"timeoutCount", timeoutCount},
            {"readErrorCount", readErrorCount},
            {"parseFailureCount", parseFailureCount},
            {"writeCount", writeCount},
            {"writeDoneCount", writeDoneCount},
            {"writeErrorCount", writeErrorCount},
            {"writeFailedCount", writeFailedCount},
            {"stringifyFailureCount", stringifyFailureCount},
            {"skippedWriteCount", skippedWriteCount},
            {"hitRate", hitRate()}
        };
    }
};

} // namespace adapter
} // namespace memocache

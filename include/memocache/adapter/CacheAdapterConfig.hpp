#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace memocache {
namespace adapter {

// CacheAdapterConfig: adapter parameters (servers, TTL, generation, deadline)
struct CacheAdapterConfig {
    std::vector<std::string> servers;                  // "host:port", required
    std::chrono::seconds defaultKeyTTL{60 * 60 * 24};  // TTL when set() gets none
    std::int64_t generation = 1;                       // Bump to invalidate every key
    std::chrono::milliseconds readTimeout{100};        // get() deadline
    nlohmann::json transportOptions = nlohmann::json::object(); // Passed to the transport as is

    bool validate() const;
    // Reason validate() fails, empty when valid
    std::string validationError() const;

    nlohmann::json toJson() const;
    // Canonical form used as the connection pool key: every field, object keys sorted
    std::string fingerprint() const;

    // Recognized keys: servers (string or array), defaultKeyTTL, generation,
    // readTimeout, transportOptions (alias memcachedOptions).
    // Throws std::invalid_argument on wrong types; does not call validate().
    static CacheAdapterConfig fromJson(const nlohmann::json& j);
    // Throws std::runtime_error if the file cannot be read or parsed.
    static CacheAdapterConfig loadFromFile(const std::string& path);

    bool operator==(const CacheAdapterConfig& other) const {
        return fingerprint() == other.fingerprint();
    }
    bool operator!=(const CacheAdapterConfig& other) const { return !(*this == other); }
};

} // namespace adapter
} // namespace memocache

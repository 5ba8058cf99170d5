#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace memocache {
namespace transport {
namespace memcached {

// Memcached ASCII protocol, the subset used by the transport (get, set).

constexpr size_t kMaxKeyLength = 250;
// Expiration times above this many seconds are read by the server as an
// absolute unix timestamp.
constexpr std::int64_t kMaxRelativeExptime = 60 * 60 * 24 * 30;

enum class ParseStatus {
    Complete,   // a full reply was parsed, `consumed` bytes used
    Incomplete, // need more bytes
    Malformed   // the buffer does not start with a valid reply
};

struct GetReply {
    std::optional<std::string> value;  // empty on miss
    std::optional<std::string> error;  // ERROR / CLIENT_ERROR / SERVER_ERROR text
};

enum class StoreOutcome {
    Stored,
    NotStored,
    Exists,
    NotFound,
    Error
};

struct StoreReply {
    StoreOutcome outcome = StoreOutcome::Error;
    std::string message; // server text for Error
};

// No whitespace or control characters, 1..250 bytes
bool isValidKey(const std::string& key);

// Converts a TTL in seconds to the exptime field: relative up to 30 days,
// absolute (now + ttl) beyond that, 0 means no expiry.
std::int64_t toExptime(std::int64_t ttlSeconds, std::time_t now);

std::string encodeGet(const std::string& key);
std::string encodeSet(const std::string& key, const std::string& value,
                      std::uint32_t flags, std::int64_t exptime);

// Parses "VALUE <key> <flags> <bytes>[ <cas>]\r\n<data>\r\nEND\r\n", "END\r\n"
// or an error line. Only the first VALUE block is kept.
ParseStatus parseGetReply(const std::string& buffer, GetReply& out, size_t& consumed);

// Parses STORED / NOT_STORED / EXISTS / NOT_FOUND or an error line.
ParseStatus parseStoreReply(const std::string& buffer, StoreReply& out, size_t& consumed);

} // namespace memcached
} // namespace transport
} // namespace memocache

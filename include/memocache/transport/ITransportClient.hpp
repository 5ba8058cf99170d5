#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace memocache {
namespace transport {

// Connection to the cache server(s). Implementations must be safe for
// concurrent fetch/store calls. Each callback is invoked exactly once, from
// any thread, possibly before fetch()/store() returns.
class ITransportClient {
public:
    // error is set when communication failed; value is empty on a miss.
    using FetchCallback = std::function<void(const std::optional<std::string>& error,
                                             const std::optional<std::string>& value)>;
    // stored is false when the server answered but did not keep the value.
    using StoreCallback = std::function<void(const std::optional<std::string>& error, bool stored)>;

    virtual ~ITransportClient() = default;

    virtual void fetch(const std::string& key, FetchCallback callback) = 0;
    virtual void store(const std::string& key, const std::string& value,
                       std::int64_t ttlSeconds, StoreCallback callback) = 0;
};

} // namespace transport
} // namespace memocache

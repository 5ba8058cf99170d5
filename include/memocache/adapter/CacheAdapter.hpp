#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "memocache/adapter/AdapterMetrics.hpp"
#include "memocache/adapter/CacheAdapterConfig.hpp"
#include "memocache/adapter/CacheError.hpp"
#include "memocache/events/CacheEvent.hpp"
#include "memocache/events/LogSink.hpp"
#include "memocache/registry/ConnectionRegistry.hpp"

namespace memocache {
namespace adapter {

// CacheAdapter: memoizes JSON values in memcached under normalized keys.
//
// get()/set() return immediately; the future settles once the transport
// answers or, for get(), once readTimeout elapses, whichever comes first.
// Expected failures (miss, timeout, transport error, bad payload) are returned
// as a failed Result and reported to the log sink; nothing is retried.
//
// Adapters are cheap: construct one per request if needed. The transport is
// pooled in the ConnectionRegistry by configuration, so equal configurations
// share one connection.
//
// @code
//   auto registry = std::make_shared<registry::ConnectionRegistry>();
//   CacheAdapter cache(config, registry, std::make_shared<events::SpdlogLogSink>());
//   auto cached = cache.get("user:42").get();
//   if (!cached) {
//       auto fresh = loadUser(42);
//       cache.set("user:42", fresh);
//   }
// @endcode
class CacheAdapter {
public:
    using ContextPtr = std::shared_ptr<const events::RequestContext>;

    // Throws std::invalid_argument if config is invalid or registry is null.
    // A null sink means events are dropped.
    CacheAdapter(const CacheAdapterConfig& config,
                 std::shared_ptr<registry::ConnectionRegistry> registry,
                 std::shared_ptr<events::ILogSink> sink = nullptr);
    ~CacheAdapter();

    std::future<Result<nlohmann::json>> get(const std::string& key, ContextPtr context = nullptr);

    // An absent value (see absent()) is a no-op: ready success, no network
    // call, no event. ttl defaults to config.defaultKeyTTL. The returned
    // future may be dropped, failures still reach the log sink.
    std::future<Result<void>> set(const std::string& key, const nlohmann::json& value,
                                  std::optional<std::chrono::seconds> ttl = std::nullopt,
                                  ContextPtr context = nullptr);

    std::string normalizeKey(const std::string& key) const;
    const CacheAdapterConfig& config() const;
    AdapterMetrics getMetrics() const;

    // The "nothing to cache" value accepted by set()
    static nlohmann::json absent() {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }

private:
    struct Impl;
    // Shared with in-flight callbacks, which may outlive the adapter
    std::shared_ptr<Impl> pImpl;
};

} // namespace adapter
} // namespace memocache

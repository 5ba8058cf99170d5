#pragma once

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "memocache/adapter/CacheAdapterConfig.hpp"
#include "memocache/events/LogSink.hpp"
#include "memocache/thread/TimerQueue.hpp"
#include "memocache/transport/ITransportClient.hpp"

namespace memocache {
namespace registry {

// ConnectionRegistry: process-scoped pool of transport clients.
//
// Adapters are cheap to create (e.g. one per request) but transports are not,
// so each distinct configuration fingerprint maps to exactly one shared
// transport client for the lifetime of the registry. Entries are never
// evicted. Create one registry at startup and pass it to every adapter.
//
// The registry also owns the TimerQueue that drives read deadlines for all
// adapters built on it.
class ConnectionRegistry {
public:
    using TransportFactory = std::function<std::shared_ptr<transport::ITransportClient>(
        const std::vector<std::string>& servers, const nlohmann::json& options)>;

    // Builds a MemcachedTransport
    static TransportFactory defaultFactory();

    explicit ConnectionRegistry(TransportFactory factory = defaultFactory());
    ~ConnectionRegistry();
    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Returns the pooled client for config, constructing it on first use and
    // emitting INITIALIZED to sink (without request context). Concurrent first
    // calls for the same fingerprint construct a single client.
    // Factory exceptions propagate to the caller and nothing is registered.
    std::shared_ptr<transport::ITransportClient> acquire(const adapter::CacheAdapterConfig& config,
                                                         events::ILogSink& sink);

    bool contains(const adapter::CacheAdapterConfig& config) const;
    size_t size() const; // Number of pooled clients

    std::shared_ptr<thread::TimerQueue> timers() const { return timers_; }

private:
    TransportFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<transport::ITransportClient>> clients_;
    mutable std::shared_mutex mutex_;
    std::shared_ptr<thread::TimerQueue> timers_;
};

} // namespace registry
} // namespace memocache

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "memocache/transport/ITransportClient.hpp"
#include "memocache/thread/ThreadPool.hpp"

namespace memocache {
namespace transport {

struct ServerAddress {
    std::string host;
    std::uint16_t port = 11211;

    // "host", "host:port" or "[v6addr]:port". Throws std::invalid_argument.
    static ServerAddress parse(const std::string& address);
    std::string toString() const;
};

// Options read from CacheAdapterConfig::transportOptions; unknown keys are ignored
struct MemcachedTransportOptions {
    size_t threads = 4;
    std::chrono::milliseconds connectTimeout{1000};
    std::chrono::milliseconds ioTimeout{1000};

    bool validate() const {
        return threads > 0 && connectTimeout.count() > 0 && ioTimeout.count() > 0;
    }

    // Throws std::invalid_argument on wrong types or invalid values.
    static MemcachedTransportOptions fromJson(const nlohmann::json& j);
};

// ITransportClient over the memcached ASCII protocol.
// One lazily (re)connected TCP socket per server; requests to the same server
// are serialized on that socket. Blocking I/O runs on an internal ThreadPool,
// so fetch()/store() return immediately. Keys are routed to
// servers[hash(key) % servers.size()].
class MemcachedTransport : public ITransportClient {
public:
    MemcachedTransport(const std::vector<std::string>& servers, const nlohmann::json& options);
    ~MemcachedTransport() override;
    MemcachedTransport(const MemcachedTransport&) = delete;
    MemcachedTransport& operator=(const MemcachedTransport&) = delete;

    void fetch(const std::string& key, FetchCallback callback) override;
    void store(const std::string& key, const std::string& value,
               std::int64_t ttlSeconds, StoreCallback callback) override;

    size_t serverCount() const { return connections_.size(); }
    const MemcachedTransportOptions& options() const { return options_; }

private:
    class ServerConnection;

    ServerConnection& route(const std::string& key);

    MemcachedTransportOptions options_;
    std::vector<std::unique_ptr<ServerConnection>> connections_;
    // Declared last: destroyed (and drained) before the connections it uses
    std::unique_ptr<thread::ThreadPool> pool_;
};

} // namespace transport
} // namespace memocache

#include "memocache/registry/ConnectionRegistry.hpp"
#include "memocache/logging/Logging.hpp"
#include "memocache/transport/MemcachedTransport.hpp"
#include <mutex>
#include <stdexcept>

namespace memocache {
namespace registry {

ConnectionRegistry::TransportFactory ConnectionRegistry::defaultFactory() {
    return [](const std::vector<std::string>& servers, const nlohmann::json& options) {
        return std::make_shared<transport::MemcachedTransport>(servers, options);
    };
}

ConnectionRegistry::ConnectionRegistry(TransportFactory factory)
    : factory_(std::move(factory))
    , timers_(std::make_shared<thread::TimerQueue>()) {
    if (!factory_) {
        throw std::invalid_argument("ConnectionRegistry: transport factory is empty");
    }
}

ConnectionRegistry::~ConnectionRegistry() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    logging::getLogger()->debug("ConnectionRegistry: releasing {} client(s)", clients_.size());
    clients_.clear();
}

std::shared_ptr<transport::ITransportClient> ConnectionRegistry::acquire(
    const adapter::CacheAdapterConfig& config, events::ILogSink& sink) {
    const std::string fingerprint = config.fingerprint();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = clients_.find(fingerprint);
        if (it != clients_.end()) {
            return it->second;
        }
    }

    std::shared_ptr<transport::ITransportClient> client;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        // Another thread may have registered it between the two locks
        auto it = clients_.find(fingerprint);
        if (it != clients_.end()) {
            return it->second;
        }
        client = factory_(config.servers, config.transportOptions);
        if (!client) {
            throw std::runtime_error("ConnectionRegistry: transport factory returned null");
        }
        clients_.emplace(fingerprint, client);
        logging::getLogger()->info("ConnectionRegistry: registered client #{} for {}",
                                   clients_.size(), fingerprint);
    }

    events::CacheEvent event{};
    event.type = events::EventType::Initialized;
    event.data = fingerprint;
    try {
        sink.log(event, nullptr);
    } catch (const std::exception& e) {
        logging::getLogger()->error("ConnectionRegistry: log sink threw on INITIALIZED: {}", e.what());
    }
    return client;
}

bool ConnectionRegistry::contains(const adapter::CacheAdapterConfig& config) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return clients_.find(config.fingerprint()) != clients_.end();
}

size_t ConnectionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return clients_.size();
}

} // namespace registry
} // namespace memocache

#include "memocache/adapter/CacheAdapter.hpp"
#include "memocache/key/KeyNormalizer.hpp"
#include "memocache/logging/Logging.hpp"
#include "memocache/serialization/JsonCodec.hpp"
#include "memocache/thread/TimerQueue.hpp"
#include "memocache/transport/ITransportClient.hpp"
#include <atomic>
#include <stdexcept>

namespace memocache {
namespace adapter {

using events::CacheEvent;
using events::EventType;
using events::Stopwatch;

namespace {

// One get() in flight. Both the deadline and the transport callback hold it;
// whichever wins tryResolve() owns the timers and the promise from then on.
struct PendingRead {
    Stopwatch totalTimer;
    Stopwatch networkTimer;
    std::string key;
    std::string normalizedKey;
    CacheAdapter::ContextPtr context;
    thread::TimerQueue::TimerId timerId = 0;
    std::promise<Result<nlohmann::json>> promise;
    std::atomic<bool> resolved{false};

    bool tryResolve() { return !resolved.exchange(true); }
};

struct PendingWrite {
    Stopwatch totalTimer;
    Stopwatch networkTimer;
    std::string key;
    std::string normalizedKey;
    std::string payload;
    std::int64_t ttlSeconds = 0;
    CacheAdapter::ContextPtr context;
    std::promise<Result<void>> promise;
    std::atomic<bool> resolved{false};

    bool tryResolve() { return !resolved.exchange(true); }
};

struct Counters {
    std::atomic<size_t> reads{0};
    std::atomic<size_t> hits{0};
    std::atomic<size_t> misses{0};
    std::atomic<size_t> timeouts{0};
    std::atomic<size_t> readErrors{0};
    std::atomic<size_t> parseFailures{0};
    std::atomic<size_t> writes{0};
    std::atomic<size_t> writesDone{0};
    std::atomic<size_t> writeErrors{0};
    std::atomic<size_t> writesFailed{0};
    std::atomic<size_t> stringifyFailures{0};
    std::atomic<size_t> skippedWrites{0};
};

template<typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

} // namespace

struct CacheAdapter::Impl {
    CacheAdapterConfig config;
    key::KeyNormalizer normalizer;
    std::shared_ptr<registry::ConnectionRegistry> registry;
    std::shared_ptr<events::ILogSink> sink;
    std::shared_ptr<transport::ITransportClient> client;
    std::shared_ptr<thread::TimerQueue> timers;
    Counters counters;

    Impl(const CacheAdapterConfig& cfg,
         std::shared_ptr<registry::ConnectionRegistry> reg,
         std::shared_ptr<events::ILogSink> logSink)
        : config(cfg)
        , normalizer(static_cast<std::uint64_t>(cfg.generation))
        , registry(std::move(reg))
        , sink(std::move(logSink)) {}

    void emit(const CacheEvent& event, const events::RequestContext* context) {
        try {
            sink->log(event, context);
        } catch (const std::exception& e) {
            logging::getLogger()->error("CacheAdapter: log sink threw on {}: {}",
                                        events::toString(event.type), e.what());
        }
    }

    CacheEvent makeEvent(EventType type, const std::string& key, const std::string& normalizedKey) const {
        CacheEvent event{};
        event.type = type;
        event.key = key;
        event.normalizedKey = normalizedKey;
        return event;
    }

    // ==================== get ====================

    void onReadTimeout(PendingRead& read) {
        if (!read.tryResolve()) {
            return;
        }
        CacheEvent event = makeEvent(EventType::ReadTimeout, read.key, read.normalizedKey);
        event.timers.network = read.networkTimer.stop();
        event.timers.total = read.totalTimer.stop();
        ++counters.timeouts;
        emit(event, read.context.get());
        read.promise.set_value(Result<nlohmann::json>::failure(
            CacheErrorKind::ReadTimeout,
            "read timed out after " + std::to_string(config.readTimeout.count()) + " ms"));
    }

    void onReadComplete(PendingRead& read,
                        const std::optional<std::string>& error,
                        const std::optional<std::string>& data) {
        // Late answer after the deadline fired: dropped
        if (!read.tryResolve()) {
            return;
        }
        const auto network = read.networkTimer.stop();
        if (read.timerId != 0) {
            timers->cancel(read.timerId);
        }

        if (error) {
            CacheEvent event = makeEvent(EventType::ReadError, read.key, read.normalizedKey);
            event.error = *error;
            event.timers.network = network;
            event.timers.total = read.totalTimer.stop();
            ++counters.readErrors;
            emit(event, read.context.get());
            read.promise.set_value(Result<nlohmann::json>::failure(CacheErrorKind::ReadError, *error));
            return;
        }

        if (!data || data->empty()) {
            CacheEvent event = makeEvent(EventType::ReadKeyNotFound, read.key, read.normalizedKey);
            event.timers.network = network;
            event.timers.total = read.totalTimer.stop();
            ++counters.misses;
            emit(event, read.context.get());
            read.promise.set_value(Result<nlohmann::json>::failure(CacheErrorKind::KeyNotFound, "key not found"));
            return;
        }

        auto parsed = serialization::JsonCodec::deserialize(*data);
        if (!parsed) {
            CacheEvent event = makeEvent(EventType::JsonParsingFailed, read.key, read.normalizedKey);
            event.data = *data;
            event.error = parsed.error().message;
            event.timers.network = network;
            event.timers.total = read.totalTimer.stop();
            ++counters.parseFailures;
            emit(event, read.context.get());
            read.promise.set_value(Result<nlohmann::json>::failure(
                CacheErrorKind::JsonParsingFailed, parsed.error().message));
            return;
        }

        CacheEvent event = makeEvent(EventType::ReadDone, read.key, read.normalizedKey);
        event.data = *data;
        event.timers.network = network;
        event.timers.total = read.totalTimer.stop();
        ++counters.hits;
        emit(event, read.context.get());
        read.promise.set_value(std::move(parsed));
    }

    // ==================== set ====================

    void onWriteComplete(PendingWrite& write, const std::optional<std::string>& error, bool stored) {
        if (!write.tryResolve()) {
            logging::getLogger()->error("CacheAdapter: transport completed write for '{}' twice", write.key);
            return;
        }
        const auto network = write.networkTimer.stop();
        const auto total = write.totalTimer.stop();

        if (error) {
            CacheEvent event = makeEvent(EventType::WriteError, write.key, write.normalizedKey);
            event.error = *error;
            event.ttlSeconds = write.ttlSeconds;
            event.timers.network = network;
            event.timers.total = total;
            ++counters.writeErrors;
            emit(event, write.context.get());
            write.promise.set_value(Result<void>::failure(CacheErrorKind::WriteError, *error));
        } else if (!stored) {
            CacheEvent event = makeEvent(EventType::WriteFailed, write.key, write.normalizedKey);
            event.ttlSeconds = write.ttlSeconds;
            event.timers.network = network;
            event.timers.total = total;
            ++counters.writesFailed;
            emit(event, write.context.get());
            write.promise.set_value(Result<void>::failure(CacheErrorKind::WriteFailed, "write not acknowledged"));
        } else {
            CacheEvent event = makeEvent(EventType::WriteDone, write.key, write.normalizedKey);
            event.data = write.payload;
            event.ttlSeconds = write.ttlSeconds;
            event.timers.network = network;
            event.timers.total = total;
            ++counters.writesDone;
            emit(event, write.context.get());
            write.promise.set_value(Result<void>::success());
        }
    }
};

CacheAdapter::CacheAdapter(const CacheAdapterConfig& config,
                           std::shared_ptr<registry::ConnectionRegistry> registry,
                           std::shared_ptr<events::ILogSink> sink) {
    const std::string error = config.validationError();
    if (!error.empty()) {
        throw std::invalid_argument("CacheAdapter: invalid configuration: " + error);
    }
    if (!registry) {
        throw std::invalid_argument("CacheAdapter: connection registry is null");
    }
    if (!sink) {
        sink = std::make_shared<events::NullLogSink>();
    }

    pImpl = std::make_shared<Impl>(config, std::move(registry), std::move(sink));
    pImpl->client = pImpl->registry->acquire(pImpl->config, *pImpl->sink);
    pImpl->timers = pImpl->registry->timers();
}

CacheAdapter::~CacheAdapter() = default;

std::future<Result<nlohmann::json>> CacheAdapter::get(const std::string& key, ContextPtr context) {
    auto read = std::make_shared<PendingRead>();
    read->key = key;
    read->normalizedKey = pImpl->normalizer.normalize(key);
    read->context = std::move(context);
    auto future = read->promise.get_future();

    ++pImpl->counters.reads;
    pImpl->emit(pImpl->makeEvent(EventType::ReadStart, read->key, read->normalizedKey), read->context.get());

    std::shared_ptr<Impl> impl = pImpl;
    read->networkTimer = Stopwatch();
    read->timerId = impl->timers->schedule(impl->config.readTimeout, [impl, read]() {
        impl->onReadTimeout(*read);
    });
    if (read->timerId == 0) {
        logging::getLogger()->warn("CacheAdapter: no read deadline for '{}', timer queue is shut down", key);
    }

    try {
        impl->client->fetch(read->normalizedKey,
            [impl, read](const std::optional<std::string>& error, const std::optional<std::string>& data) {
                impl->onReadComplete(*read, error, data);
            });
    } catch (const std::exception& e) {
        impl->onReadComplete(*read, std::string("transport fetch threw: ") + e.what(), std::nullopt);
    }
    return future;
}

std::future<Result<void>> CacheAdapter::set(const std::string& key, const nlohmann::json& value,
                                            std::optional<std::chrono::seconds> ttl, ContextPtr context) {
    if (value.is_discarded()) {
        ++pImpl->counters.skippedWrites;
        return readyFuture(Result<void>::success());
    }

    auto write = std::make_shared<PendingWrite>();
    write->key = key;
    write->normalizedKey = pImpl->normalizer.normalize(key);
    write->ttlSeconds = ttl.value_or(pImpl->config.defaultKeyTTL).count();
    write->context = std::move(context);

    ++pImpl->counters.writes;
    CacheEvent start = pImpl->makeEvent(EventType::WriteStart, write->key, write->normalizedKey);
    start.ttlSeconds = write->ttlSeconds;
    pImpl->emit(start, write->context.get());

    auto serialized = serialization::JsonCodec::serialize(value);
    if (!serialized) {
        CacheEvent event = pImpl->makeEvent(EventType::JsonStringifyFailed, write->key, write->normalizedKey);
        event.data = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        event.error = serialized.error().message;
        event.ttlSeconds = write->ttlSeconds;
        event.timers.total = write->totalTimer.stop();
        ++pImpl->counters.stringifyFailures;
        pImpl->emit(event, write->context.get());
        return readyFuture(Result<void>::failure(CacheErrorKind::JsonStringifyFailed, serialized.error().message));
    }
    write->payload = serialized.value();

    auto future = write->promise.get_future();
    std::shared_ptr<Impl> impl = pImpl;
    write->networkTimer = Stopwatch();
    try {
        impl->client->store(write->normalizedKey, write->payload, write->ttlSeconds,
            [impl, write](const std::optional<std::string>& error, bool stored) {
                impl->onWriteComplete(*write, error, stored);
            });
    } catch (const std::exception& e) {
        impl->onWriteComplete(*write, std::string("transport store threw: ") + e.what(), false);
    }
    return future;
}

std::string CacheAdapter::normalizeKey(const std::string& key) const {
    return pImpl->normalizer.normalize(key);
}

const CacheAdapterConfig& CacheAdapter::config() const {
    return pImpl->config;
}

AdapterMetrics CacheAdapter::getMetrics() const {
    const Counters& c = pImpl->counters;
    AdapterMetrics metrics;
    metrics.readCount = c.reads.load();
    metrics.hitCount = c.hits.load();
    metrics.missCount = c.misses.load();
    metrics.timeoutCount = c.timeouts.load();
    metrics.readErrorCount = c.readErrors.load();
    metrics.parseFailureCount = c.parseFailures.load();
    metrics.writeCount = c.writes.load();
    metrics.writeDoneCount = c.writesDone.load();
    metrics.writeErrorCount = c.writeErrors.load();
    metrics.writeFailedCount = c.writesFailed.load();
    metrics.stringifyFailureCount = c.stringifyFailures.load();
    metrics.skippedWriteCount = c.skippedWrites.load();
    return metrics;
}

} // namespace adapter
} // namespace memocache

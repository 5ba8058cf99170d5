#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "memocache/adapter/CacheAdapter.hpp"
#include "memocache/key/KeyNormalizer.hpp"

using namespace memocache;
using namespace std::chrono_literals;
using adapter::CacheAdapter;
using adapter::CacheAdapterConfig;
using adapter::CacheErrorKind;
using events::EventType;

namespace {

struct FetchReply {
    std::optional<std::string> error;
    std::optional<std::string> value;
    std::chrono::milliseconds delay{0};
};

struct StoreReply {
    std::optional<std::string> error;
    bool stored = true;
    std::chrono::milliseconds delay{0};
};

struct StoreCall {
    std::string key;
    std::string value;
    std::int64_t ttlSeconds;
};

// Scripted transport. Delayed replies are delivered from a helper thread,
// zero-delay replies inline before fetch()/store() returns.
class FakeTransport : public transport::ITransportClient {
public:
    ~FakeTransport() override { drain(); }

    void setDefaultFetch(FetchReply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultFetch_ = std::move(reply);
    }
    void setFetch(const std::string& normalizedKey, FetchReply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        fetches_[normalizedKey] = std::move(reply);
    }
    void setStore(StoreReply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        store_ = std::move(reply);
    }
    void throwOnFetch(bool value) { throwOnFetch_ = value; }

    void fetch(const std::string& key, FetchCallback callback) override {
        if (throwOnFetch_) {
            throw std::runtime_error("socket exploded");
        }
        FetchReply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            fetchKeys_.push_back(key);
            auto it = fetches_.find(key);
            reply = it != fetches_.end() ? it->second : defaultFetch_;
        }
        deliver(reply.delay, [callback, reply]() { callback(reply.error, reply.value); });
    }

    void store(const std::string& key, const std::string& value,
               std::int64_t ttlSeconds, StoreCallback callback) override {
        StoreReply reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stores_.push_back(StoreCall{key, value, ttlSeconds});
            reply = store_;
        }
        deliver(reply.delay, [callback, reply]() { callback(reply.error, reply.stored); });
    }

    // Waits for every delayed reply to be delivered
    void drain() {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            threads.swap(threads_);
        }
        for (auto& t : threads) {
            if (t.get_id() == std::this_thread::get_id()) {
                t.detach();
            } else {
                t.join();
            }
        }
    }

    std::vector<std::string> fetchKeys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetchKeys_;
    }
    std::vector<StoreCall> stores() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stores_;
    }

private:
    void deliver(std::chrono::milliseconds delay, std::function<void()> reply) {
        if (delay.count() == 0) {
            reply();
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        threads_.emplace_back([delay, reply]() {
            std::this_thread::sleep_for(delay);
            reply();
        });
    }

    mutable std::mutex mutex_;
    FetchReply defaultFetch_;
    std::map<std::string, FetchReply> fetches_;
    StoreReply store_;
    std::atomic<bool> throwOnFetch_{false};
    std::vector<std::string> fetchKeys_;
    std::vector<StoreCall> stores_;
    std::vector<std::thread> threads_;
};

struct RecordedEvent {
    events::CacheEvent event;
    std::string requestId; // empty without context
    bool hasContext;
};

class RecordingSink : public events::ILogSink {
public:
    void log(const events::CacheEvent& event, const events::RequestContext* context) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(RecordedEvent{event, context ? context->requestId : std::string(), context != nullptr});
    }

    std::vector<RecordedEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t count(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) {
            if (e.event.type == type) {
                ++n;
            }
        }
        return n;
    }

    std::vector<EventType> types() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EventType> result;
        for (const auto& e : events_) {
            result.push_back(e.event.type);
        }
        return result;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<RecordedEvent> events_;
};

class ThrowingSink : public events::ILogSink {
public:
    void log(const events::CacheEvent&, const events::RequestContext*) override {
        throw std::runtime_error("sink is broken");
    }
};

struct Fixture {
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<registry::ConnectionRegistry> registry;
    CacheAdapterConfig config;

    Fixture() {
        auto fake = transport;
        registry = std::make_shared<registry::ConnectionRegistry>(
            [fake](const std::vector<std::string>&, const nlohmann::json&) { return fake; });
        config.servers = {"h:11211"};
        config.generation = 1;
        config.readTimeout = 100ms;
    }

    ~Fixture() { transport->drain(); }
};

template<typename T>
bool isReady(std::future<T>& future, std::chrono::milliseconds wait = 0ms) {
    return future.wait_for(wait) == std::future_status::ready;
}

} // namespace

void smokeTestCacheAdapterReadDone() {
    std::cout << "Testing CacheAdapter get hit...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setFetch(cache.normalizeKey("user:42"), FetchReply{std::nullopt, std::string("{\"id\":42}"), 50ms});

    auto future = cache.get("user:42");
    auto result = future.get();
    assert(result.ok());
    assert(result.value() == nlohmann::json({{"id", 42}}));

    auto recorded = f.sink->events();
    assert(recorded.size() == 3);
    assert(recorded[0].event.type == EventType::Initialized);
    assert(recorded[1].event.type == EventType::ReadStart);
    assert(recorded[1].event.key == "user:42");
    assert(recorded[1].event.normalizedKey == key::KeyNormalizer::normalize("user:42", 1));
    const auto& done = recorded[2].event;
    assert(done.type == EventType::ReadDone);
    assert(done.data && *done.data == "{\"id\":42}");
    assert(done.timers.network && done.timers.total);
    assert(*done.timers.network >= 50ms);
    assert(*done.timers.total >= *done.timers.network);
    // The deadline was cancelled
    assert(f.registry->timers()->pending() == 0);

    auto metrics = cache.getMetrics();
    assert(metrics.readCount == 1);
    assert(metrics.hitCount == 1);
    assert(metrics.hitRate() == 1.0);

    std::cout << "[OK] CacheAdapter get hit test\n";
}

void testCacheAdapterReadTimeout() {
    std::cout << "Testing CacheAdapter read timeout...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setDefaultFetch(FetchReply{std::nullopt, std::string("{\"late\":true}"), 200ms});

    const auto start = std::chrono::steady_clock::now();
    auto future = cache.get("user:42");
    auto result = future.get();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    assert(result.is(CacheErrorKind::ReadTimeout));
    assert(elapsed >= 100ms);
    assert(elapsed < 190ms);
    assert(f.sink->count(EventType::ReadTimeout) == 1);

    const auto timeout = f.sink->events().back().event;
    assert(timeout.type == EventType::ReadTimeout);
    assert(timeout.timers.total && *timeout.timers.total >= 100ms);

    // The late answer changes nothing
    f.transport->drain();
    assert(f.sink->count(EventType::ReadDone) == 0);
    assert(f.sink->count(EventType::ReadTimeout) == 1);
    assert((f.sink->types() == std::vector<EventType>{
        EventType::Initialized, EventType::ReadStart, EventType::ReadTimeout}));
    assert(cache.getMetrics().timeoutCount == 1);
    assert(cache.getMetrics().hitCount == 0);

    std::cout << "[OK] CacheAdapter read timeout test\n";
}

void testCacheAdapterKeyNotFound() {
    std::cout << "Testing CacheAdapter miss...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setFetch(cache.normalizeKey("missing"), FetchReply{std::nullopt, std::nullopt, 10ms});
    f.transport->setFetch(cache.normalizeKey("empty"), FetchReply{std::nullopt, std::string(""), 0ms});

    auto missing = cache.get("missing").get();
    assert(!missing);
    assert(missing.is(CacheErrorKind::KeyNotFound));

    // An empty payload counts as a miss
    auto empty = cache.get("empty").get();
    assert(empty.is(CacheErrorKind::KeyNotFound));

    assert(f.sink->count(EventType::ReadKeyNotFound) == 2);
    assert(cache.getMetrics().missCount == 2);

    std::cout << "[OK] CacheAdapter miss test\n";
}

void testCacheAdapterFalsyValues() {
    std::cout << "Testing CacheAdapter falsy cached values...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setFetch(cache.normalizeKey("zero"), FetchReply{std::nullopt, std::string("0"), 0ms});
    f.transport->setFetch(cache.normalizeKey("no"), FetchReply{std::nullopt, std::string("false"), 0ms});
    f.transport->setFetch(cache.normalizeKey("nothing"), FetchReply{std::nullopt, std::string("null"), 0ms});

    assert(cache.get("zero").get().value() == 0);
    assert(cache.get("no").get().value() == false);
    assert(cache.get("nothing").get().value().is_null());
    assert(f.sink->count(EventType::ReadDone) == 3);

    std::cout << "[OK] CacheAdapter falsy cached values test\n";
}

void testCacheAdapterParsingFailed() {
    std::cout << "Testing CacheAdapter JSON parsing failure...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setFetch(cache.normalizeKey("bad"), FetchReply{std::nullopt, std::string("not-json"), 5ms});

    auto result = cache.get("bad").get();
    assert(result.is(CacheErrorKind::JsonParsingFailed));
    assert(!result.error().message.empty());

    const auto event = f.sink->events().back().event;
    assert(event.type == EventType::JsonParsingFailed);
    assert(event.data && *event.data == "not-json");
    assert(event.error && !event.error->empty());
    assert(cache.getMetrics().parseFailureCount == 1);

    std::cout << "[OK] CacheAdapter JSON parsing failure test\n";
}

void testCacheAdapterReadError() {
    std::cout << "Testing CacheAdapter read error...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setDefaultFetch(FetchReply{std::string("connection refused"), std::nullopt, 5ms});

    auto result = cache.get("k").get();
    assert(result.is(CacheErrorKind::ReadError));
    assert(result.error().message == "connection refused");
    const auto event = f.sink->events().back().event;
    assert(event.type == EventType::ReadError);
    assert(event.error && *event.error == "connection refused");

    // A transport that throws is reported the same way
    f.transport->throwOnFetch(true);
    auto thrown = cache.get("k").get();
    assert(thrown.is(CacheErrorKind::ReadError));
    assert(thrown.error().message.find("socket exploded") != std::string::npos);
    assert(f.sink->count(EventType::ReadError) == 2);
    assert(f.registry->timers()->pending() == 0);

    std::cout << "[OK] CacheAdapter read error test\n";
}

void testCacheAdapterSynchronousTransport() {
    std::cout << "Testing CacheAdapter with an inline transport answer...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setDefaultFetch(FetchReply{std::nullopt, std::string("[1,2]"), 0ms});

    auto future = cache.get("inline");
    assert(isReady(future));
    assert(future.get().value().size() == 2);
    assert(f.registry->timers()->pending() == 0);

    std::cout << "[OK] CacheAdapter inline transport answer test\n";
}

void testCacheAdapterWriteDone() {
    std::cout << "Testing CacheAdapter set...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setStore(StoreReply{std::nullopt, true, 10ms});

    auto result = cache.set("k", {{"a", 1}}, 30s).get();
    assert(result.ok());

    auto stores = f.transport->stores();
    assert(stores.size() == 1);
    assert(stores[0].key == cache.normalizeKey("k"));
    assert(stores[0].value == "{\"a\":1}");
    assert(stores[0].ttlSeconds == 30);

    auto recorded = f.sink->events();
    assert(recorded.size() == 3);
    assert(recorded[1].event.type == EventType::WriteStart);
    assert(recorded[1].event.ttlSeconds && *recorded[1].event.ttlSeconds == 30);
    const auto& done = recorded[2].event;
    assert(done.type == EventType::WriteDone);
    assert(done.data && *done.data == "{\"a\":1}");
    assert(done.ttlSeconds && *done.ttlSeconds == 30);
    assert(done.timers.network && done.timers.total);
    assert(*done.timers.network >= 10ms);

    // Without ttl the configured default applies
    cache.set("k2", nlohmann::json::array({1, 2, 3})).get();
    assert(f.transport->stores().back().ttlSeconds == 86400);

    auto metrics = cache.getMetrics();
    assert(metrics.writeCount == 2);
    assert(metrics.writeDoneCount == 2);

    std::cout << "[OK] CacheAdapter set test\n";
}

void testCacheAdapterWriteFailures() {
    std::cout << "Testing CacheAdapter write failures...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);

    f.transport->setStore(StoreReply{std::string("SERVER_ERROR out of memory"), false, 5ms});
    auto error = cache.set("k", 1).get();
    assert(error.is(CacheErrorKind::WriteError));
    assert(error.error().message == "SERVER_ERROR out of memory");
    assert(f.sink->events().back().event.type == EventType::WriteError);

    f.transport->setStore(StoreReply{std::nullopt, false, 0ms});
    auto failed = cache.set("k", 1).get();
    assert(failed.is(CacheErrorKind::WriteFailed));
    assert(f.sink->events().back().event.type == EventType::WriteFailed);

    auto metrics = cache.getMetrics();
    assert(metrics.writeErrorCount == 1);
    assert(metrics.writeFailedCount == 1);

    std::cout << "[OK] CacheAdapter write failures test\n";
}

void testCacheAdapterAbsentValue() {
    std::cout << "Testing CacheAdapter set with absent value...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.sink->clear();

    auto future = cache.set("k", CacheAdapter::absent());
    assert(isReady(future));
    assert(future.get().ok());
    assert(f.transport->stores().empty());
    assert(f.sink->events().empty());
    assert(cache.getMetrics().skippedWriteCount == 1);
    assert(cache.getMetrics().writeCount == 0);

    // null is a value, not absence
    cache.set("k", nullptr).get();
    assert(f.transport->stores().size() == 1);
    assert(f.transport->stores()[0].value == "null");

    std::cout << "[OK] CacheAdapter set with absent value test\n";
}

void testCacheAdapterStringifyFailed() {
    std::cout << "Testing CacheAdapter JSON stringify failure...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);

    auto future = cache.set("k", nlohmann::json(std::string("\xff\xfe")));
    assert(isReady(future));
    auto result = future.get();
    assert(result.is(CacheErrorKind::JsonStringifyFailed));
    assert(f.transport->stores().empty());

    const auto event = f.sink->events().back().event;
    assert(event.type == EventType::JsonStringifyFailed);
    assert(event.error && !event.error->empty());
    assert(event.timers.total);
    assert(!event.timers.network);
    assert(cache.getMetrics().stringifyFailureCount == 1);

    std::cout << "[OK] CacheAdapter JSON stringify failure test\n";
}

void testCacheAdapterRequestContext() {
    std::cout << "Testing CacheAdapter request context...\n";

    Fixture f;
    CacheAdapter cache(f.config, f.registry, f.sink);
    f.transport->setDefaultFetch(FetchReply{std::nullopt, std::nullopt, 5ms});
    f.sink->clear();

    auto context = std::make_shared<events::RequestContext>();
    context->requestId = "req-7";
    cache.get("k", context).get();
    cache.set("k", 1, std::nullopt, context).get();

    auto recorded = f.sink->events();
    assert(recorded.size() == 4);
    for (const auto& e : recorded) {
        assert(e.hasContext);
        assert(e.requestId == "req-7");
    }

    f.sink->clear();
    cache.get("k").get();
    for (const auto& e : f.sink->events()) {
        assert(!e.hasContext);
    }

    std::cout << "[OK] CacheAdapter request context test\n";
}

void testCacheAdapterGenerations() {
    std::cout << "Testing CacheAdapter generations...\n";

    Fixture f;
    auto second = f.config;
    second.generation = 2;
    CacheAdapter first(f.config, f.registry, f.sink);
    CacheAdapter bumped(second, f.registry, f.sink);

    assert(first.normalizeKey("user:1") == key::KeyNormalizer::normalize("user:1", 1));
    assert(bumped.normalizeKey("user:1") == key::KeyNormalizer::normalize("user:1", 2));
    assert(first.normalizeKey("user:1") != bumped.normalizeKey("user:1"));
    assert(first.normalizeKey("user:1").size() == key::KeyNormalizer::kNormalizedKeyLength);

    first.get("user:1").get();
    bumped.get("user:1").get();
    auto keys = f.transport->fetchKeys();
    assert(keys.size() == 2);
    assert(keys[0] != keys[1]);

    std::cout << "[OK] CacheAdapter generations test\n";
}

void testCacheAdapterExactlyOnce() {
    std::cout << "Testing CacheAdapter exactly-once settlement...\n";

    Fixture f;
    f.config.readTimeout = 20ms;
    CacheAdapter cache(f.config, f.registry, f.sink);
    // Answers land right around the deadline
    f.transport->setDefaultFetch(FetchReply{std::nullopt, std::string("1"), 20ms});
    f.sink->clear();

    const int reads = 64;
    std::vector<std::future<adapter::Result<nlohmann::json>>> futures;
    for (int i = 0; i < reads; ++i) {
        futures.push_back(cache.get("race:" + std::to_string(i)));
    }
    int hits = 0;
    int timeouts = 0;
    for (auto& future : futures) {
        auto result = future.get();
        if (result.ok()) {
            ++hits;
        } else {
            assert(result.is(CacheErrorKind::ReadTimeout));
            ++timeouts;
        }
    }
    f.transport->drain();

    assert(hits + timeouts == reads);
    assert(f.sink->count(EventType::ReadStart) == static_cast<size_t>(reads));
    assert(f.sink->count(EventType::ReadDone) == static_cast<size_t>(hits));
    assert(f.sink->count(EventType::ReadTimeout) == static_cast<size_t>(timeouts));
    auto metrics = cache.getMetrics();
    assert(metrics.hitCount + metrics.timeoutCount == static_cast<size_t>(reads));
    assert(f.registry->timers()->pending() == 0);

    std::cout << "[OK] CacheAdapter exactly-once settlement test\n";
}

void testCacheAdapterOutlivedByRead() {
    std::cout << "Testing CacheAdapter destroyed with a read in flight...\n";

    Fixture f;
    std::future<adapter::Result<nlohmann::json>> future;
    f.transport->setDefaultFetch(FetchReply{std::nullopt, std::string("{}"), 30ms});
    {
        CacheAdapter cache(f.config, f.registry, f.sink);
        future = cache.get("k");
    }
    assert(future.get().ok());
    assert(f.sink->count(EventType::ReadDone) == 1);

    std::cout << "[OK] CacheAdapter destroyed with a read in flight test\n";
}

void testCacheAdapterConstruction() {
    std::cout << "Testing CacheAdapter construction...\n";

    Fixture f;

    auto invalid = f.config;
    invalid.servers.clear();
    bool threw = false;
    try {
        CacheAdapter cache(invalid, f.registry, f.sink);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    invalid = f.config;
    invalid.generation = -3;
    threw = false;
    try {
        CacheAdapter cache(invalid, f.registry, f.sink);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        CacheAdapter cache(f.config, nullptr, f.sink);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    // Rejected configurations never reach the registry
    assert(f.registry->size() == 0);

    // No sink: events are dropped, operations still work
    f.transport->setDefaultFetch(FetchReply{std::nullopt, std::string("true"), 0ms});
    CacheAdapter quiet(f.config, f.registry);
    assert(quiet.get("k").get().value() == true);
    assert(quiet.config() == f.config);

    // A sink that throws does not break the adapter
    CacheAdapter noisy(f.config, f.registry, std::make_shared<ThrowingSink>());
    assert(noisy.get("k").get().value() == true);
    assert(noisy.set("k", 1).get().ok());

    std::cout << "[OK] CacheAdapter construction test\n";
}

int main() {
    try {
        smokeTestCacheAdapterReadDone();
        testCacheAdapterReadTimeout();
        testCacheAdapterKeyNotFound();
        testCacheAdapterFalsyValues();
        testCacheAdapterParsingFailed();
        testCacheAdapterReadError();
        testCacheAdapterSynchronousTransport();
        testCacheAdapterWriteDone();
        testCacheAdapterWriteFailures();
        testCacheAdapterAbsentValue();
        testCacheAdapterStringifyFailed();
        testCacheAdapterRequestContext();
        testCacheAdapterGenerations();
        testCacheAdapterExactlyOnce();
        testCacheAdapterOutlivedByRead();
        testCacheAdapterConstruction();
        std::cout << "All CacheAdapter tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "CacheAdapter test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    spdlog::shutdown();
    return 0;
}

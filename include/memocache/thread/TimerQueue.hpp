#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace memocache {
namespace thread {

// Single background thread firing one-shot callbacks at a deadline.
// Callbacks run on the timer thread and must be short; a callback that throws
// is logged and dropped. Timers still pending at shutdown() never fire.
class TimerQueue {
public:
    using TimerId = std::uint64_t;
    using Clock = std::chrono::steady_clock;

    TimerQueue();
    ~TimerQueue();
    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    // Returns 0 if the queue is shut down.
    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback);

    // True if the timer was pending and is now removed. False if it already
    // fired (or is firing) or was never scheduled.
    bool cancel(TimerId id);

    size_t pending() const;
    void shutdown();

private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Also held by the timer thread
};

} // namespace thread
} // namespace memocache

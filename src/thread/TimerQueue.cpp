#include "memocache/thread/TimerQueue.hpp"
#include "memocache/logging/Logging.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace memocache {
namespace thread {

struct TimerQueue::Impl {
    // Ordered by (deadline, id) so equal deadlines fire in scheduling order
    std::map<std::pair<Clock::time_point, TimerId>, std::function<void()>> timers;
    std::map<TimerId, Clock::time_point> deadlines;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::atomic<bool> stopping{false};
    TimerId nextId = 1;
    std::thread worker;

    void run() {
        std::unique_lock<std::mutex> lock(mutex);
        while (!stopping) {
            if (timers.empty()) {
                cv.wait(lock, [this] { return stopping.load() || !timers.empty(); });
                continue;
            }

            auto next = timers.begin();
            const auto deadline = next->first.first;
            if (Clock::now() < deadline) {
                // schedule()/cancel()/shutdown() may wake us early, head is re-checked
                cv.wait_until(lock, deadline);
                continue;
            }

            const TimerId id = next->first.second;
            auto callback = std::move(next->second);
            timers.erase(next);
            deadlines.erase(id);

            lock.unlock();
            try {
                callback();
            } catch (const std::exception& e) {
                logging::getLogger()->error("TimerQueue: timer {} callback threw: {}", id, e.what());
            }
            // May release the last owner of the TimerQueue itself
            callback = nullptr;
            lock.lock();
        }
    }
};

TimerQueue::TimerQueue()
    : pImpl(std::make_shared<Impl>()) {
    std::shared_ptr<Impl> impl = pImpl;
    pImpl->worker = std::thread([impl] { impl->run(); });
}

TimerQueue::~TimerQueue() {
    shutdown();
}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay, std::function<void()> callback) {
    const auto deadline = Clock::now() + delay;
    TimerId id = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping) {
            logging::getLogger()->warn("TimerQueue: schedule after shutdown");
            return 0;
        }
        id = pImpl->nextId++;
        pImpl->timers.emplace(std::make_pair(deadline, id), std::move(callback));
        pImpl->deadlines.emplace(id, deadline);
    }
    pImpl->cv.notify_one();
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    std::function<void()> dropped;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->deadlines.find(id);
    if (it == pImpl->deadlines.end()) {
        return false;
    }
    auto timer = pImpl->timers.find(std::make_pair(it->second, id));
    if (timer != pImpl->timers.end()) {
        dropped = std::move(timer->second);
        pImpl->timers.erase(timer);
    }
    pImpl->deadlines.erase(it);
    return true;
}

size_t TimerQueue::pending() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->timers.size();
}

void TimerQueue::shutdown() {
    std::map<std::pair<Clock::time_point, TimerId>, std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->stopping) {
            return;
        }
        pImpl->stopping = true;
        if (!pImpl->timers.empty()) {
            logging::getLogger()->debug("TimerQueue: dropping {} pending timers", pImpl->timers.size());
        }
        dropped.swap(pImpl->timers);
        pImpl->deadlines.clear();
    }
    pImpl->cv.notify_all();
    if (pImpl->worker.get_id() == std::this_thread::get_id()) {
        // Shut down from a callback; the thread holds Impl and exits on its own
        pImpl->worker.detach();
    } else if (pImpl->worker.joinable()) {
        pImpl->worker.join();
    }
}

} // namespace thread
} // namespace memocache

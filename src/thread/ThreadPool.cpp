#include "memocache/thread/ThreadPool.hpp"
#include "memocache/logging/Logging.hpp"
#include <stdexcept>

namespace memocache {
namespace thread {

struct ThreadPool::Impl {
    ThreadPoolConfig config;
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex queueMutex;
    std::condition_variable taskCv;
    std::condition_variable idleCv;
    std::atomic<bool> stopping{false};
    std::atomic<size_t> activeThreads{0};
    std::atomic<size_t> completedTasks{0};

    explicit Impl(const ThreadPoolConfig& cfg) : config(cfg) {}

    void workerLoop() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                taskCv.wait(lock, [this] { return stopping.load() || !tasks.empty(); });
                if (tasks.empty()) {
                    // stopping and drained
                    return;
                }
                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }

            try {
                task();
            } catch (const std::exception& e) {
                logging::getLogger()->error("ThreadPool[{}]: task threw: {}", config.name, e.what());
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex);
                --activeThreads;
                ++completedTasks;
                if (tasks.empty() && activeThreads == 0) {
                    idleCv.notify_all();
                }
            }
        }
    }
};

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : pImpl(std::make_shared<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("ThreadPool: invalid configuration");
    }
    const size_t count = config.minThreads;
    pImpl->workers.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        std::shared_ptr<Impl> impl = pImpl;
        pImpl->workers.emplace_back([impl] { impl->workerLoop(); });
    }
    logging::getLogger()->debug("ThreadPool[{}]: started {} workers", config.name, count);
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stopping) {
            logging::getLogger()->warn("ThreadPool[{}]: enqueue after stop", pImpl->config.name);
            return false;
        }
        if (pImpl->config.queueSize > 0 && pImpl->tasks.size() >= pImpl->config.queueSize) {
            logging::getLogger()->warn("ThreadPool[{}]: queue full ({} tasks)",
                                       pImpl->config.name, pImpl->tasks.size());
            return false;
        }
        pImpl->tasks.push(std::move(task));
    }
    pImpl->taskCv.notify_one();
    return true;
}

size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->activeThreads.load();
}

size_t ThreadPool::getThreadCount() const {
    return pImpl->workers.size();
}

size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.empty();
}

void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->idleCv.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads == 0;
    });
}

void ThreadPool::stop() {
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->stopping && pImpl->workers.empty()) {
            return;
        }
        pImpl->stopping = true;
    }
    pImpl->taskCv.notify_all();
    bool fromWorker = false;
    for (auto& worker : pImpl->workers) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // Stopped from one of our own tasks; the worker holds Impl and exits on return
            fromWorker = true;
            worker.detach();
        } else if (worker.joinable()) {
            worker.join();
        }
    }
    pImpl->workers.clear();

    if (fromWorker) {
        // Nothing may run after stop() returns, so drain what is left here
        std::queue<std::function<void()>> remaining;
        {
            std::lock_guard<std::mutex> lock(pImpl->queueMutex);
            remaining.swap(pImpl->tasks);
        }
        while (!remaining.empty()) {
            try {
                remaining.front()();
            } catch (const std::exception& e) {
                logging::getLogger()->error("ThreadPool[{}]: task threw: {}", pImpl->config.name, e.what());
            }
            remaining.pop();
            ++pImpl->completedTasks;
        }
    }
    logging::getLogger()->debug("ThreadPool[{}]: stopped, {} tasks completed",
                                pImpl->config.name, pImpl->completedTasks.load());
}

bool ThreadPool::isStopped() const {
    return pImpl->stopping.load();
}

ThreadPoolMetrics ThreadPool::getMetrics() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return ThreadPoolMetrics{
        pImpl->activeThreads.load(),
        pImpl->tasks.size(),
        pImpl->workers.size(),
        pImpl->completedTasks.load()
    };
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace memocache

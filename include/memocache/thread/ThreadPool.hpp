#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

namespace memocache {
namespace thread {

// Thread pool metrics snapshot
struct ThreadPoolMetrics {
    size_t activeThreads;    // Threads running a task
    size_t queueSize;        // Pending tasks
    size_t totalThreads;     // Worker count
    size_t completedTasks;   // Finished tasks
};

// Thread pool configuration
struct ThreadPoolConfig {
    size_t minThreads = 1;   // Workers started by the constructor
    size_t maxThreads = 4;   // Upper bound, must be >= minThreads
    size_t queueSize = 1024; // Max pending tasks, 0 = unbounded
    std::string name = "pool"; // Prefix for log messages

    bool validate() const {
        if (minThreads == 0) return false;
        if (minThreads > maxThreads) return false;
        return true;
    }
};

// Fixed-size worker pool. Tasks are run in FIFO order; a task that throws is
// logged and dropped, the worker keeps running.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config); // Starts minThreads workers
    ~ThreadPool(); // Drains the queue and joins workers
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false if the pool is stopped or the queue is full.
    bool enqueue(std::function<void()> task);
    size_t getActiveThreadCount() const; // Threads running a task
    size_t getThreadCount() const; // Worker count
    size_t getQueueSize() const; // Pending tasks
    bool isQueueEmpty() const;
    void waitForCompletion(); // Blocks until queue is empty and no task runs
    void stop(); // Finishes queued tasks, then joins workers
    bool isStopped() const;
    ThreadPoolMetrics getMetrics() const;
    ThreadPoolConfig getConfiguration() const;
private:
    struct Impl;
    std::shared_ptr<Impl> pImpl; // Also held by the workers
};

} // namespace thread
} // namespace memocache

#pragma once

#include <pmat/result.hpp>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace pmat::analysis {

// Fixed-size pool of worker threads draining one FIFO task queue.
// Tasks must not throw; the scheduler wraps analyzer calls itself.
class WorkerPool {
public:
    // 0 = hardware parallelism
    explicit WorkerPool(size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Conflict once shutdown() has been called
    Status enqueue(std::function<void()> task);

    // Finish queued tasks, then join the workers. Idempotent.
    void shutdown();

    size_t size() const { return workers_.size(); }
    size_t queued() const;

    static size_t default_size();

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
};

} // namespace pmat::analysis

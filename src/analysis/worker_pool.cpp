#include <pmat/analysis/worker_pool.hpp>

namespace pmat::analysis {

size_t WorkerPool::default_size() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 2 : n;
}

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) threads = default_size();
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

Status WorkerPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return PmatError{PmatError::Conflict, "worker pool is shut down"};
        }
        tasks_.push(std::move(task));
    }
    cv_.notify_one();
    return ok_status();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ && workers_.empty()) return;
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
}

size_t WorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace pmat::analysis

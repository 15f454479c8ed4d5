#pragma once

#include <pmat/analysis/analyzers.hpp>
#include <pmat/analysis/worker_pool.hpp>
#include <pmat/cancel.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pmat::analysis {

struct SchedulerStats {
    uint64_t computations = 0;   // analyzer runs, nested ones included
    uint64_t dedup_joins = 0;    // submits that attached to an in-flight job
    uint64_t cache_hits = 0;
    uint64_t skipped = 0;        // queued jobs dropped because every waiter left
};

// Runs analyses on a bounded pool. Results are cached by fingerprint and
// at most one computation per fingerprint is in flight; concurrent
// submitters of the same fingerprint share its result pointer.
class Scheduler {
public:
    Scheduler(const AnalyzerRegistry& registry, cache::CacheManager& caches, size_t workers);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Hash the inputs and derive the fingerprint, analyzer salt included.
    // NotFound when no analyzer is registered for kind.
    Result<AnalysisJob> prepare(AnalysisKind kind, const std::string& root,
                                std::vector<std::string> files,
                                const Json::Value& options) const;

    Result<ResultPtr> submit(AnalysisKind kind, const std::string& root,
                             std::vector<std::string> files, const Json::Value& options,
                             const CancelToken& cancel = CancelToken());

    // job must come from prepare(). The token only ends this caller's wait.
    Result<ResultPtr> submit_job(const AnalysisJob& job, const CancelToken& cancel = CancelToken());

    // Cache lookup, else compute on the calling thread. Used for nested
    // analyses so a worker never blocks on the queue it drains.
    Result<ResultPtr> run_inline(AnalysisJob job);

    SchedulerStats stats() const;
    const AnalyzerRegistry& registry() const { return registry_; }
    size_t workers() const { return pool_.size(); }

    void shutdown() { pool_.shutdown(); }

private:
    struct InFlight {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        bool started = false;
        bool abandoned = false;
        size_t waiters = 0;
        ResultPtr result;
        std::optional<PmatError> error;
    };

    Status finalize(AnalysisJob& job) const;
    Result<ResultPtr> execute(const AnalysisJob& job);
    void run_flight(const std::shared_ptr<InFlight>& flight, const AnalysisJob& job);
    Result<ResultPtr> await(const std::shared_ptr<InFlight>& flight, const CancelToken& cancel);
    void forget(const std::string& fingerprint, const std::shared_ptr<InFlight>& flight);

    const AnalyzerRegistry& registry_;
    cache::CacheManager& caches_;

    std::mutex inflight_mutex_;
    std::unordered_map<std::string, std::shared_ptr<InFlight>> inflight_;

    std::atomic<uint64_t> computations_{0};
    std::atomic<uint64_t> dedup_joins_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> skipped_{0};

    // Declared last: destroyed first, so queued tasks finish while the
    // members they touch are alive
    WorkerPool pool_;
};

} // namespace pmat::analysis

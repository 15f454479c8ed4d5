#include <pmat/analysis/scheduler.hpp>
#include <pmat/log.hpp>

#include <chrono>
#include <exception>

namespace pmat::analysis {

static const std::chrono::milliseconds WAIT_SLICE(50);

Scheduler::Scheduler(const AnalyzerRegistry& registry, cache::CacheManager& caches,
                     size_t workers)
    : registry_(registry), caches_(caches), pool_(workers) {}

Scheduler::~Scheduler() {
    pool_.shutdown();
}

Status Scheduler::finalize(AnalysisJob& job) const {
    const Analyzer* analyzer = registry_.find(job.kind);
    if (!analyzer) {
        return PmatError{PmatError::NotFound,
                         std::string("no analyzer registered for '") + kind_name(job.kind) + "'"};
    }
    auto salt = analyzer->fingerprint_salt(job);
    if (salt.is_err()) return std::move(salt).error();
    job.salt = std::move(salt).value();
    refresh_fingerprint(job);
    return ok_status();
}

Result<AnalysisJob> Scheduler::prepare(AnalysisKind kind, const std::string& root,
                                       std::vector<std::string> files,
                                       const Json::Value& options) const {
    if (!registry_.contains(kind)) {
        return PmatError{PmatError::NotFound,
                         std::string("no analyzer registered for '") + kind_name(kind) + "'"};
    }
    auto job = make_job(kind, root, std::move(files), options);
    if (job.is_err()) return job;
    PMAT_TRY(finalize(job.value()));
    return job;
}

Result<ResultPtr> Scheduler::submit(AnalysisKind kind, const std::string& root,
                                    std::vector<std::string> files, const Json::Value& options,
                                    const CancelToken& cancel) {
    auto job = prepare(kind, root, std::move(files), options);
    if (job.is_err()) return std::move(job).error();
    return submit_job(job.value(), cancel);
}

Result<ResultPtr> Scheduler::submit_job(const AnalysisJob& job, const CancelToken& cancel) {
    if (auto hit = caches_.analysis().get(job.fingerprint)) {
        cache_hits_++;
        log::debug("analysis %s: cache hit %.12s", kind_name(job.kind), job.fingerprint.c_str());
        return Result<ResultPtr>::ok(hit);
    }

    std::shared_ptr<InFlight> flight;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        auto it = inflight_.find(job.fingerprint);
        if (it != inflight_.end()) {
            std::lock_guard<std::mutex> flock(it->second->mutex);
            if (!it->second->abandoned) {
                it->second->waiters++;
                flight = it->second;
            }
        }
        if (!flight) {
            // A run that finished since the first lookup published before leaving inflight_
            if (auto hit = caches_.analysis().get(job.fingerprint, false)) {
                cache_hits_++;
                return Result<ResultPtr>::ok(hit);
            }
            flight = std::make_shared<InFlight>();
            flight->waiters = 1;
            inflight_[job.fingerprint] = flight;
            owner = true;
        }
    }

    if (!owner) {
        dedup_joins_++;
        log::debug("analysis %s: joined in-flight %.12s", kind_name(job.kind),
                   job.fingerprint.c_str());
    } else {
        auto st = pool_.enqueue([this, flight, job] { run_flight(flight, job); });
        if (st.is_err()) {
            forget(job.fingerprint, flight);
            {
                std::lock_guard<std::mutex> flock(flight->mutex);
                flight->done = true;
                flight->error = st.error();
            }
            flight->cv.notify_all();
            return std::move(st).error();
        }
    }
    return await(flight, cancel);
}

void Scheduler::forget(const std::string& fingerprint, const std::shared_ptr<InFlight>& flight) {
    std::lock_guard<std::mutex> lock(inflight_mutex_);
    auto it = inflight_.find(fingerprint);
    if (it != inflight_.end() && it->second == flight) inflight_.erase(it);
}

void Scheduler::run_flight(const std::shared_ptr<InFlight>& flight, const AnalysisJob& job) {
    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        if (flight->waiters == 0) {
            flight->abandoned = true;
        } else {
            flight->started = true;
        }
    }
    if (!flight->started) {
        skipped_++;
        log::debug("analysis %s: every waiter left, skipping", kind_name(job.kind));
        forget(job.fingerprint, flight);
        return;
    }

    auto result = execute(job);
    if (result.is_ok()) {
        auto st = caches_.analysis().put(job.fingerprint, result.value());
        if (st.is_err()) {
            log::warn("analysis cache write failed: %s", st.error().message.c_str());
        }
    }
    forget(job.fingerprint, flight);

    {
        std::lock_guard<std::mutex> lock(flight->mutex);
        if (result.is_ok()) {
            flight->result = result.value();
        } else {
            flight->error = result.error();
        }
        flight->done = true;
    }
    flight->cv.notify_all();
}

Result<ResultPtr> Scheduler::await(const std::shared_ptr<InFlight>& flight,
                                   const CancelToken& cancel) {
    std::unique_lock<std::mutex> lock(flight->mutex);
    while (!flight->done) {
        if (cancel.is_cancelled()) {
            flight->waiters--;
            if (flight->waiters == 0 && !flight->started) flight->abandoned = true;
            return PmatError(PmatError::Timeout,
                             cancel.deadline_passed() ? "deadline exceeded waiting for analysis"
                                                      : "analysis wait cancelled",
                             "the analysis keeps running for other waiters");
        }
        flight->cv.wait_for(lock, WAIT_SLICE);
    }
    flight->waiters--;
    if (flight->error) return *flight->error;
    return Result<ResultPtr>::ok(flight->result);
}

Result<ResultPtr> Scheduler::run_inline(AnalysisJob job) {
    PMAT_TRY(finalize(job));
    if (auto hit = caches_.analysis().get(job.fingerprint)) {
        cache_hits_++;
        return Result<ResultPtr>::ok(hit);
    }
    auto result = execute(job);
    if (result.is_err()) return result;
    auto st = caches_.analysis().put(job.fingerprint, result.value());
    if (st.is_err()) log::warn("analysis cache write failed: %s", st.error().message.c_str());
    return result;
}

Result<ResultPtr> Scheduler::execute(const AnalysisJob& job) {
    Analyzer* analyzer = registry_.find(job.kind);
    if (!analyzer) {
        return PmatError{PmatError::NotFound,
                         std::string("no analyzer registered for '") + kind_name(job.kind) + "'"};
    }
    computations_++;
    log::debug("analysis %s: computing over %zu files", kind_name(job.kind), job.files.size());

    AnalysisContext ctx(caches_, [this](const AnalysisJob& sub) { return run_inline(sub); });
    auto run = [&]() -> Result<Json::Value> {
        try {
            return analyzer->run(job, ctx);
        } catch (const std::exception& e) {
            return PmatError(PmatError::Internal,
                             std::string("analyzer ") + kind_name(job.kind) + " failed: " + e.what());
        } catch (...) {
            return PmatError(PmatError::Internal,
                             std::string("analyzer ") + kind_name(job.kind) +
                             " failed with a non-standard exception");
        }
    };
    auto out = run();
    if (out.is_err()) {
        log::debug("analysis %s failed: %s", kind_name(job.kind), out.error().message.c_str());
        return std::move(out).error();
    }
    return Result<ResultPtr>::ok(std::make_shared<const Json::Value>(std::move(out).value()));
}

SchedulerStats Scheduler::stats() const {
    SchedulerStats s;
    s.computations = computations_.load();
    s.dedup_joins = dedup_joins_.load();
    s.cache_hits = cache_hits_.load();
    s.skipped = skipped_.load();
    return s;
}

} // namespace pmat::analysis

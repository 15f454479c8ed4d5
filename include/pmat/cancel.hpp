#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace pmat {

using Clock = std::chrono::steady_clock;

// Cooperative cancellation bound to one caller. Copies share the flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    static CancelToken until(Clock::time_point deadline) {
        CancelToken t;
        t.deadline_ = deadline;
        return t;
    }

    static CancelToken after(std::chrono::milliseconds timeout) {
        return until(Clock::now() + timeout);
    }

    void cancel() { flag_->store(true); }

    bool is_cancelled() const {
        return flag_->load() || (deadline_ && Clock::now() >= *deadline_);
    }

    bool deadline_passed() const {
        return deadline_ && Clock::now() >= *deadline_;
    }

    const std::optional<Clock::time_point>& deadline() const { return deadline_; }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
    std::optional<Clock::time_point> deadline_;
};

} // namespace pmat

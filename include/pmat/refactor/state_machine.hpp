#pragma once

#include <pmat/refactor/metrics.hpp>
#include <pmat/refactor/refactor_config.hpp>
#include <pmat/result.hpp>
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pmat::refactor {

class SnapshotStore;

enum class Phase { Scan, Plan, Transform, Verify, Commit, Done, Failed };

const char* phase_name(Phase p);
std::optional<Phase> parse_phase(const std::string& s);
bool is_terminal(Phase p);

enum class TargetStatus { Pending, Measured, Transformed, Verified, Committed, Quarantined };

const char* target_status_name(TargetStatus s);
std::optional<TargetStatus> parse_target_status(const std::string& s);

struct TargetState {
    std::string path;
    TargetStatus status = TargetStatus::Pending;
    int baseline_complexity = -1;
    int baseline_longest = -1;
    int candidate_complexity = -1;
    std::string cause;   // why it was quarantined

    bool live() const { return status != TargetStatus::Quarantined; }
    bool operator==(const TargetState& o) const;
};

struct Batch {
    std::vector<size_t> targets;   // indices into the target list
    int retries = 0;
    bool conservative = false;
    bool operator==(const Batch& o) const {
        return targets == o.targets && retries == o.retries && conservative == o.conservative;
    }
};

struct HistoryEvent {
    int64_t at_ms = 0;
    Phase phase = Phase::Scan;
    std::string event;
    std::string detail;
};

// Collaborators of one advance step
struct RefactorDeps {
    MetricsProvider& metrics;
    SnapshotStore& store;
    CommitHook* commit_hook = nullptr;
};

struct AdvanceOutcome {
    Phase from = Phase::Scan;
    Phase to = Phase::Scan;
    bool changed = false;
    std::string event;
};

// Drives targets through Scan, Plan, Transform, Verify, Commit and Done.
// The phase never moves backwards except through reset(). Every advance
// ends with a durable snapshot; if that fails the step is undone.
class RefactorStateMachine {
public:
    RefactorStateMachine() = default;
    RefactorStateMachine(std::string session_id, std::vector<std::string> targets,
                         RefactorConfig config);

    static std::string new_session_id();

    // One unit of work. No-op on Done, Failed, or while paused.
    Result<AdvanceOutcome> advance(RefactorDeps& deps);

    // Clear the pause and restart the runtime budget
    void resume();

    // Back to Scan with every target pending; also durable via the caller
    void reset();

    // Terminal failure with a recorded cause
    void fail(const std::string& cause);

    const std::string& session_id() const { return session_id_; }
    const std::vector<std::string>& targets() const { return targets_; }
    const RefactorConfig& config() const { return config_; }
    Phase phase() const { return phase_; }
    bool paused() const { return paused_; }
    const std::string& pause_reason() const { return pause_reason_; }
    const std::vector<TargetState>& target_states() const { return status_; }
    const std::vector<Batch>& batches() const { return batches_; }
    size_t cursor() const { return cursor_; }
    int64_t started_at() const { return started_at_; }
    int64_t updated_at() const { return updated_at_; }
    const std::vector<HistoryEvent>& history() const { return history_; }

    size_t live_targets() const;
    size_t quarantined_targets() const;

    Json::Value to_json() const;
    static Result<RefactorStateMachine> from_json(const Json::Value& j);

    // Status view for protocol responses
    Json::Value status_json() const;

    static int64_t now_ms();

private:
    Status step(RefactorDeps& deps, AdvanceOutcome& out);
    Status scan(RefactorDeps& deps);
    void plan();
    Status transform_batch(RefactorDeps& deps);
    Status verify_batch(RefactorDeps& deps);
    Status commit_batch(RefactorDeps& deps);

    Status spill_batch(RefactorDeps& deps, const Batch& batch, bool& aborted);
    void quarantine(size_t index, const std::string& cause);
    void record(const std::string& event, const std::string& detail = "");
    void enter(Phase p);
    bool over_budget() const;

    std::string session_id_;
    std::vector<std::string> targets_;
    RefactorConfig config_;
    Phase phase_ = Phase::Scan;
    bool paused_ = false;
    std::string pause_reason_;
    std::vector<TargetState> status_;
    std::vector<Batch> batches_;
    size_t cursor_ = 0;
    int64_t started_at_ = 0;
    int64_t updated_at_ = 0;
    int64_t budget_started_at_ = 0;
    std::vector<HistoryEvent> history_;
};

} // namespace pmat::refactor

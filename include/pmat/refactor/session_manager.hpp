#pragma once

#include <pmat/refactor/snapshot_store.hpp>
#include <pmat/refactor/state_machine.hpp>
#include <pmat/result.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace pmat::refactor {

// Owns the single active refactor session. Snapshots on disk are the
// source of truth for every session that is not active.
class SessionManager {
public:
    SessionManager(MetricsProvider& metrics, CommitHook* commit_hook,
                   std::filesystem::path checkpoint_dir, RefactorConfig defaults);

    // Conflict while another session is running (neither Done nor Failed).
    // config holds overrides on top of the defaults.
    Result<RefactorStateMachine> start(const std::vector<std::string>& targets,
                                       const Json::Value& config = Json::Value(Json::objectValue));

    // One step. Conflict when an advance of the same session is running.
    Result<RefactorStateMachine> advance(const std::string& session_id);

    // Advance until terminal or paused
    Result<RefactorStateMachine> serve(const std::string& session_id);

    // Empty id = most recent snapshot
    Result<RefactorStateMachine> status(const std::string& session_id = "") const;

    // Releases the session and deletes its snapshot
    Status stop(const std::string& session_id);

    // Reload a snapshot, clear any pause and make it the active session
    Result<RefactorStateMachine> resume(const std::string& session_id = "");

    const SnapshotStore& store() const { return store_; }
    const RefactorConfig& defaults() const { return defaults_; }

private:
    struct Session {
        std::mutex step_mutex;
        RefactorStateMachine sm;
    };

    Result<std::shared_ptr<Session>> lookup(const std::string& session_id) const;

    MetricsProvider& metrics_;
    CommitHook* commit_hook_;
    SnapshotStore store_;
    RefactorConfig defaults_;

    mutable std::mutex mutex_;
    std::shared_ptr<Session> active_;
};

} // namespace pmat::refactor

#include <pmat/refactor/session_manager.hpp>
#include <pmat/log.hpp>

namespace pmat::refactor {

SessionManager::SessionManager(MetricsProvider& metrics, CommitHook* commit_hook,
                               std::filesystem::path checkpoint_dir, RefactorConfig defaults)
    : metrics_(metrics), commit_hook_(commit_hook), store_(std::move(checkpoint_dir)),
      defaults_(std::move(defaults)) {}

Result<RefactorStateMachine> SessionManager::start(const std::vector<std::string>& targets,
                                                   const Json::Value& config) {
    auto cfg = RefactorConfig::from_json(config, defaults_);
    if (cfg.is_err()) return std::move(cfg).error();

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_) {
        std::lock_guard<std::mutex> step(active_->step_mutex);
        if (!is_terminal(active_->sm.phase())) {
            return PmatError(PmatError::Conflict,
                             "refactor session " + active_->sm.session_id() + " is still running",
                             "stop it first, or wait until it is done");
        }
    }

    auto session = std::make_shared<Session>();
    session->sm = RefactorStateMachine(RefactorStateMachine::new_session_id(), targets,
                                       cfg.value());
    PMAT_TRY(store_.save(session->sm));
    log::info("refactor session %s started with %zu targets",
              session->sm.session_id().c_str(), targets.size());
    active_ = session;
    return Result<RefactorStateMachine>::ok(session->sm);
}

Result<std::shared_ptr<SessionManager::Session>>
SessionManager::lookup(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_ || active_->sm.session_id() != session_id) {
        return PmatError(PmatError::NotFound, "no active refactor session '" + session_id + "'",
                         "use refactor.resume to reload a saved session");
    }
    return Result<std::shared_ptr<Session>>::ok(active_);
}

Result<RefactorStateMachine> SessionManager::advance(const std::string& session_id) {
    auto session = lookup(session_id);
    if (session.is_err()) return std::move(session).error();

    std::unique_lock<std::mutex> step(session.value()->step_mutex, std::try_to_lock);
    if (!step.owns_lock()) {
        return PmatError(PmatError::Conflict,
                         "an advance of session " + session_id + " is already running");
    }
    RefactorDeps deps{metrics_, store_, commit_hook_};
    auto out = session.value()->sm.advance(deps);
    if (out.is_err()) return std::move(out).error();
    log::debug("refactor %s: %s -> %s (%s)", session_id.c_str(), phase_name(out.value().from),
               phase_name(out.value().to), out.value().event.c_str());
    return Result<RefactorStateMachine>::ok(session.value()->sm);
}

Result<RefactorStateMachine> SessionManager::serve(const std::string& session_id) {
    for (;;) {
        auto sm = advance(session_id);
        if (sm.is_err()) return sm;
        if (is_terminal(sm.value().phase()) || sm.value().paused()) return sm;
    }
}

Result<RefactorStateMachine> SessionManager::status(const std::string& session_id) const {
    std::string id = session_id;
    if (id.empty()) {
        auto latest = store_.latest();
        if (latest.is_err()) return std::move(latest).error();
        id = latest.value();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_ && active_->sm.session_id() == id) {
            std::lock_guard<std::mutex> step(active_->step_mutex);
            return Result<RefactorStateMachine>::ok(active_->sm);
        }
    }
    return store_.load(id);
}

Status SessionManager::stop(const std::string& session_id) {
    PMAT_TRY(SnapshotStore::check_id(session_id));
    std::lock_guard<std::mutex> lock(mutex_);
    bool was_active = active_ && active_->sm.session_id() == session_id;
    if (!was_active && !std::filesystem::exists(store_.path_for(session_id))) {
        return PmatError(PmatError::NotFound, "no refactor session '" + session_id + "'");
    }
    if (was_active) {
        std::shared_ptr<Session> session = active_;
        std::lock_guard<std::mutex> step(session->step_mutex);
        PMAT_TRY(store_.remove(session_id));
        active_.reset();
    } else {
        PMAT_TRY(store_.remove(session_id));
    }
    log::info("refactor session %s stopped", session_id.c_str());
    return ok_status();
}

Result<RefactorStateMachine> SessionManager::resume(const std::string& session_id) {
    std::string id = session_id;
    if (id.empty()) {
        auto latest = store_.latest();
        if (latest.is_err()) return std::move(latest).error();
        id = latest.value();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && active_->sm.session_id() != id) {
        std::lock_guard<std::mutex> step(active_->step_mutex);
        if (!is_terminal(active_->sm.phase())) {
            return PmatError(PmatError::Conflict,
                             "refactor session " + active_->sm.session_id() + " is still running");
        }
    }

    auto loaded = store_.load(id);
    if (loaded.is_err()) return std::move(loaded).error();

    auto session = std::make_shared<Session>();
    session->sm = std::move(loaded).value();
    if (session->sm.paused()) {
        session->sm.resume();
        PMAT_TRY(store_.save(session->sm));
    }
    log::info("refactor session %s resumed in phase %s", id.c_str(),
              phase_name(session->sm.phase()));
    active_ = session;
    return Result<RefactorStateMachine>::ok(session->sm);
}

} // namespace pmat::refactor

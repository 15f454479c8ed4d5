#include <pmat/refactor/state_machine.hpp>
#include <pmat/analysis/source_scan.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>
#include <pmat/refactor/snapshot_store.hpp>
#include <pmat/refactor/transformer.hpp>
#include <pmat/render.hpp>
#include <pmat/uuid.hpp>

#include <chrono>
#include <cstdio>
#include <limits>

namespace fs = std::filesystem;

namespace pmat::refactor {

const char* phase_name(Phase p) {
    switch (p) {
        case Phase::Scan: return "scan";
        case Phase::Plan: return "plan";
        case Phase::Transform: return "transform";
        case Phase::Verify: return "verify";
        case Phase::Commit: return "commit";
        case Phase::Done: return "done";
        case Phase::Failed: return "failed";
    }
    return "failed";
}

std::optional<Phase> parse_phase(const std::string& s) {
    for (Phase p : {Phase::Scan, Phase::Plan, Phase::Transform, Phase::Verify, Phase::Commit,
                    Phase::Done, Phase::Failed}) {
        if (s == phase_name(p)) return p;
    }
    return std::nullopt;
}

bool is_terminal(Phase p) {
    return p == Phase::Done || p == Phase::Failed;
}

const char* target_status_name(TargetStatus s) {
    switch (s) {
        case TargetStatus::Pending: return "pending";
        case TargetStatus::Measured: return "measured";
        case TargetStatus::Transformed: return "transformed";
        case TargetStatus::Verified: return "verified";
        case TargetStatus::Committed: return "committed";
        case TargetStatus::Quarantined: return "quarantined";
    }
    return "pending";
}

std::optional<TargetStatus> parse_target_status(const std::string& s) {
    for (TargetStatus t : {TargetStatus::Pending, TargetStatus::Measured, TargetStatus::Transformed,
                           TargetStatus::Verified, TargetStatus::Committed,
                           TargetStatus::Quarantined}) {
        if (s == target_status_name(t)) return t;
    }
    return std::nullopt;
}

bool TargetState::operator==(const TargetState& o) const {
    return path == o.path && status == o.status && baseline_complexity == o.baseline_complexity &&
           baseline_longest == o.baseline_longest &&
           candidate_complexity == o.candidate_complexity && cause == o.cause;
}

int64_t RefactorStateMachine::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string RefactorStateMachine::new_session_id() {
    return "refactor-session-" + Uuid::v4().to_string();
}

RefactorStateMachine::RefactorStateMachine(std::string session_id, std::vector<std::string> targets,
                                           RefactorConfig config)
    : session_id_(std::move(session_id)), targets_(std::move(targets)), config_(std::move(config)) {
    for (const auto& t : targets_) {
        TargetState s;
        s.path = t;
        status_.push_back(std::move(s));
    }
    started_at_ = updated_at_ = budget_started_at_ = now_ms();
    record("started", std::to_string(targets_.size()) + " targets");
}

size_t RefactorStateMachine::live_targets() const {
    size_t n = 0;
    for (const auto& s : status_) n += s.live() ? 1 : 0;
    return n;
}

size_t RefactorStateMachine::quarantined_targets() const {
    return status_.size() - live_targets();
}

void RefactorStateMachine::record(const std::string& event, const std::string& detail) {
    history_.push_back({now_ms(), phase_, event, detail});
}

void RefactorStateMachine::enter(Phase p) {
    log::info("refactor %s: %s -> %s", session_id_.c_str(), phase_name(phase_), phase_name(p));
    phase_ = p;
    cursor_ = 0;
    record("enter", phase_name(p));
}

void RefactorStateMachine::quarantine(size_t index, const std::string& cause) {
    status_[index].status = TargetStatus::Quarantined;
    status_[index].cause = cause;
    record("quarantine", status_[index].path + ": " + cause);
    log::warn("refactor %s: quarantined %s: %s", session_id_.c_str(),
              status_[index].path.c_str(), cause.c_str());
}

bool RefactorStateMachine::over_budget() const {
    if (config_.max_runtime_secs <= 0) return false;
    return now_ms() - budget_started_at_ > config_.max_runtime_secs * 1000;
}

void RefactorStateMachine::resume() {
    paused_ = false;
    pause_reason_.clear();
    budget_started_at_ = now_ms();
    updated_at_ = budget_started_at_;
    record("resumed");
}

void RefactorStateMachine::reset() {
    phase_ = Phase::Scan;
    paused_ = false;
    pause_reason_.clear();
    cursor_ = 0;
    batches_.clear();
    for (auto& s : status_) {
        std::string path = s.path;
        s = TargetState();
        s.path = path;
    }
    budget_started_at_ = updated_at_ = now_ms();
    record("reset");
}

void RefactorStateMachine::fail(const std::string& cause) {
    phase_ = Phase::Failed;
    updated_at_ = now_ms();
    record("failed", cause);
}

// ---------------------------------------------------------------------------
// advance
// ---------------------------------------------------------------------------

Result<AdvanceOutcome> RefactorStateMachine::advance(RefactorDeps& deps) {
    AdvanceOutcome out;
    out.from = out.to = phase_;
    if (is_terminal(phase_) || paused_) {
        out.event = paused_ ? "paused" : "terminal";
        return Result<AdvanceOutcome>::ok(out);
    }

    RefactorStateMachine before = *this;
    if (over_budget()) {
        paused_ = true;
        pause_reason_ = "max_runtime_secs exceeded";
        record("paused", pause_reason_);
        out.event = "paused";
    } else {
        auto st = step(deps, out);
        if (st.is_err()) {
            *this = std::move(before);
            return std::move(st).error();
        }
    }
    updated_at_ = now_ms();
    out.to = phase_;
    out.changed = true;

    auto saved = deps.store.save(*this);
    if (saved.is_err()) {
        *this = std::move(before);
        PmatError e = PmatError::io("snapshot write failed; step rolled back", true);
        e.hint = "the session state is unchanged and advance can be retried";
        e.with_cause(saved.error());
        return e;
    }
    return Result<AdvanceOutcome>::ok(out);
}

Status RefactorStateMachine::step(RefactorDeps& deps, AdvanceOutcome& out) {
    switch (phase_) {
        case Phase::Scan:
            out.event = "scan";
            return scan(deps);
        case Phase::Plan:
            out.event = "plan";
            plan();
            return ok_status();
        case Phase::Transform:
            out.event = "transform";
            return transform_batch(deps);
        case Phase::Verify:
            out.event = "verify";
            return verify_batch(deps);
        case Phase::Commit:
            out.event = "commit";
            return commit_batch(deps);
        case Phase::Done:
        case Phase::Failed:
            break;
    }
    return ok_status();
}

Status RefactorStateMachine::scan(RefactorDeps& deps) {
    for (size_t i = 0; i < status_.size(); ++i) {
        auto& t = status_[i];
        if (!t.live()) continue;
        auto m = deps.metrics.measure(t.path);
        if (m.is_err()) {
            quarantine(i, m.error().message);
            continue;
        }
        t.baseline_complexity = m.value().max_cyclomatic;
        t.baseline_longest = m.value().longest_function;
        t.status = TargetStatus::Measured;
    }
    enter(live_targets() == 0 ? Phase::Done : Phase::Plan);
    return ok_status();
}

void RefactorStateMachine::plan() {
    batches_.clear();
    Batch current;
    for (size_t i = 0; i < status_.size(); ++i) {
        if (!status_[i].live()) continue;
        current.targets.push_back(i);
        if (current.targets.size() >= static_cast<size_t>(config_.batch_size)) {
            batches_.push_back(std::move(current));
            current = Batch();
        }
    }
    if (!current.targets.empty()) batches_.push_back(std::move(current));
    record("planned", std::to_string(batches_.size()) + " batches");
    enter(batches_.empty() ? Phase::Done : Phase::Transform);
}

static Result<std::string> read_all(const std::string& path) {
    return analysis::read_file(path);
}

static fs::path candidate_path(const fs::path& spill, size_t index, const std::string& target) {
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "%05zu-", index);
    return spill / (prefix + fs::path(target).filename().string());
}

// Candidates for one batch, or aborted when the working set is over the limit
Status RefactorStateMachine::spill_batch(RefactorDeps& deps, const Batch& batch, bool& aborted) {
    aborted = false;
    TransformOptions opts;
    opts.remove_satd = config_.remove_satd;
    opts.conservative = batch.conservative;

    struct Pending {
        size_t index;
        std::string content;
    };
    std::vector<Pending> pending;
    uint64_t working_set = 0;
    uint64_t limit = static_cast<uint64_t>(config_.memory_limit_mb) * 1024 * 1024;

    for (size_t idx : batch.targets) {
        if (!status_[idx].live()) continue;
        auto original = read_all(status_[idx].path);
        if (original.is_err()) {
            quarantine(idx, original.error().message);
            continue;
        }
        Candidate c = transform_source(status_[idx].path, original.value(), opts);
        working_set += original.value().size() + c.content.size();
        if (working_set > limit) {
            aborted = true;
            return ok_status();
        }
        pending.push_back({idx, std::move(c.content)});
    }

    fs::path spill = deps.store.spill_dir(session_id_);
    for (auto& p : pending) {
        PMAT_TRY(write_file_atomic(candidate_path(spill, p.index, status_[p.index].path), p.content));
        status_[p.index].status = TargetStatus::Transformed;
    }
    return ok_status();
}

Status RefactorStateMachine::transform_batch(RefactorDeps& deps) {
    if (cursor_ >= batches_.size()) {
        enter(Phase::Verify);
        return ok_status();
    }
    Batch batch = batches_[cursor_];
    bool aborted = false;
    PMAT_TRY(spill_batch(deps, batch, aborted));

    if (aborted) {
        record("resource_exhausted", "batch " + std::to_string(cursor_) + " over " +
               std::to_string(config_.memory_limit_mb) + " MB");
        if (batch.targets.size() == 1) {
            quarantine(batch.targets[0], "working set exceeds memory_limit_mb");
            cursor_++;
        } else {
            size_t half = batch.targets.size() / 2;
            Batch a = batch;
            Batch b = batch;
            a.targets.assign(batch.targets.begin(), batch.targets.begin() + half);
            b.targets.assign(batch.targets.begin() + half, batch.targets.end());
            batches_[cursor_] = std::move(a);
            batches_.insert(batches_.begin() + static_cast<std::ptrdiff_t>(cursor_) + 1, std::move(b));
            record("split", "batch " + std::to_string(cursor_) + " into " +
                   std::to_string(half) + " + " + std::to_string(batch.targets.size() - half));
        }
    } else {
        cursor_++;
    }
    if (cursor_ >= batches_.size()) enter(Phase::Verify);
    return ok_status();
}

Status RefactorStateMachine::verify_batch(RefactorDeps& deps) {
    if (cursor_ >= batches_.size()) {
        enter(Phase::Commit);
        return ok_status();
    }
    Batch& batch = batches_[cursor_];
    fs::path spill = deps.store.spill_dir(session_id_);

    struct Measured {
        size_t index;
        FileMetrics metrics;
    };
    std::vector<Measured> measured;
    bool regressed = false;
    for (size_t idx : batch.targets) {
        if (status_[idx].status != TargetStatus::Transformed) continue;
        auto m = deps.metrics.measure(candidate_path(spill, idx, status_[idx].path).string());
        if (m.is_err()) {
            quarantine(idx, "cannot measure candidate: " + m.error().message);
            continue;
        }
        if (m.value().max_cyclomatic > status_[idx].baseline_complexity) regressed = true;
        measured.push_back({idx, m.value()});
    }

    if (regressed) {
        batch.retries++;
        record("regression", "batch " + std::to_string(cursor_) + " attempt " +
               std::to_string(batch.retries));
        std::error_code ec;
        for (const auto& m : measured) {
            fs::remove(candidate_path(spill, m.index, status_[m.index].path), ec);
            status_[m.index].status = TargetStatus::Measured;
        }
        if (batch.retries > config_.max_batch_retries) {
            for (const auto& m : measured) quarantine(m.index, "complexity regression after retries");
            cursor_++;
        } else {
            batch.conservative = true;
            bool aborted = false;
            PMAT_TRY(spill_batch(deps, batch, aborted));
            if (aborted) {
                for (size_t idx : batch.targets) {
                    if (status_[idx].live()) quarantine(idx, "working set exceeds memory_limit_mb");
                }
                cursor_++;
            }
        }
    } else {
        for (const auto& m : measured) {
            auto& t = status_[m.index];
            t.candidate_complexity = m.metrics.max_cyclomatic;
            if (m.metrics.max_cyclomatic > config_.target_complexity) {
                quarantine(m.index, "complexity " + std::to_string(m.metrics.max_cyclomatic) +
                           " exceeds target " + std::to_string(config_.target_complexity));
            } else if (m.metrics.longest_function > config_.max_function_lines) {
                quarantine(m.index, "function of " + std::to_string(m.metrics.longest_function) +
                           " lines exceeds " + std::to_string(config_.max_function_lines));
            } else {
                t.status = TargetStatus::Verified;
            }
        }
        cursor_++;
    }
    if (cursor_ >= batches_.size()) enter(Phase::Commit);
    return ok_status();
}

Status RefactorStateMachine::commit_batch(RefactorDeps& deps) {
    if (cursor_ >= batches_.size()) {
        enter(Phase::Done);
        return ok_status();
    }
    const Batch& batch = batches_[cursor_];
    fs::path spill = deps.store.spill_dir(session_id_);

    std::vector<std::string> written;
    for (size_t idx : batch.targets) {
        auto& t = status_[idx];
        if (t.status != TargetStatus::Verified) continue;
        if (!config_.dry_run) {
            auto content = read_all(candidate_path(spill, idx, t.path).string());
            if (content.is_err()) {
                quarantine(idx, "candidate lost: " + content.error().message);
                continue;
            }
            auto st = write_file_atomic(t.path, content.value());
            if (st.is_err()) {
                quarantine(idx, "cannot write target: " + st.error().message);
                continue;
            }
            written.push_back(t.path);
        }
        t.status = TargetStatus::Committed;
    }

    if (!written.empty() && !config_.auto_commit_template.empty() && deps.commit_hook) {
        RenderVars vars = {
            {"session_id", session_id_},
            {"batch", std::to_string(cursor_ + 1)},
            {"batches", std::to_string(batches_.size())},
            {"files", std::to_string(written.size())},
        };
        auto message = render_template(config_.auto_commit_template, vars);
        if (message.is_err()) {
            record("commit_hook_failed", message.error().message);
            log::warn("refactor %s: bad commit template: %s", session_id_.c_str(),
                      message.error().message.c_str());
        } else {
            auto st = deps.commit_hook->commit(written, message.value());
            if (st.is_err()) {
                record("commit_hook_failed", st.error().message);
                log::warn("refactor %s: auto-commit failed: %s", session_id_.c_str(),
                          st.error().message.c_str());
            } else {
                record("committed", message.value());
            }
        }
    }
    record("batch_complete", std::to_string(cursor_) + (config_.dry_run ? " (dry run)" : ""));
    cursor_++;
    if (cursor_ >= batches_.size()) enter(Phase::Done);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

Json::Value RefactorStateMachine::to_json() const {
    Json::Value j(Json::objectValue);
    j["session_id"] = session_id_;
    j["targets"] = json::string_array(targets_);
    j["config"] = config_.to_json();
    j["current_phase"] = phase_name(phase_);
    j["paused"] = paused_;
    j["pause_reason"] = pause_reason_;
    j["cursor"] = static_cast<Json::UInt64>(cursor_);
    j["started_at"] = Json::Int64(started_at_);
    j["updated_at"] = Json::Int64(updated_at_);
    j["budget_started_at"] = Json::Int64(budget_started_at_);

    Json::Value status(Json::arrayValue);
    for (const auto& t : status_) {
        Json::Value s(Json::objectValue);
        s["path"] = t.path;
        s["status"] = target_status_name(t.status);
        s["baseline_complexity"] = t.baseline_complexity;
        s["baseline_longest"] = t.baseline_longest;
        s["candidate_complexity"] = t.candidate_complexity;
        s["cause"] = t.cause;
        status.append(s);
    }
    j["per_target_status"] = status;

    Json::Value batches(Json::arrayValue);
    for (const auto& b : batches_) {
        Json::Value bj(Json::objectValue);
        Json::Value ts(Json::arrayValue);
        for (size_t idx : b.targets) ts.append(static_cast<Json::UInt64>(idx));
        bj["targets"] = ts;
        bj["retries"] = b.retries;
        bj["conservative"] = b.conservative;
        batches.append(bj);
    }
    j["batches"] = batches;

    Json::Value history(Json::arrayValue);
    for (const auto& h : history_) {
        Json::Value hj(Json::objectValue);
        hj["at"] = Json::Int64(h.at_ms);
        hj["phase"] = phase_name(h.phase);
        hj["event"] = h.event;
        hj["detail"] = h.detail;
        history.append(hj);
    }
    j["history"] = history;
    return j;
}

Result<RefactorStateMachine> RefactorStateMachine::from_json(const Json::Value& j) {
    RefactorStateMachine sm;
    auto id = json::require_string(j, "session_id");
    if (id.is_err()) return std::move(id).error();
    sm.session_id_ = id.value();

    auto targets = json::get_string_list(j, "targets");
    if (targets.is_err()) return std::move(targets).error();
    sm.targets_ = targets.value();

    // Worker count was checked when the session started
    auto config = RefactorConfig::from_json(j["config"], RefactorConfig(),
                                            std::numeric_limits<size_t>::max());
    if (config.is_err()) return std::move(config).error();
    sm.config_ = config.value();

    if (!j["current_phase"].isString()) {
        return PmatError::validation("current_phase", "must be a string");
    }
    auto phase = parse_phase(j["current_phase"].asString());
    if (!phase) return PmatError::validation("current_phase", "unknown phase");
    if (!j["cursor"].isNull() && !j["cursor"].isUInt64()) {
        return PmatError::validation("cursor", "must be a non-negative integer");
    }
    sm.phase_ = *phase;
    sm.paused_ = j["paused"].asBool();
    sm.pause_reason_ = j["pause_reason"].asString();
    sm.cursor_ = static_cast<size_t>(j["cursor"].asUInt64());
    sm.started_at_ = j["started_at"].asInt64();
    sm.updated_at_ = j["updated_at"].asInt64();
    sm.budget_started_at_ = j["budget_started_at"].asInt64();

    const Json::Value& status = j["per_target_status"];
    if (!status.isArray() || status.size() != sm.targets_.size()) {
        return PmatError::validation("per_target_status", "does not match targets");
    }
    for (const auto& s : status) {
        if (!s.isObject()) return PmatError::validation("per_target_status", "entry is not an object");
        TargetState t;
        t.path = s["path"].asString();
        auto st = parse_target_status(s["status"].asString());
        if (!st) return PmatError::validation("per_target_status", "unknown status");
        t.status = *st;
        t.baseline_complexity = s["baseline_complexity"].asInt();
        t.baseline_longest = s["baseline_longest"].asInt();
        t.candidate_complexity = s["candidate_complexity"].asInt();
        t.cause = s["cause"].asString();
        sm.status_.push_back(std::move(t));
    }

    const Json::Value& batches = j["batches"];
    if (!batches.isNull() && !batches.isArray()) {
        return PmatError::validation("batches", "must be an array");
    }
    for (const auto& bj : batches) {
        if (!bj.isObject() || !(bj["targets"].isArray() || bj["targets"].isNull())) {
            return PmatError::validation("batches", "entry is malformed");
        }
        Batch b;
        for (const auto& idx : bj["targets"]) {
            if (!idx.isUInt64()) return PmatError::validation("batches", "bad target index");
            size_t i = static_cast<size_t>(idx.asUInt64());
            if (i >= sm.targets_.size()) {
                return PmatError::validation("batches", "target index out of range");
            }
            b.targets.push_back(i);
        }
        b.retries = bj["retries"].asInt();
        b.conservative = bj["conservative"].asBool();
        sm.batches_.push_back(std::move(b));
    }
    if (sm.cursor_ > sm.batches_.size()) {
        return PmatError::validation("cursor", "past the last batch");
    }

    const Json::Value& history = j["history"];
    if (!history.isNull() && !history.isArray()) {
        return PmatError::validation("history", "must be an array");
    }
    for (const auto& hj : history) {
        if (!hj.isObject()) return PmatError::validation("history", "entry is not an object");
        HistoryEvent h;
        h.at_ms = hj["at"].asInt64();
        auto p = parse_phase(hj["phase"].asString());
        h.phase = p ? *p : Phase::Scan;
        h.event = hj["event"].asString();
        h.detail = hj["detail"].asString();
        sm.history_.push_back(std::move(h));
    }
    return Result<RefactorStateMachine>::ok(std::move(sm));
}

Json::Value RefactorStateMachine::status_json() const {
    Json::Value j(Json::objectValue);
    j["session_id"] = session_id_;
    j["current_phase"] = phase_name(phase_);
    j["paused"] = paused_;
    if (paused_) j["pause_reason"] = pause_reason_;
    j["targets"] = json::string_array(targets_);

    Json::Value status(Json::objectValue);
    Json::Value quarantined(Json::arrayValue);
    for (const auto& t : status_) {
        status[t.path] = target_status_name(t.status);
        if (!t.live()) {
            Json::Value q(Json::objectValue);
            q["path"] = t.path;
            q["cause"] = t.cause;
            quarantined.append(q);
        }
    }
    j["per_target_status"] = status;
    j["quarantined"] = quarantined;

    Json::Value progress(Json::objectValue);
    progress["batches"] = static_cast<Json::UInt64>(batches_.size());
    progress["cursor"] = static_cast<Json::UInt64>(cursor_);
    progress["live_targets"] = static_cast<Json::UInt64>(live_targets());
    j["progress"] = progress;
    j["config"] = config_.to_json();
    j["started_at"] = Json::Int64(started_at_);
    j["updated_at"] = Json::Int64(updated_at_);
    return j;
}

} // namespace pmat::refactor

#include <catch2/catch.hpp>
#include <pmat/refactor/snapshot_store.hpp>
#include <pmat/refactor/state_machine.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace pmat;
using namespace pmat::refactor;

namespace {

// Baselines by file name; candidates (spilled as NNNNN-name) report
// candidate_for[name] when set, else the baseline
class FakeMetrics : public MetricsProvider {
public:
    Result<FileMetrics> measure(const std::string& path) override {
        calls++;
        fs::path p(path);
        std::string name = p.filename().string();
        bool candidate = p.parent_path().string().find(".spill") != std::string::npos;
        if (candidate) {
            name = name.substr(6);
            auto it = candidate_for.find(name);
            if (it != candidate_for.end()) return Result<FileMetrics>::ok(it->second);
        }
        std::error_code ec;
        if (!fs::exists(path, ec)) return PmatError(PmatError::NotFound, "missing " + path);
        auto it = baseline.find(name);
        FileMetrics m = it == baseline.end() ? FileMetrics{3, 10, 1} : it->second;
        return Result<FileMetrics>::ok(m);
    }

    std::map<std::string, FileMetrics> baseline;
    std::map<std::string, FileMetrics> candidate_for;
    int calls = 0;
};

class RecordingHook : public CommitHook {
public:
    Status commit(const std::vector<std::string>& files, const std::string& message) override {
        commits.push_back({files, message});
        return ok_status();
    }
    std::vector<std::pair<std::vector<std::string>, std::string>> commits;
};

fs::path fresh_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

RefactorConfig config_with(const Json::Value& overrides) {
    auto base = RefactorConfig::create(RefactorSettings{}, 4).value();
    return RefactorConfig::from_json(overrides, base, 4).value();
}

// Advance until terminal or paused; returns the phases seen after each step
std::vector<Phase> drive(RefactorStateMachine& sm, RefactorDeps& deps, int limit = 100) {
    std::vector<Phase> seen;
    for (int i = 0; i < limit && !is_terminal(sm.phase()) && !sm.paused(); ++i) {
        auto out = sm.advance(deps);
        REQUIRE(out.is_ok());
        seen.push_back(sm.phase());
    }
    return seen;
}

struct Workspace {
    fs::path dir;
    fs::path a;
    fs::path b;
    FakeMetrics metrics;
    SnapshotStore store;
    RecordingHook hook;
    RefactorDeps deps{metrics, store, &hook};

    explicit Workspace(const std::string& name)
        : dir(fresh_dir(name)), a(dir / "a.rs"), b(dir / "b.rs"), store(dir / "checkpoints") {
        std::ofstream(a) << "fn a() {\n    // TODO: split\n    1\n}\n";
        std::ofstream(b) << "fn b() {   \n    2\n}\n";
    }
    ~Workspace() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

TEST_CASE("phase and status names round trip", "[state_machine]") {
    for (Phase p : {Phase::Scan, Phase::Plan, Phase::Transform, Phase::Verify, Phase::Commit,
                    Phase::Done, Phase::Failed}) {
        REQUIRE(parse_phase(phase_name(p)) == p);
    }
    REQUIRE_FALSE(parse_phase("warp").has_value());
    REQUIRE(is_terminal(Phase::Done));
    REQUIRE(is_terminal(Phase::Failed));
    REQUIRE_FALSE(is_terminal(Phase::Commit));
    REQUIRE(parse_target_status("quarantined") == TargetStatus::Quarantined);
    REQUIRE(RefactorStateMachine::new_session_id().rfind("refactor-session-", 0) == 0);
}

TEST_CASE("dry run walks every phase without touching targets", "[state_machine]") {
    Workspace w("pmat_test_sm_dry");
    Json::Value o(Json::objectValue);
    o["batch_size"] = 1;
    RefactorStateMachine sm("s-dry", {w.a.string(), w.b.string()}, config_with(o));
    std::string before = slurp(w.a);

    auto seen = drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
    REQUIRE(seen.size() == 8);
    for (size_t i = 1; i < seen.size(); ++i) REQUIRE(seen[i - 1] <= seen[i]);

    REQUIRE(sm.batches().size() == 2);
    for (const auto& t : sm.target_states()) REQUIRE(t.status == TargetStatus::Committed);
    REQUIRE(sm.target_states()[0].baseline_complexity == 3);
    REQUIRE(slurp(w.a) == before);
    REQUIRE(w.hook.commits.empty());

    // Every step left a snapshot behind
    auto loaded = w.store.load("s-dry");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().phase() == Phase::Done);
}

TEST_CASE("committing rewrites targets and calls the commit hook", "[state_machine]") {
    Workspace w("pmat_test_sm_commit");
    Json::Value o(Json::objectValue);
    o["dry_run"] = false;
    o["auto_commit_template"] = "refactor {{session_id}} batch {{batch}}/{{batches}}";
    RefactorStateMachine sm("s-commit", {w.a.string(), w.b.string()}, config_with(o));

    drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
    REQUIRE(slurp(w.a) == "fn a() {\n    1\n}\n");
    REQUIRE(slurp(w.b) == "fn b() {\n    2\n}\n");
    REQUIRE(w.hook.commits.size() == 1);
    REQUIRE(w.hook.commits[0].first.size() == 2);
    REQUIRE(w.hook.commits[0].second == "refactor s-commit batch 1/1");
}

TEST_CASE("unmeasurable targets are quarantined at scan", "[state_machine]") {
    Workspace w("pmat_test_sm_missing");
    RefactorStateMachine sm("s-missing", {w.a.string(), (w.dir / "gone.rs").string()},
                            config_with(Json::Value(Json::objectValue)));
    REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.phase() == Phase::Plan);
    REQUIRE(sm.quarantined_targets() == 1);
    REQUIRE(sm.target_states()[1].status == TargetStatus::Quarantined);
    REQUIRE(sm.target_states()[1].cause.find("missing") != std::string::npos);

    drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
    REQUIRE(sm.target_states()[0].status == TargetStatus::Committed);
    REQUIRE(sm.status_json()["quarantined"].size() == 1);
}

TEST_CASE("a session with no live targets finishes after scan", "[state_machine]") {
    Workspace w("pmat_test_sm_empty");
    RefactorStateMachine none("s-none", {}, config_with(Json::Value(Json::objectValue)));
    REQUIRE(none.advance(w.deps).is_ok());
    REQUIRE(none.phase() == Phase::Done);

    auto out = none.advance(w.deps);
    REQUIRE(out.is_ok());
    REQUIRE_FALSE(out.value().changed);
    REQUIRE(out.value().event == "terminal");
}

TEST_CASE("targets over the complexity target are quarantined at verify", "[state_machine]") {
    Workspace w("pmat_test_sm_target");
    w.metrics.baseline["a.rs"] = FileMetrics{30, 10, 1};
    Json::Value o(Json::objectValue);
    o["target_complexity"] = 10;
    RefactorStateMachine sm("s-target", {w.a.string(), w.b.string()}, config_with(o));
    drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
    REQUIRE(sm.target_states()[0].status == TargetStatus::Quarantined);
    REQUIRE(sm.target_states()[0].cause.find("exceeds target 10") != std::string::npos);
    REQUIRE(sm.target_states()[0].candidate_complexity == 30);
    REQUIRE(sm.target_states()[1].status == TargetStatus::Committed);
}

TEST_CASE("long functions are quarantined at verify", "[state_machine]") {
    Workspace w("pmat_test_sm_long");
    w.metrics.baseline["b.rs"] = FileMetrics{2, 80, 1};
    RefactorStateMachine sm("s-long", {w.a.string(), w.b.string()},
                            config_with(Json::Value(Json::objectValue)));
    drive(sm, w.deps);
    REQUIRE(sm.target_states()[1].status == TargetStatus::Quarantined);
    REQUIRE(sm.target_states()[1].cause.find("80 lines") != std::string::npos);
}

TEST_CASE("regressions retry conservatively then quarantine", "[state_machine]") {
    Workspace w("pmat_test_sm_regress");
    w.metrics.candidate_for["a.rs"] = FileMetrics{9, 10, 1};
    Json::Value o(Json::objectValue);
    o["max_batch_retries"] = 1;
    RefactorStateMachine sm("s-regress", {w.a.string(), w.b.string()}, config_with(o));

    while (sm.phase() != Phase::Verify) REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.phase() == Phase::Verify);
    REQUIRE(sm.batches()[0].retries == 1);
    REQUIRE(sm.batches()[0].conservative);
    // The conservative candidate keeps the debt comment
    auto spill = w.store.spill_dir("s-regress");
    REQUIRE(slurp(spill / "00000-a.rs").find("TODO") != std::string::npos);

    REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.batches()[0].retries == 2);
    REQUIRE(sm.phase() == Phase::Commit);
    for (const auto& t : sm.target_states()) {
        REQUIRE(t.status == TargetStatus::Quarantined);
        REQUIRE(t.cause == "complexity regression after retries");
    }
    drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
}

TEST_CASE("an oversized batch is split and then quarantined", "[state_machine]") {
    Workspace w("pmat_test_sm_memory");
    fs::path big = w.dir / "big.rs";
    {
        std::ofstream out(big);
        std::string line(99, 'x');
        for (int i = 0; i < 7000; ++i) out << line << "\n";
    }
    Json::Value o(Json::objectValue);
    o["memory_limit_mb"] = 1;
    o["batch_size"] = 2;
    RefactorStateMachine sm("s-mem", {big.string(), w.b.string()}, config_with(o));

    REQUIRE(sm.advance(w.deps).is_ok());   // scan
    REQUIRE(sm.advance(w.deps).is_ok());   // plan
    REQUIRE(sm.batches().size() == 1);
    REQUIRE(sm.advance(w.deps).is_ok());   // split
    REQUIRE(sm.batches().size() == 2);
    REQUIRE(sm.batches()[0].targets == std::vector<size_t>{0});
    REQUIRE(sm.phase() == Phase::Transform);
    REQUIRE(sm.advance(w.deps).is_ok());   // quarantine the big file
    REQUIRE(sm.target_states()[0].status == TargetStatus::Quarantined);
    REQUIRE(sm.target_states()[0].cause.find("memory_limit_mb") != std::string::npos);

    drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
    REQUIRE(sm.target_states()[1].status == TargetStatus::Committed);
}

TEST_CASE("the runtime budget pauses and resume continues", "[state_machine]") {
    Workspace w("pmat_test_sm_budget");
    Json::Value o(Json::objectValue);
    o["max_runtime_secs"] = 1;
    RefactorStateMachine sm("s-budget", {w.a.string()}, config_with(o));
    REQUIRE(sm.advance(w.deps).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    auto paused = sm.advance(w.deps);
    REQUIRE(paused.is_ok());
    REQUIRE(paused.value().event == "paused");
    REQUIRE(sm.paused());
    REQUIRE(sm.phase() == Phase::Plan);
    REQUIRE(sm.status_json()["pause_reason"].asString() == "max_runtime_secs exceeded");

    auto noop = sm.advance(w.deps);
    REQUIRE(noop.is_ok());
    REQUIRE_FALSE(noop.value().changed);

    sm.resume();
    REQUIRE_FALSE(sm.paused());
    drive(sm, w.deps);
    REQUIRE(sm.phase() == Phase::Done);
}

TEST_CASE("a failed snapshot write rolls the step back", "[state_machine]") {
    Workspace w("pmat_test_sm_rollback");
    std::ofstream(w.dir / "plain") << "not a directory";
    SnapshotStore broken(w.dir / "plain" / "checkpoints");
    RefactorDeps deps{w.metrics, broken, nullptr};

    RefactorStateMachine sm("s-rollback", {w.a.string()},
                            config_with(Json::Value(Json::objectValue)));
    auto history = sm.history().size();
    auto out = sm.advance(deps);
    REQUIRE(out.is_err());
    REQUIRE(out.error().code == PmatError::IO);
    REQUIRE(out.error().is_retryable());
    REQUIRE(out.error().cause != nullptr);
    REQUIRE(sm.phase() == Phase::Scan);
    REQUIRE(sm.target_states()[0].status == TargetStatus::Pending);
    REQUIRE(sm.history().size() == history);

    // Same step succeeds against a working store
    REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.phase() == Phase::Plan);
}

TEST_CASE("state machine json round trip", "[state_machine]") {
    Workspace w("pmat_test_sm_json");
    Json::Value o(Json::objectValue);
    o["batch_size"] = 1;
    RefactorStateMachine sm("s-json", {w.a.string(), w.b.string()}, config_with(o));
    for (int i = 0; i < 3; ++i) REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.phase() == Phase::Transform);

    auto back = RefactorStateMachine::from_json(sm.to_json());
    REQUIRE(back.is_ok());
    REQUIRE(back.value().to_json() == sm.to_json());
    REQUIRE(back.value().target_states() == sm.target_states());
    REQUIRE(back.value().batches() == sm.batches());
    REQUIRE(back.value().cursor() == 1);
}

TEST_CASE("state machine json rejects inconsistent documents", "[state_machine]") {
    RefactorStateMachine sm("s-bad", {"a.rs"}, config_with(Json::Value(Json::objectValue)));
    auto j = sm.to_json();

    auto phase = j;
    phase["current_phase"] = "warp";
    REQUIRE(RefactorStateMachine::from_json(phase).error().field == "current_phase");

    auto status = j;
    status["per_target_status"] = Json::Value(Json::arrayValue);
    REQUIRE(RefactorStateMachine::from_json(status).error().field == "per_target_status");

    auto cursor = j;
    cursor["cursor"] = 5;
    REQUIRE(RefactorStateMachine::from_json(cursor).error().field == "cursor");

    auto no_id = j;
    no_id.removeMember("session_id");
    REQUIRE(RefactorStateMachine::from_json(no_id).is_err());
}

TEST_CASE("reset and fail", "[state_machine]") {
    Workspace w("pmat_test_sm_reset");
    RefactorStateMachine sm("s-reset", {w.a.string()}, config_with(Json::Value(Json::objectValue)));
    REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.advance(w.deps).is_ok());
    REQUIRE(sm.phase() == Phase::Transform);

    sm.reset();
    REQUIRE(sm.phase() == Phase::Scan);
    REQUIRE(sm.batches().empty());
    REQUIRE(sm.target_states()[0].status == TargetStatus::Pending);
    REQUIRE(sm.target_states()[0].baseline_complexity == -1);

    sm.fail("operator abort");
    REQUIRE(sm.phase() == Phase::Failed);
    REQUIRE(sm.history().back().detail == "operator abort");
    REQUIRE_FALSE(sm.advance(w.deps).value().changed);
}

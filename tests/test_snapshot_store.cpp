#include <catch2/catch.hpp>
#include <pmat/refactor/snapshot_store.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;
using namespace pmat;
using namespace pmat::refactor;

static fs::path fresh_dir(const std::string& name) {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static RefactorStateMachine session(const std::string& id) {
    auto cfg = RefactorConfig::create(RefactorSettings{}, 4).value();
    return RefactorStateMachine(id, {"src/a.rs", "src/b.rs"}, cfg);
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("snapshot save and load", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_snapshot");
    SnapshotStore store(dir / "ckpt");
    REQUIRE(store.path_for("abc") == dir / "ckpt" / "refactor-abc.json");
    REQUIRE(store.spill_dir("abc") == dir / "ckpt" / "abc.spill");

    auto sm = session("abc");
    REQUIRE(store.save(sm).is_ok());
    REQUIRE(slurp(store.path_for("abc")).find("\"schema_version\" : 1") != std::string::npos);

    auto loaded = store.load("abc");
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.value().targets() == sm.targets());
    REQUIRE(loaded.value().phase() == Phase::Scan);
    REQUIRE(loaded.value().to_json() == sm.to_json());
    fs::remove_all(dir);
}

TEST_CASE("snapshot load failures", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_snapshot_bad");
    SnapshotStore store(dir);

    auto missing = store.load("nope");
    REQUIRE(missing.error().code == PmatError::NotFound);

    std::ofstream(store.path_for("garbage")) << "{not json";
    auto garbage = store.load("garbage");
    REQUIRE(garbage.error().code == PmatError::Serialization);
    REQUIRE(garbage.error().file == store.path_for("garbage").string());

    std::ofstream(store.path_for("old")) << "{\"schema_version\": 0}";
    auto old = store.load("old");
    REQUIRE(old.error().code == PmatError::Serialization);
    REQUIRE(old.error().message.find("version 0") != std::string::npos);

    std::ofstream(store.path_for("unversioned")) << "{\"session_id\": \"x\"}";
    REQUIRE(store.load("unversioned").error().code == PmatError::Serialization);

    auto doc = session("broken").to_json();
    doc["schema_version"] = 1;
    doc["per_target_status"] = Json::Value(Json::arrayValue);
    std::ofstream(store.path_for("broken")) << doc.toStyledString();
    auto broken = store.load("broken");
    REQUIRE(broken.error().code == PmatError::Serialization);
    REQUIRE(broken.error().cause != nullptr);
    REQUIRE(broken.error().cause->field == "per_target_status");

    auto typed = session("typed").to_json();
    typed["schema_version"] = 1;
    typed["current_phase"] = Json::Value(Json::objectValue);
    std::ofstream(store.path_for("typed")) << typed.toStyledString();
    REQUIRE(store.load("typed").error().code == PmatError::Serialization);

    auto negative = session("negative").to_json();
    negative["schema_version"] = 1;
    negative["cursor"] = -3;
    std::ofstream(store.path_for("negative")) << negative.toStyledString();
    auto neg = store.load("negative");
    REQUIRE(neg.error().code == PmatError::Serialization);
    REQUIRE(neg.error().cause->field == "cursor");

    auto counts = session("counts").to_json();
    counts["schema_version"] = 1;
    counts["per_target_status"][0]["baseline_complexity"] = "many";
    std::ofstream(store.path_for("counts")) << counts.toStyledString();
    REQUIRE(store.load("counts").error().code == PmatError::Serialization);
    fs::remove_all(dir);
}

TEST_CASE("session ids must be plain names", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_snapshot_ids");
    SnapshotStore store(dir / "ckpt");
    fs::create_directories(dir / "keep");
    std::ofstream(dir / "keep" / "file") << "x";

    for (const char* id : {"", ".", "..", "../keep", "a/b", "..\\keep"}) {
        REQUIRE(store.load(id).error().code == PmatError::BadRequest);
        auto st = store.remove(id);
        REQUIRE(st.is_err());
        REQUIRE(st.error().field == "session_id");
    }
    REQUIRE(fs::exists(dir / "keep" / "file"));
    REQUIRE(SnapshotStore::check_id("2f1c-abc").is_ok());
    fs::remove_all(dir);
}

TEST_CASE("latest snapshot wins and junk is ignored", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_snapshot_latest");
    SnapshotStore store(dir);
    REQUIRE(store.latest().error().code == PmatError::NotFound);

    REQUIRE(store.save(session("first")).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    REQUIRE(store.save(session("second")).is_ok());
    std::ofstream(store.path_for("junk")) << "nope";
    std::ofstream(dir / "notes.txt") << "ignored";
    std::ofstream(store.path_for("bad"))
        << R"({"schema_version":1,"session_id":"bad","targets":["x"],"config":{},)"
        << R"("current_phase":"scan","per_target_status":[5]})";

    auto bad = store.load("bad");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == PmatError::Serialization);

    auto latest = store.latest();
    REQUIRE(latest.is_ok());
    REQUIRE(latest.value() == "second");

    SnapshotStore absent(dir / "missing");
    REQUIRE(absent.latest().error().code == PmatError::NotFound);
    fs::remove_all(dir);
}

TEST_CASE("snapshot remove deletes the spill directory", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_snapshot_remove");
    SnapshotStore store(dir);
    REQUIRE(store.save(session("gone")).is_ok());
    REQUIRE(write_file_atomic(store.spill_dir("gone") / "00000-a.rs", "x\n").is_ok());

    REQUIRE(store.remove("gone").is_ok());
    REQUIRE_FALSE(fs::exists(store.path_for("gone")));
    REQUIRE_FALSE(fs::exists(store.spill_dir("gone")));
    REQUIRE(store.remove("gone").is_ok());
    fs::remove_all(dir);
}

TEST_CASE("a failed snapshot write keeps the previous one", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_snapshot_fail");
    SnapshotStore store(dir);
    auto sm = session("blocked");

    // A directory where the snapshot file belongs makes the rename fail
    fs::create_directories(store.path_for("blocked") / "child");
    auto st = store.save(sm);
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == PmatError::IO);
    REQUIRE(st.error().is_retryable());
    REQUIRE(fs::is_directory(store.path_for("blocked")));

    // No temp files are left next to it
    for (const auto& e : fs::directory_iterator(dir)) {
        REQUIRE(e.path().filename().string().find(".tmp.") == std::string::npos);
    }
    fs::remove_all(dir);
}

TEST_CASE("atomic writes replace content and create parents", "[snapshot]") {
    auto dir = fresh_dir("pmat_test_atomic_write");
    auto target = dir / "a" / "b" / "file.txt";
    REQUIRE(write_file_atomic(target, "one").is_ok());
    REQUIRE(slurp(target) == "one");
    REQUIRE(write_file_atomic(target, "two\n").is_ok());
    REQUIRE(slurp(target) == "two\n");

    std::ofstream(dir / "plain") << "x";
    auto st = write_file_atomic(dir / "plain" / "nested.txt", "y");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == PmatError::IO);
    fs::remove_all(dir);
}

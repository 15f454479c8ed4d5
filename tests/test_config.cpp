#include <catch2/catch.hpp>
#include <pmat/config.hpp>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;
using namespace pmat;

// ===== Parsing =====

TEST_CASE("parse config with cache section", "[config]") {
    auto r = Config::parse(R"(
[cache]
max-memory-mb = 64
ttl-ast = 120
persistent = true
dir = "/tmp/pmat-cache"
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().cache.max_memory_mb == 64);
    REQUIRE(r.value().cache.ttl_ast_secs == 120);
    REQUIRE(r.value().cache.persistent);
    REQUIRE(r.value().cache.dir == "/tmp/pmat-cache");
    REQUIRE(r.value().set_keys.count("cache.ttl-ast") == 1);
}

TEST_CASE("parse config with refactor and server sections", "[config]") {
    auto r = Config::parse(R"(
[refactor]
target-complexity = 10
batch-size = 2
dry-run = false
auto-commit-template = "refactor: {{files}}"

[server]
port = 9000
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().refactor.target_complexity == 10);
    REQUIRE(r.value().refactor.batch_size == 2);
    REQUIRE_FALSE(r.value().refactor.dry_run);
    REQUIRE(r.value().refactor.auto_commit_template == "refactor: {{files}}");
    REQUIRE(r.value().server.port == 9000);
}

TEST_CASE("parse empty config keeps defaults", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().cache.max_memory_mb == 100);
    REQUIRE(r.value().refactor.checkpoint_dir == ".pmat/checkpoints");
    REQUIRE(r.value().server.host == "127.0.0.1");
    REQUIRE(r.value().set_keys.empty());
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::BadRequest);
}

TEST_CASE("wrong value type names the key", "[config]") {
    auto r = Config::parse("[cache]\nmax-memory-mb = \"lots\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::ValidationFailed);
    REQUIRE(r.error().field == "cache.max-memory-mb");
}

// ===== Layering =====

TEST_CASE("merge overrides only keys the layer sets", "[config]") {
    auto base = Config::parse("[cache]\nmax-memory-mb = 10\nttl-dag = 30\n").value();
    auto over = Config::parse("[cache]\nttl-dag = 90\n").value();
    base.merge(over);
    REQUIRE(base.cache.max_memory_mb == 10);
    REQUIRE(base.cache.ttl_dag_secs == 90);
}

TEST_CASE("effective config applies global, project, explicit in order", "[config]") {
    auto global = Config::parse("[server]\nport = 1000\nhost = \"0.0.0.0\"\n").value();
    auto project = Config::parse("[server]\nport = 2000\n").value();
    auto explicit_file = Config::parse("[refactor]\nbatch-size = 3\n").value();
    auto cfg = Config::effective(global, project, explicit_file);
    REQUIRE(cfg.server.port == 2000);
    REQUIRE(cfg.server.host == "0.0.0.0");
    REQUIRE(cfg.refactor.batch_size == 3);
}

TEST_CASE("environment overrides cache settings", "[config]") {
    std::map<std::string, std::string> env = {
        {"PAIML_CACHE_MAX_MB", "256"},
        {"PAIML_CACHE_TTL_AST", "45"},
        {"PAIML_CACHE_ENABLE_WATCH", "true"},
        {"PAIML_CACHE_GIT_BRANCH_AWARE", "0"},
    };
    Config cfg;
    cfg.cache.git_branch_aware = true;
    cfg.apply_env([&](const char* name) -> const char* {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });
    REQUIRE(cfg.cache.max_memory_mb == 256);
    REQUIRE(cfg.cache.ttl_ast_secs == 45);
    REQUIRE(cfg.cache.enable_watch);
    REQUIRE_FALSE(cfg.cache.git_branch_aware);
}

TEST_CASE("malformed environment values are ignored", "[config]") {
    Config cfg;
    cfg.apply_env([](const char* name) -> const char* {
        if (std::strcmp(name, "PAIML_CACHE_MAX_MB") == 0) return "-5";
        if (std::strcmp(name, "PAIML_CACHE_ENABLE_WATCH") == 0) return "maybe";
        return nullptr;
    });
    REQUIRE(cfg.cache.max_memory_mb == 100);
    REQUIRE_FALSE(cfg.cache.enable_watch);
}

TEST_CASE("load reads file and reports path on error", "[config]") {
    auto dir = fs::temp_directory_path() / "pmat_test_config";
    fs::create_directories(dir);
    {
        std::ofstream(dir / "good.toml") << "[refactor]\nmax-batch-retries = 7\n";
        std::ofstream(dir / "bad.toml") << "[refactor\n";
    }
    auto good = Config::load((dir / "good.toml").string());
    REQUIRE(good.is_ok());
    REQUIRE(good.value().refactor.max_batch_retries == 7);

    auto bad = Config::load((dir / "bad.toml").string());
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().file == (dir / "bad.toml").string());

    auto missing = Config::load((dir / "missing.toml").string());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == PmatError::IO);
    fs::remove_all(dir);
}

TEST_CASE("load_config picks up the project layer", "[config]") {
    auto root = fs::temp_directory_path() / "pmat_test_config_root";
    fs::create_directories(root / ".pmat");
    std::ofstream(root / ".pmat" / "config.toml") << "[refactor]\ncheckpoint-dir = \"ckpt\"\n";
    auto cfg = load_config(root.string());
    REQUIRE(cfg.is_ok());
    REQUIRE(cfg.value().refactor.checkpoint_dir == "ckpt");
    REQUIRE(project_config_path(root.string()) == (root / ".pmat" / "config.toml").string());
    fs::remove_all(root);
}

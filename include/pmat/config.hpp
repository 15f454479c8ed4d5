#pragma once

#include <pmat/result.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>

namespace pmat {

struct CacheSettings {
    int64_t max_memory_mb = 100;
    int64_t ttl_ast_secs = 300;
    int64_t ttl_template_secs = 600;
    int64_t ttl_dag_secs = 180;
    int64_t ttl_churn_secs = 1800;
    int64_t ttl_analysis_secs = 600;
    bool enable_watch = false;      // advisory only, reported in diagnostics
    bool git_branch_aware = false;
    bool persistent = false;
    std::string dir;                // empty = ~/.pmat/cache
};

struct RefactorSettings {
    int64_t target_complexity = 20;
    int64_t max_function_lines = 50;
    bool remove_satd = true;
    int64_t parallel_workers = 0;   // 0 = hardware parallelism
    int64_t memory_limit_mb = 512;
    int64_t batch_size = 10;
    int64_t max_runtime_secs = 0;   // 0 = unbounded
    int64_t max_batch_retries = 3;
    bool dry_run = true;
    std::string auto_commit_template;
    std::string checkpoint_dir = ".pmat/checkpoints";
};

struct ServerSettings {
    std::string host = "127.0.0.1";
    int64_t port = 8080;
};

// Layered configuration: global -> project -> explicit file -> environment.
// Later layers override earlier ones, key by key.
struct Config {
    CacheSettings cache;
    RefactorSettings refactor;
    ServerSettings server;

    // Dotted keys ("cache.max-memory-mb") explicitly set by this layer
    std::set<std::string> set_keys;

    static Result<Config> load(const std::string& path);
    static Result<Config> parse(const std::string& toml_str);

    // other's explicitly set keys override this
    void merge(const Config& other);

    using EnvLookup = std::function<const char*(const char*)>;

    // PAIML_CACHE_MAX_MB, PAIML_CACHE_TTL_AST, PAIML_CACHE_ENABLE_WATCH,
    // PAIML_CACHE_GIT_BRANCH_AWARE. Malformed values are logged and ignored.
    void apply_env(const EnvLookup& lookup);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& explicit_file);
};

// ~/.pmat/config.toml
std::string global_config_path();

// <root>/.pmat/config.toml
std::string project_config_path(const std::string& root);

// Load every layer that exists, then apply the process environment.
// A missing layer is skipped; a malformed one is an error.
Result<Config> load_config(const std::string& project_root,
                           const std::string& explicit_path = "");

} // namespace pmat

#include <pmat/config.hpp>
#include <pmat/log.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace pmat {

// Visit every configurable field as (dotted key, destination, source).
template<typename F>
static void for_each_field(Config& dst, const Config& src, F&& f) {
    f("cache.max-memory-mb", dst.cache.max_memory_mb, src.cache.max_memory_mb);
    f("cache.ttl-ast", dst.cache.ttl_ast_secs, src.cache.ttl_ast_secs);
    f("cache.ttl-template", dst.cache.ttl_template_secs, src.cache.ttl_template_secs);
    f("cache.ttl-dag", dst.cache.ttl_dag_secs, src.cache.ttl_dag_secs);
    f("cache.ttl-churn", dst.cache.ttl_churn_secs, src.cache.ttl_churn_secs);
    f("cache.ttl-analysis", dst.cache.ttl_analysis_secs, src.cache.ttl_analysis_secs);
    f("cache.enable-watch", dst.cache.enable_watch, src.cache.enable_watch);
    f("cache.git-branch-aware", dst.cache.git_branch_aware, src.cache.git_branch_aware);
    f("cache.persistent", dst.cache.persistent, src.cache.persistent);
    f("cache.dir", dst.cache.dir, src.cache.dir);

    f("refactor.target-complexity", dst.refactor.target_complexity, src.refactor.target_complexity);
    f("refactor.max-function-lines", dst.refactor.max_function_lines, src.refactor.max_function_lines);
    f("refactor.remove-satd", dst.refactor.remove_satd, src.refactor.remove_satd);
    f("refactor.parallel-workers", dst.refactor.parallel_workers, src.refactor.parallel_workers);
    f("refactor.memory-limit-mb", dst.refactor.memory_limit_mb, src.refactor.memory_limit_mb);
    f("refactor.batch-size", dst.refactor.batch_size, src.refactor.batch_size);
    f("refactor.max-runtime-secs", dst.refactor.max_runtime_secs, src.refactor.max_runtime_secs);
    f("refactor.max-batch-retries", dst.refactor.max_batch_retries, src.refactor.max_batch_retries);
    f("refactor.dry-run", dst.refactor.dry_run, src.refactor.dry_run);
    f("refactor.auto-commit-template", dst.refactor.auto_commit_template,
      src.refactor.auto_commit_template);
    f("refactor.checkpoint-dir", dst.refactor.checkpoint_dir, src.refactor.checkpoint_dir);

    f("server.host", dst.server.host, src.server.host);
    f("server.port", dst.server.port, src.server.port);
}

static toml::node_view<const toml::node> lookup(const toml::table& doc, const std::string& key) {
    auto dot = key.find('.');
    return doc[key.substr(0, dot)][key.substr(dot + 1)];
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PmatError{PmatError::BadRequest,
            std::string("config TOML parse error: ") + std::string(e.description())};
    }

    Config cfg;
    std::optional<PmatError> failure;

    for_each_field(cfg, cfg, [&](const char* key, auto& field, const auto&) {
        using T = std::decay_t<decltype(field)>;
        auto node = lookup(doc, key);
        if (!node || failure) return;
        if (auto v = node.template value<T>()) {
            field = *v;
            cfg.set_keys.insert(key);
        } else {
            failure = PmatError::validation(key, "wrong type in config file");
        }
    });

    if (failure) return *failure;
    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PmatError::io("cannot open config file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) r.error().with_file(path);
    return r;
}

void Config::merge(const Config& other) {
    for_each_field(*this, other, [&](const char* key, auto& dst, const auto& src) {
        if (other.set_keys.count(key)) {
            dst = src;
            set_keys.insert(key);
        }
    });
}

static std::optional<int64_t> env_int(const char* name, const char* raw) {
    try {
        size_t used = 0;
        long long v = std::stoll(raw, &used);
        if (used == std::string(raw).size() && v > 0) return v;
    } catch (const std::exception&) {
    }
    log::warn("ignoring %s=%s: expected a positive integer", name, raw);
    return std::nullopt;
}

static std::optional<bool> env_bool(const char* name, const char* raw) {
    std::string s(raw);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    log::warn("ignoring %s=%s: expected a boolean", name, raw);
    return std::nullopt;
}

void Config::apply_env(const EnvLookup& env) {
    if (const char* v = env("PAIML_CACHE_MAX_MB")) {
        if (auto n = env_int("PAIML_CACHE_MAX_MB", v)) {
            cache.max_memory_mb = *n;
            set_keys.insert("cache.max-memory-mb");
        }
    }
    if (const char* v = env("PAIML_CACHE_TTL_AST")) {
        if (auto n = env_int("PAIML_CACHE_TTL_AST", v)) {
            cache.ttl_ast_secs = *n;
            set_keys.insert("cache.ttl-ast");
        }
    }
    if (const char* v = env("PAIML_CACHE_ENABLE_WATCH")) {
        if (auto b = env_bool("PAIML_CACHE_ENABLE_WATCH", v)) {
            cache.enable_watch = *b;
            set_keys.insert("cache.enable-watch");
        }
    }
    if (const char* v = env("PAIML_CACHE_GIT_BRANCH_AWARE")) {
        if (auto b = env_bool("PAIML_CACHE_GIT_BRANCH_AWARE", v)) {
            cache.git_branch_aware = *b;
            set_keys.insert("cache.git-branch-aware");
        }
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& explicit_file) {
    Config result;
    if (global) result.merge(*global);
    if (project) result.merge(*project);
    if (explicit_file) result.merge(*explicit_file);
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.pmat/config.toml";
}

std::string project_config_path(const std::string& root) {
    return (fs::path(root.empty() ? "." : root) / ".pmat" / "config.toml").string();
}

static Result<std::optional<Config>> load_optional(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto r = Config::load(path);
    if (r.is_err()) return std::move(r).error();
    log::debug("loaded config layer %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(r).value());
}

Result<Config> load_config(const std::string& project_root, const std::string& explicit_path) {
    auto global = load_optional(global_config_path());
    if (global.is_err()) return std::move(global).error();
    auto project = load_optional(project_config_path(project_root));
    if (project.is_err()) return std::move(project).error();

    std::optional<Config> explicit_cfg;
    if (!explicit_path.empty()) {
        auto r = Config::load(explicit_path);
        if (r.is_err()) return std::move(r).error();
        explicit_cfg = std::move(r).value();
    }

    Config cfg = Config::effective(global.value(), project.value(), explicit_cfg);
    cfg.apply_env([](const char* name) { return std::getenv(name); });
    return Result<Config>::ok(std::move(cfg));
}

} // namespace pmat

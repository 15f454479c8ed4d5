#include <pmat/refactor/refactor_config.hpp>
#include <pmat/json.hpp>

#include <set>
#include <thread>

namespace pmat::refactor {

size_t RefactorConfig::hardware_parallelism() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

Status RefactorConfig::validate(size_t hw) const {
    struct Positive {
        const char* field;
        int64_t value;
    };
    const Positive checks[] = {
        {"target_complexity", target_complexity},
        {"max_function_lines", max_function_lines},
        {"parallel_workers", parallel_workers},
        {"memory_limit_mb", memory_limit_mb},
        {"batch_size", batch_size},
        {"max_batch_retries", max_batch_retries},
    };
    for (const auto& c : checks) {
        if (c.value <= 0) return PmatError::validation(c.field, "must be positive");
    }
    if (max_runtime_secs < 0) {
        return PmatError::validation("max_runtime_secs", "must not be negative");
    }
    if (static_cast<uint64_t>(parallel_workers) > hw) {
        return PmatError::validation("parallel_workers",
                                     "exceeds hardware parallelism (" + std::to_string(hw) + ")");
    }
    return ok_status();
}

Result<RefactorConfig> RefactorConfig::create(const RefactorSettings& s, size_t hw) {
    if (hw == 0) hw = hardware_parallelism();
    RefactorConfig c;
    c.target_complexity = s.target_complexity;
    c.max_function_lines = s.max_function_lines;
    c.remove_satd = s.remove_satd;
    c.parallel_workers = s.parallel_workers == 0 ? static_cast<int64_t>(hw) : s.parallel_workers;
    c.memory_limit_mb = s.memory_limit_mb;
    c.batch_size = s.batch_size;
    c.max_runtime_secs = s.max_runtime_secs;
    c.max_batch_retries = s.max_batch_retries;
    c.dry_run = s.dry_run;
    c.auto_commit_template = s.auto_commit_template;
    PMAT_TRY(c.validate(hw));
    return Result<RefactorConfig>::ok(std::move(c));
}

Result<RefactorConfig> RefactorConfig::from_json(const Json::Value& params, const RefactorConfig& base,
                                                 size_t hw) {
    if (hw == 0) hw = hardware_parallelism();
    if (!params.isNull() && !params.isObject()) {
        return PmatError::validation("config", "expected an object");
    }
    static const std::set<std::string> known = {
        "target_complexity", "max_function_lines", "remove_satd", "parallel_workers",
        "memory_limit_mb", "batch_size", "max_runtime_secs", "max_batch_retries",
        "dry_run", "auto_commit_template",
    };
    RefactorConfig c = base;
    if (params.isNull()) return Result<RefactorConfig>::ok(std::move(c));
    for (const auto& key : params.getMemberNames()) {
        if (!known.count(key)) return PmatError::validation(key, "unknown refactor option");
    }

    struct IntField {
        const char* key;
        int64_t* target;
    };
    IntField ints[] = {
        {"target_complexity", &c.target_complexity},
        {"max_function_lines", &c.max_function_lines},
        {"parallel_workers", &c.parallel_workers},
        {"memory_limit_mb", &c.memory_limit_mb},
        {"batch_size", &c.batch_size},
        {"max_runtime_secs", &c.max_runtime_secs},
        {"max_batch_retries", &c.max_batch_retries},
    };
    for (auto& f : ints) {
        auto v = json::get_int(params, f.key, *f.target);
        if (v.is_err()) return std::move(v).error();
        *f.target = v.value();
    }
    auto satd = json::get_bool(params, "remove_satd", c.remove_satd);
    if (satd.is_err()) return std::move(satd).error();
    c.remove_satd = satd.value();
    auto dry = json::get_bool(params, "dry_run", c.dry_run);
    if (dry.is_err()) return std::move(dry).error();
    c.dry_run = dry.value();
    auto tmpl = json::get_string(params, "auto_commit_template", c.auto_commit_template);
    if (tmpl.is_err()) return std::move(tmpl).error();
    c.auto_commit_template = tmpl.value();

    PMAT_TRY(c.validate(hw));
    return Result<RefactorConfig>::ok(std::move(c));
}

Json::Value RefactorConfig::to_json() const {
    Json::Value j(Json::objectValue);
    j["target_complexity"] = Json::Int64(target_complexity);
    j["max_function_lines"] = Json::Int64(max_function_lines);
    j["remove_satd"] = remove_satd;
    j["parallel_workers"] = Json::Int64(parallel_workers);
    j["memory_limit_mb"] = Json::Int64(memory_limit_mb);
    j["batch_size"] = Json::Int64(batch_size);
    j["max_runtime_secs"] = Json::Int64(max_runtime_secs);
    j["max_batch_retries"] = Json::Int64(max_batch_retries);
    j["dry_run"] = dry_run;
    j["auto_commit_template"] = auto_commit_template;
    return j;
}

} // namespace pmat::refactor

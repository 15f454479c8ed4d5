#pragma once

#include <pmat/config.hpp>
#include <pmat/result.hpp>
#include <json/json.h>
#include <cstdint>
#include <string>

namespace pmat::refactor {

// Validated refactor parameters. Only create()/from_json() produce one, so
// a RefactorConfig in hand is always valid.
class RefactorConfig {
public:
    int64_t target_complexity = 20;
    int64_t max_function_lines = 50;
    bool remove_satd = true;
    int64_t parallel_workers = 1;
    int64_t memory_limit_mb = 512;
    int64_t batch_size = 10;
    int64_t max_runtime_secs = 0;     // 0 = unbounded
    int64_t max_batch_retries = 3;
    bool dry_run = true;
    std::string auto_commit_template;  // empty = no git commit

    // parallel_workers 0 resolves to hardware parallelism
    static Result<RefactorConfig> create(const RefactorSettings& settings,
                                         size_t hardware_threads = 0);

    // Overrides on top of base; unknown keys are rejected
    static Result<RefactorConfig> from_json(const Json::Value& params, const RefactorConfig& base,
                                            size_t hardware_threads = 0);

    Json::Value to_json() const;

    static size_t hardware_parallelism();

private:
    Status validate(size_t hardware_threads) const;
};

} // namespace pmat::refactor

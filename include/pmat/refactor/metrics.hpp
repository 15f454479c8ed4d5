#pragma once

#include <pmat/cancel.hpp>
#include <pmat/result.hpp>
#include <string>
#include <vector>

namespace pmat::analysis { class Scheduler; }

namespace pmat::refactor {

struct FileMetrics {
    int max_cyclomatic = 0;
    int longest_function = 0;   // lines
    int function_count = 0;
};

// Measures one file for the Scan and Verify phases
class MetricsProvider {
public:
    virtual ~MetricsProvider() = default;
    virtual Result<FileMetrics> measure(const std::string& path) = 0;
};

// Complexity analysis through the scheduler, so baselines are cached by
// content fingerprint
class SchedulerMetricsProvider : public MetricsProvider {
public:
    explicit SchedulerMetricsProvider(analysis::Scheduler& scheduler) : scheduler_(scheduler) {}
    Result<FileMetrics> measure(const std::string& path) override;

private:
    analysis::Scheduler& scheduler_;
};

// Records the files of each completed batch
class CommitHook {
public:
    virtual ~CommitHook() = default;
    virtual Status commit(const std::vector<std::string>& files, const std::string& message) = 0;
};

class GitCommitHook : public CommitHook {
public:
    explicit GitCommitHook(std::string repo_dir) : repo_(std::move(repo_dir)) {}
    Status commit(const std::vector<std::string>& files, const std::string& message) override;

private:
    std::string repo_;
};

} // namespace pmat::refactor

#pragma once

#include <pmat/result.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pmat {

struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// Returns IO on fork/exec failure, Timeout when the deadline passes.
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Per-file change record from `git log --numstat`
struct FileChurn {
    std::string path;
    int commits = 0;
    int additions = 0;
    int deletions = 0;
    std::vector<std::string> authors;   // unique, first-seen order
    int64_t last_commit_time = 0;
};

// Parse output of
//   git log --numstat --format=commit:%H|%an|%at
// into per-file records sorted by commit count, then path.
std::vector<FileChurn> parse_numstat_log(const std::string& output);

// New-side line numbers of each hunk in `git diff -U0` output, by path.
// Deleted files are left out.
std::map<std::string, std::vector<int>> parse_diff_added_lines(const std::string& diff);

// Thin wrappers over the git CLI
class GitCli {
public:
    explicit GitCli(std::string repo_dir) : repo_(std::move(repo_dir)) {}

    bool is_repository() const;
    Result<std::string> head_commit() const;
    Result<std::string> current_branch() const;
    Result<std::vector<FileChurn>> churn(int period_days) const;
    Result<std::string> rev_parse(const std::string& ref) const;

    // Working tree against base, paths relative to the repo directory
    Result<std::map<std::string, std::vector<int>>> changed_lines(const std::string& base) const;
    Result<std::vector<std::string>> untracked_files() const;

    // Stage the given files and commit them with message
    Status commit(const std::vector<std::string>& files, const std::string& message) const;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }

private:
    Result<std::string> run_git(const std::vector<std::string>& args) const;

    std::string repo_;
    int timeout_seconds_ = 60;
};

} // namespace pmat

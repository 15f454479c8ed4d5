#include <pmat/refactor/metrics.hpp>
#include <pmat/analysis/scheduler.hpp>
#include <pmat/process.hpp>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace pmat::refactor {

Result<FileMetrics> SchedulerMetricsProvider::measure(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return PmatError(PmatError::NotFound, "not a readable file: " + path);
    }
    std::string name = fs::path(path).filename().string();
    auto result = scheduler_.submit(analysis::AnalysisKind::Complexity, path, {name},
                                    Json::Value(Json::objectValue));
    if (result.is_err()) return std::move(result).error();

    FileMetrics m;
    const Json::Value& files = (*result.value())["files"];
    if (files.empty()) {
        return PmatError(PmatError::BadRequest, "unsupported source language: " + path);
    }
    const Json::Value& f = files[Json::ArrayIndex(0)];
    m.max_cyclomatic = f["max_cyclomatic"].asInt();
    m.function_count = f["function_count"].asInt();
    for (const auto& fn : f["functions"]) {
        m.longest_function = std::max(m.longest_function, fn["lines"].asInt());
    }
    return Result<FileMetrics>::ok(m);
}

Status GitCommitHook::commit(const std::vector<std::string>& files, const std::string& message) {
    return GitCli(repo_).commit(files, message);
}

} // namespace pmat::refactor

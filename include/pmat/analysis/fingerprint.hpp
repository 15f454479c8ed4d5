#pragma once

#include <pmat/analysis/kind.hpp>
#include <pmat/result.hpp>
#include <json/json.h>
#include <filesystem>
#include <string>
#include <vector>

namespace pmat::analysis {

// One unit of analysis work. files are relative to root, sorted, with the
// content hash of each at the same index.
struct AnalysisJob {
    AnalysisKind kind = AnalysisKind::Complexity;
    std::string root;
    std::vector<std::string> files;
    std::vector<std::string> hashes;
    Json::Value options{Json::objectValue};   // semantic options only
    std::vector<std::string> salt;            // non-file state, e.g. git HEAD
    std::string fingerprint;

    std::filesystem::path abs(const std::string& rel) const;
};

// Options that only shape output: format, output, top_files, limit
bool is_presentation_option(const std::string& key);

// Copy of options with presentation keys and nulls removed
Json::Value semantic_options(const Json::Value& options);

// SHA-256 over kind, paths with their content hashes, canonical options
// (jsoncpp writes object keys sorted) and salt. Paths and hashes must be
// parallel; they are sorted here.
std::string compute_fingerprint(AnalysisKind kind,
                                std::vector<std::pair<std::string, std::string>> files,
                                const Json::Value& options,
                                const std::vector<std::string>& salt = {});

// Sorts files, hashes their contents and derives the fingerprint (without
// salt; the scheduler adds the analyzer's salt and re-derives).
Result<AnalysisJob> make_job(AnalysisKind kind, const std::string& root,
                             std::vector<std::string> files, const Json::Value& options);

// Recompute job.fingerprint from its current fields
void refresh_fingerprint(AnalysisJob& job);

} // namespace pmat::analysis

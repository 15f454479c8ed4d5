#pragma once

#include <pmat/analysis/fingerprint.hpp>
#include <pmat/analysis/source_scan.hpp>
#include <pmat/cache/cache_manager.hpp>
#include <pmat/result.hpp>
#include <json/json.h>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace pmat::analysis {

using ResultPtr = std::shared_ptr<const Json::Value>;

// A job input with its summary. Summaries are cached by absolute path, so
// report paths come from rel.
struct SourceFile {
    std::string rel;
    std::shared_ptr<const FileSummary> summary;
};

// What an analyzer may use while running: the caches, and nested analyses
// (run inline on the calling worker, cached by fingerprint).
class AnalysisContext {
public:
    using SubRunner = std::function<Result<ResultPtr>(const AnalysisJob&)>;

    AnalysisContext(cache::CacheManager& caches, SubRunner sub)
        : caches_(caches), sub_(std::move(sub)) {}

    cache::CacheManager& caches() { return caches_; }

    // Summary of one input file through the AST cache
    Result<std::shared_ptr<const FileSummary>> summary(const AnalysisJob& job, size_t index);

    // Every source-language input; unreadable files are logged and skipped
    std::vector<SourceFile> sources(const AnalysisJob& job);

    // Run another kind over the same inputs
    Result<ResultPtr> sub_analysis(const AnalysisJob& parent, AnalysisKind kind,
                                   const Json::Value& options = Json::Value(Json::objectValue));

private:
    cache::CacheManager& caches_;
    SubRunner sub_;
};

class Analyzer {
public:
    virtual ~Analyzer() = default;
    virtual AnalysisKind kind() const = 0;

    // State besides file contents that the result depends on
    virtual Result<std::vector<std::string>> fingerprint_salt(const AnalysisJob&) const {
        return Result<std::vector<std::string>>::ok({});
    }

    virtual Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) = 0;
};

class AnalyzerRegistry {
public:
    void add(std::unique_ptr<Analyzer> analyzer);

    // nullptr when no analyzer is registered for kind
    Analyzer* find(AnalysisKind kind) const;
    bool contains(AnalysisKind kind) const { return find(kind) != nullptr; }
    std::vector<AnalysisKind> kinds() const;

private:
    std::map<AnalysisKind, std::unique_ptr<Analyzer>> analyzers_;
};

void register_builtin_analyzers(AnalyzerRegistry& registry);

// Individual builtins, exposed for tests and for registry composition
std::unique_ptr<Analyzer> make_complexity_analyzer();
std::unique_ptr<Analyzer> make_dead_code_analyzer();
std::unique_ptr<Analyzer> make_satd_analyzer();
std::unique_ptr<Analyzer> make_makefile_analyzer();
std::unique_ptr<Analyzer> make_dag_analyzer();
std::unique_ptr<Analyzer> make_graph_metrics_analyzer();
std::unique_ptr<Analyzer> make_symbol_table_analyzer();
std::unique_ptr<Analyzer> make_duplicates_analyzer();
std::unique_ptr<Analyzer> make_name_similarity_analyzer();
std::unique_ptr<Analyzer> make_churn_analyzer();
std::unique_ptr<Analyzer> make_defect_prediction_analyzer();
std::unique_ptr<Analyzer> make_tdg_analyzer();
std::unique_ptr<Analyzer> make_deep_context_analyzer();
std::unique_ptr<Analyzer> make_comprehensive_analyzer();
std::unique_ptr<Analyzer> make_quality_gate_analyzer();
std::unique_ptr<Analyzer> make_provability_analyzer();
std::unique_ptr<Analyzer> make_proof_annotations_analyzer();
std::unique_ptr<Analyzer> make_incremental_coverage_analyzer();

// Executed lines per source file of an lcov tracefile (SF/DA records)
std::map<std::string, std::set<int>> lcov_covered_lines(const std::string& report);

// Normalized edit-distance similarity in [0, 1]
double name_similarity(const std::string& a, const std::string& b);

} // namespace pmat::analysis

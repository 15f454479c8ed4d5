#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pmat::analysis {

enum class AnalysisKind {
    Complexity,
    DeadCode,
    Satd,
    Makefile,
    Dag,
    GraphMetrics,
    SymbolTable,
    Duplicates,
    NameSimilarity,
    DefectPrediction,
    Provability,
    ProofAnnotations,
    Tdg,
    DeepContext,
    Comprehensive,
    Churn,
    IncrementalCoverage,
    QualityGate
};

// CLI / method spelling: "dead-code", "graph-metrics", ...
const char* kind_name(AnalysisKind kind);

// Accepts the dashed name and the underscored form ("dead_code")
std::optional<AnalysisKind> parse_kind(const std::string& name);

const std::vector<AnalysisKind>& all_kinds();

} // namespace pmat::analysis

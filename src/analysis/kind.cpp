#include <pmat/analysis/kind.hpp>
#include <algorithm>

namespace pmat::analysis {

const char* kind_name(AnalysisKind kind) {
    switch (kind) {
        case AnalysisKind::Complexity: return "complexity";
        case AnalysisKind::DeadCode: return "dead-code";
        case AnalysisKind::Satd: return "satd";
        case AnalysisKind::Makefile: return "makefile";
        case AnalysisKind::Dag: return "dag";
        case AnalysisKind::GraphMetrics: return "graph-metrics";
        case AnalysisKind::SymbolTable: return "symbol-table";
        case AnalysisKind::Duplicates: return "duplicates";
        case AnalysisKind::NameSimilarity: return "name-similarity";
        case AnalysisKind::DefectPrediction: return "defect-prediction";
        case AnalysisKind::Provability: return "provability";
        case AnalysisKind::ProofAnnotations: return "proof-annotations";
        case AnalysisKind::Tdg: return "tdg";
        case AnalysisKind::DeepContext: return "deep-context";
        case AnalysisKind::Comprehensive: return "comprehensive";
        case AnalysisKind::Churn: return "churn";
        case AnalysisKind::IncrementalCoverage: return "incremental-coverage";
        case AnalysisKind::QualityGate: return "quality-gate";
    }
    return "unknown";
}

const std::vector<AnalysisKind>& all_kinds() {
    static const std::vector<AnalysisKind> kinds = {
        AnalysisKind::Complexity, AnalysisKind::DeadCode, AnalysisKind::Satd,
        AnalysisKind::Makefile, AnalysisKind::Dag, AnalysisKind::GraphMetrics,
        AnalysisKind::SymbolTable, AnalysisKind::Duplicates, AnalysisKind::NameSimilarity,
        AnalysisKind::DefectPrediction, AnalysisKind::Provability,
        AnalysisKind::ProofAnnotations, AnalysisKind::Tdg, AnalysisKind::DeepContext,
        AnalysisKind::Comprehensive, AnalysisKind::Churn,
        AnalysisKind::IncrementalCoverage, AnalysisKind::QualityGate,
    };
    return kinds;
}

std::optional<AnalysisKind> parse_kind(const std::string& name) {
    std::string dashed = name;
    std::replace(dashed.begin(), dashed.end(), '_', '-');
    for (auto k : all_kinds()) {
        if (dashed == kind_name(k)) return k;
    }
    return std::nullopt;
}

} // namespace pmat::analysis

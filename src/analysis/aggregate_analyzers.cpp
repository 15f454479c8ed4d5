#include <pmat/analysis/analyzers.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>
#include <pmat/process.hpp>

#include <algorithm>
#include <map>

namespace fs = std::filesystem;

// Analyses composed from the results of other kinds. Sub-analyses run
// through AnalysisContext, so they share the analysis cache with direct
// requests for the same kind.

namespace pmat::analysis {

namespace {

double round2(double v) {
    return static_cast<double>(static_cast<int64_t>(v * 100.0 + 0.5)) / 100.0;
}

double clamp01(double v) {
    return std::max(0.0, std::min(1.0, v));
}

std::string repo_of(const AnalysisJob& job) {
    fs::path r(job.root.empty() ? "." : job.root);
    std::error_code ec;
    if (fs::is_regular_file(r, ec)) r = r.parent_path();
    return r.empty() ? "." : r.string();
}

// Results that fold in churn depend on HEAD when the root is a repository
Result<std::vector<std::string>> optional_git_salt(const AnalysisJob& job) {
    GitCli git(repo_of(job));
    if (!git.is_repository()) return Result<std::vector<std::string>>::ok({});
    auto head = git.head_commit();
    if (head.is_err()) return Result<std::vector<std::string>>::ok({});
    auto branch = git.current_branch();
    return Result<std::vector<std::string>>::ok(
        {head.value(), branch.is_ok() ? branch.value() : std::string()});
}

// Churn is optional input: outside a repository it contributes nothing
std::map<std::string, int> churn_commits(const AnalysisJob& job, AnalysisContext& ctx) {
    std::map<std::string, int> out;
    if (!GitCli(repo_of(job)).is_repository()) return out;
    auto churn = ctx.sub_analysis(job, AnalysisKind::Churn);
    if (churn.is_err()) {
        log::debug("churn unavailable: %s", churn.error().message.c_str());
        return out;
    }
    for (const auto& f : (*churn.value())["files"]) {
        out[f["path"].asString()] = f["commits"].asInt();
    }
    return out;
}

int max_value(const std::map<std::string, int>& m) {
    int best = 0;
    for (const auto& kv : m) best = std::max(best, kv.second);
    return best;
}

std::string risk_level(double p) {
    if (p >= 0.6) return "high";
    if (p >= 0.3) return "medium";
    return "low";
}

// ---------------------------------------------------------------------------
// defect-prediction
// ---------------------------------------------------------------------------

class DefectPredictionAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::DefectPrediction; }

    Result<std::vector<std::string>> fingerprint_salt(const AnalysisJob& job) const override {
        return optional_git_salt(job);
    }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto churn = churn_commits(job, ctx);
        int max_commits = max_value(churn);
        auto sources = ctx.sources(job);

        int max_lines = 1;
        for (const auto& src : sources) max_lines = std::max(max_lines, src.summary->lines);

        struct Row {
            std::string path;
            double probability;
            Json::Value factors;
        };
        std::vector<Row> rows;
        for (const auto& src : sources) {
            const FileSummary& s = *src.summary;
            double complexity = clamp01(s.max_cyclomatic() / 30.0);
            double change = max_commits == 0 ? 0.0
                : static_cast<double>(churn[src.rel]) / max_commits;
            double debt = clamp01(static_cast<double>(s.satd.size()) / 5.0);
            double size = static_cast<double>(s.lines) / max_lines;
            double p = 0.4 * complexity + 0.3 * change + 0.15 * debt + 0.15 * size;

            Json::Value factors(Json::objectValue);
            factors["complexity"] = round2(complexity);
            factors["churn"] = round2(change);
            factors["debt"] = round2(debt);
            factors["size"] = round2(size);
            rows.push_back({src.rel, p, factors});
        }
        std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
            if (a.probability != b.probability) return a.probability > b.probability;
            return a.path < b.path;
        });

        Json::Value files(Json::arrayValue);
        std::map<std::string, int> by_risk = {{"high", 0}, {"medium", 0}, {"low", 0}};
        for (const auto& r : rows) {
            Json::Value f(Json::objectValue);
            f["path"] = r.path;
            f["probability"] = round2(r.probability);
            f["risk"] = risk_level(r.probability);
            f["factors"] = r.factors;
            files.append(f);
            by_risk[risk_level(r.probability)]++;
        }

        Json::Value summary(Json::objectValue);
        summary["total_files"] = static_cast<int>(rows.size());
        summary["high_risk"] = by_risk["high"];
        summary["medium_risk"] = by_risk["medium"];
        summary["low_risk"] = by_risk["low"];
        summary["churn_available"] = max_commits > 0;

        Json::Value out(Json::objectValue);
        out["files"] = files;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// tdg (technical debt gradient, 0..5)
// ---------------------------------------------------------------------------

class TdgAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Tdg; }

    Result<std::vector<std::string>> fingerprint_salt(const AnalysisJob& job) const override {
        return optional_git_salt(job);
    }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto dag = ctx.sub_analysis(job, AnalysisKind::Dag);
        if (dag.is_err()) return std::move(dag).error();
        auto dups = ctx.sub_analysis(job, AnalysisKind::Duplicates);
        if (dups.is_err()) return std::move(dups).error();
        auto churn = churn_commits(job, ctx);
        int max_commits = max_value(churn);

        std::map<std::string, int> coupling;
        int max_coupling = 0;
        for (const auto& n : (*dag.value())["nodes"]) {
            int c = n["in_degree"].asInt() + n["out_degree"].asInt();
            coupling[n["path"].asString()] = c;
            max_coupling = std::max(max_coupling, c);
        }
        const Json::Value& dup_by_file = (*dups.value())["duplicated_lines_by_file"];

        struct Row {
            std::string path;
            double score;
            Json::Value components;
        };
        std::vector<Row> rows;
        for (const auto& src : ctx.sources(job)) {
            const FileSummary& s = *src.summary;
            double complexity = clamp01(s.max_cyclomatic() / 30.0);
            double change = max_commits == 0 ? 0.0
                : static_cast<double>(churn[src.rel]) / max_commits;
            double coupled = max_coupling == 0 ? 0.0
                : static_cast<double>(coupling[src.rel]) / max_coupling;
            double debt = clamp01(static_cast<double>(s.satd.size()) / 5.0);
            double dup = s.lines == 0 ? 0.0
                : clamp01(dup_by_file.get(src.rel, Json::Value(0)).asDouble() / s.lines);
            double score = 5.0 * (0.35 * complexity + 0.25 * change + 0.2 * coupled +
                                  0.1 * debt + 0.1 * dup);

            Json::Value c(Json::objectValue);
            c["complexity"] = round2(complexity);
            c["churn"] = round2(change);
            c["coupling"] = round2(coupled);
            c["debt"] = round2(debt);
            c["duplication"] = round2(dup);
            rows.push_back({src.rel, score, c});
        }
        std::sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
            if (a.score != b.score) return a.score > b.score;
            return a.path < b.path;
        });

        Json::Value files(Json::arrayValue);
        int critical = 0;
        int warning = 0;
        double total = 0;
        for (const auto& r : rows) {
            Json::Value f(Json::objectValue);
            f["path"] = r.path;
            f["tdg"] = round2(r.score);
            std::string severity = r.score > 2.5 ? "critical" : r.score > 1.5 ? "warning" : "normal";
            f["severity"] = severity;
            f["components"] = r.components;
            files.append(f);
            if (severity == "critical") critical++;
            if (severity == "warning") warning++;
            total += r.score;
        }

        Json::Value summary(Json::objectValue);
        summary["total_files"] = static_cast<int>(rows.size());
        summary["average_tdg"] = rows.empty() ? 0.0 : round2(total / rows.size());
        summary["max_tdg"] = rows.empty() ? 0.0 : round2(rows.front().score);
        summary["critical_files"] = critical;
        summary["warning_files"] = warning;

        Json::Value out(Json::objectValue);
        out["files"] = files;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// deep-context
// ---------------------------------------------------------------------------

class DeepContextAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::DeepContext; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto dag = ctx.sub_analysis(job, AnalysisKind::Dag);
        if (dag.is_err()) return std::move(dag).error();

        std::map<std::string, Json::Value> languages;
        Json::Value files(Json::arrayValue);
        struct Hot {
            std::string path;
            FunctionInfo fn;
        };
        std::vector<Hot> hot;
        int total_lines = 0;
        int total_functions = 0;
        int satd = 0;

        for (const auto& src : ctx.sources(job)) {
            const FileSummary& s = *src.summary;
            Json::Value f(Json::objectValue);
            f["path"] = src.rel;
            f["language"] = language_name(s.language);
            f["lines"] = s.lines;
            f["functions"] = static_cast<int>(s.functions.size());
            f["max_cyclomatic"] = s.max_cyclomatic();
            Json::Value names(Json::arrayValue);
            for (const auto& fn : s.functions) {
                names.append(fn.name);
                hot.push_back({src.rel, fn});
            }
            f["symbols"] = names;
            files.append(f);

            Json::Value& lang = languages[language_name(s.language)];
            if (lang.isNull()) {
                lang = Json::Value(Json::objectValue);
                lang["files"] = 0;
                lang["lines"] = 0;
            }
            lang["files"] = lang["files"].asInt() + 1;
            lang["lines"] = lang["lines"].asInt() + s.lines;

            total_lines += s.lines;
            total_functions += static_cast<int>(s.functions.size());
            satd += static_cast<int>(s.satd.size());
        }

        std::sort(hot.begin(), hot.end(), [](const Hot& a, const Hot& b) {
            if (a.fn.cyclomatic != b.fn.cyclomatic) return a.fn.cyclomatic > b.fn.cyclomatic;
            if (a.path != b.path) return a.path < b.path;
            return a.fn.start_line < b.fn.start_line;
        });
        Json::Value hotspots(Json::arrayValue);
        for (size_t i = 0; i < hot.size() && i < 10; ++i) {
            Json::Value h(Json::objectValue);
            h["path"] = hot[i].path;
            h["function"] = hot[i].fn.name;
            h["line"] = hot[i].fn.start_line;
            h["cyclomatic"] = hot[i].fn.cyclomatic;
            h["cognitive"] = hot[i].fn.cognitive;
            hotspots.append(h);
        }

        Json::Value project(Json::objectValue);
        project["root"] = job.root;
        project["total_files"] = static_cast<int>(files.size());
        project["total_lines"] = total_lines;
        project["total_functions"] = total_functions;
        project["satd_items"] = satd;
        Json::Value langs(Json::objectValue);
        for (const auto& kv : languages) langs[kv.first] = kv.second;
        project["languages"] = langs;

        Json::Value deps(Json::objectValue);
        deps["node_count"] = (*dag.value())["node_count"];
        deps["edge_count"] = (*dag.value())["edge_count"];
        deps["has_cycles"] = (*dag.value())["has_cycles"];
        deps["cycles"] = (*dag.value())["cycles"];

        Json::Value out(Json::objectValue);
        out["project"] = project;
        out["files"] = files;
        out["hotspots"] = hotspots;
        out["dependencies"] = deps;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// comprehensive
// ---------------------------------------------------------------------------

class ComprehensiveAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Comprehensive; }

    Result<std::vector<std::string>> fingerprint_salt(const AnalysisJob& job) const override {
        return optional_git_salt(job);
    }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        static const std::vector<AnalysisKind> parts = {
            AnalysisKind::Complexity, AnalysisKind::DeadCode, AnalysisKind::Satd,
            AnalysisKind::Duplicates, AnalysisKind::Dag, AnalysisKind::DefectPrediction,
            AnalysisKind::Tdg,
        };
        Json::Value sections(Json::objectValue);
        int failed = 0;
        for (auto k : parts) {
            auto r = ctx.sub_analysis(job, k);
            Json::Value section(Json::objectValue);
            if (r.is_err()) {
                section["error"] = r.error().format();
                failed++;
            } else if (r.value()->isMember("summary")) {
                section = (*r.value())["summary"];
            } else {
                section["node_count"] = (*r.value())["node_count"];
                section["edge_count"] = (*r.value())["edge_count"];
                section["has_cycles"] = (*r.value())["has_cycles"];
            }
            sections[kind_name(k)] = section;
        }

        Json::Value out(Json::objectValue);
        out["root"] = job.root;
        out["files_analyzed"] = static_cast<Json::UInt64>(job.files.size());
        out["sections"] = sections;
        out["failed_sections"] = failed;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// quality-gate
// ---------------------------------------------------------------------------

class QualityGateAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::QualityGate; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto max_complexity = json::get_int(job.options, "max_complexity", 20);
        if (max_complexity.is_err()) return std::move(max_complexity).error();
        auto max_satd = json::get_int(job.options, "max_satd", 0);
        if (max_satd.is_err()) return std::move(max_satd).error();
        double max_dead = 15.0;
        double max_dup = 0.10;
        if (job.options.isMember("max_dead_code_percent")) {
            if (!job.options["max_dead_code_percent"].isNumeric()) {
                return PmatError::validation("max_dead_code_percent", "expected a number");
            }
            max_dead = job.options["max_dead_code_percent"].asDouble();
        }
        if (job.options.isMember("max_duplication_ratio")) {
            if (!job.options["max_duplication_ratio"].isNumeric()) {
                return PmatError::validation("max_duplication_ratio", "expected a number");
            }
            max_dup = job.options["max_duplication_ratio"].asDouble();
        }

        auto complexity = ctx.sub_analysis(job, AnalysisKind::Complexity);
        if (complexity.is_err()) return std::move(complexity).error();
        auto satd = ctx.sub_analysis(job, AnalysisKind::Satd);
        if (satd.is_err()) return std::move(satd).error();
        auto dead = ctx.sub_analysis(job, AnalysisKind::DeadCode);
        if (dead.is_err()) return std::move(dead).error();
        auto dups = ctx.sub_analysis(job, AnalysisKind::Duplicates);
        if (dups.is_err()) return std::move(dups).error();

        const Json::Value& sev = (*satd.value())["summary"]["by_severity"];
        double worst = (*complexity.value())["summary"]["max_cyclomatic"].asDouble();
        double blocking = sev["High"].asDouble() + sev["Critical"].asDouble();
        double dead_pct = (*dead.value())["summary"]["dead_percentage"].asDouble();
        double dup_ratio = (*dups.value())["summary"]["duplication_ratio"].asDouble();

        Json::Value checks(Json::arrayValue);
        bool passed = true;
        auto check = [&](const char* name, double value, double limit) {
            Json::Value c(Json::objectValue);
            c["name"] = name;
            c["value"] = value;
            c["threshold"] = limit;
            c["passed"] = value <= limit;
            passed = passed && value <= limit;
            checks.append(c);
        };
        check("complexity", worst, static_cast<double>(max_complexity.value()));
        check("satd", blocking, static_cast<double>(max_satd.value()));
        check("dead_code", dead_pct, max_dead);
        check("duplication", dup_ratio, max_dup);

        Json::Value out(Json::objectValue);
        out["passed"] = passed;
        out["checks"] = checks;
        return Result<Json::Value>::ok(out);
    }
};

} // namespace

std::unique_ptr<Analyzer> make_defect_prediction_analyzer() {
    return std::make_unique<DefectPredictionAnalyzer>();
}
std::unique_ptr<Analyzer> make_tdg_analyzer() { return std::make_unique<TdgAnalyzer>(); }
std::unique_ptr<Analyzer> make_deep_context_analyzer() {
    return std::make_unique<DeepContextAnalyzer>();
}
std::unique_ptr<Analyzer> make_comprehensive_analyzer() {
    return std::make_unique<ComprehensiveAnalyzer>();
}
std::unique_ptr<Analyzer> make_quality_gate_analyzer() {
    return std::make_unique<QualityGateAnalyzer>();
}

} // namespace pmat::analysis

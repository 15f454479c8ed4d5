#include <pmat/analysis/analyzers.hpp>
#include <pmat/graph.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>
#include <pmat/process.hpp>
#include <pmat/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace pmat::analysis {

// ---------------------------------------------------------------------------
// Context and registry
// ---------------------------------------------------------------------------

Result<std::shared_ptr<const FileSummary>> AnalysisContext::summary(const AnalysisJob& job,
                                                                    size_t index) {
    fs::path path = job.abs(job.files[index]);
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (ec) {
        return PmatError::io("cannot stat input: " + ec.message()).with_file(path.string());
    }
    cache::AstKey key{path.string(), std::chrono::duration_cast<std::chrono::nanoseconds>(
        mtime.time_since_epoch()).count()};

    if (auto hit = caches_.ast().get(key)) {
        if (index >= job.hashes.size() || hit->content_hash == job.hashes[index]) {
            return Result<std::shared_ptr<const FileSummary>>::ok(hit);
        }
    }

    auto scanned = scan_file(path);
    if (scanned.is_err()) return std::move(scanned).error();
    auto ptr = std::make_shared<const FileSummary>(std::move(scanned).value());
    auto st = caches_.ast().put(key, ptr);
    if (st.is_err()) {
        log::warn("ast cache write failed: %s", st.error().message.c_str());
    }
    return Result<std::shared_ptr<const FileSummary>>::ok(ptr);
}

std::vector<SourceFile> AnalysisContext::sources(const AnalysisJob& job) {
    std::vector<SourceFile> out;
    for (size_t i = 0; i < job.files.size(); ++i) {
        if (!is_source_language(detect_language(job.files[i]))) continue;
        auto s = summary(job, i);
        if (s.is_err()) {
            log::warn("skipping %s: %s", job.files[i].c_str(), s.error().message.c_str());
            continue;
        }
        out.push_back({job.files[i], s.value()});
    }
    return out;
}

Result<ResultPtr> AnalysisContext::sub_analysis(const AnalysisJob& parent, AnalysisKind kind,
                                                const Json::Value& options) {
    AnalysisJob sub = parent;
    sub.kind = kind;
    sub.options = semantic_options(options);
    sub.salt.clear();
    return sub_(sub);
}

void AnalyzerRegistry::add(std::unique_ptr<Analyzer> analyzer) {
    AnalysisKind k = analyzer->kind();
    analyzers_[k] = std::move(analyzer);
}

Analyzer* AnalyzerRegistry::find(AnalysisKind kind) const {
    auto it = analyzers_.find(kind);
    return it == analyzers_.end() ? nullptr : it->second.get();
}

std::vector<AnalysisKind> AnalyzerRegistry::kinds() const {
    std::vector<AnalysisKind> out;
    for (const auto& kv : analyzers_) out.push_back(kv.first);
    return out;
}

void register_builtin_analyzers(AnalyzerRegistry& registry) {
    registry.add(make_complexity_analyzer());
    registry.add(make_dead_code_analyzer());
    registry.add(make_satd_analyzer());
    registry.add(make_makefile_analyzer());
    registry.add(make_dag_analyzer());
    registry.add(make_graph_metrics_analyzer());
    registry.add(make_symbol_table_analyzer());
    registry.add(make_duplicates_analyzer());
    registry.add(make_name_similarity_analyzer());
    registry.add(make_churn_analyzer());
    registry.add(make_defect_prediction_analyzer());
    registry.add(make_tdg_analyzer());
    registry.add(make_deep_context_analyzer());
    registry.add(make_comprehensive_analyzer());
    registry.add(make_quality_gate_analyzer());
    registry.add(make_provability_analyzer());
    registry.add(make_proof_annotations_analyzer());
    registry.add(make_incremental_coverage_analyzer());
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static double round2(double v) {
    return static_cast<double>(static_cast<int64_t>(v * 100.0 + (v >= 0 ? 0.5 : -0.5))) / 100.0;
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

// ---------------------------------------------------------------------------
// complexity
// ---------------------------------------------------------------------------

namespace {

class ComplexityAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Complexity; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto max_cyc = json::get_int(job.options, "max_cyclomatic", 20);
        if (max_cyc.is_err()) return std::move(max_cyc).error();
        auto max_cog = json::get_int(job.options, "max_cognitive", 15);
        if (max_cog.is_err()) return std::move(max_cog).error();

        Json::Value files(Json::arrayValue);
        Json::Value violations(Json::arrayValue);
        std::vector<int> all_cyclomatic;
        int total_functions = 0;
        int worst_cyc = 0;
        int worst_cog = 0;

        for (const auto& src : ctx.sources(job)) {
            const FileSummary& s = *src.summary;
            Json::Value f = to_json(s);
            f["path"] = src.rel;
            files.append(f);

            for (const auto& fn : s.functions) {
                total_functions++;
                all_cyclomatic.push_back(fn.cyclomatic);
                worst_cyc = std::max(worst_cyc, fn.cyclomatic);
                worst_cog = std::max(worst_cog, fn.cognitive);
                if (fn.cyclomatic > max_cyc.value()) {
                    violations.append(violation(src.rel, fn, "cyclomatic", fn.cyclomatic,
                                                max_cyc.value()));
                }
                if (fn.cognitive > max_cog.value()) {
                    violations.append(violation(src.rel, fn, "cognitive", fn.cognitive,
                                                max_cog.value()));
                }
            }
        }

        std::sort(all_cyclomatic.begin(), all_cyclomatic.end());
        double avg = 0;
        for (int c : all_cyclomatic) avg += c;
        if (!all_cyclomatic.empty()) avg /= static_cast<double>(all_cyclomatic.size());
        int p90 = all_cyclomatic.empty()
            ? 0 : all_cyclomatic[(all_cyclomatic.size() - 1) * 9 / 10];

        Json::Value summary(Json::objectValue);
        summary["total_files"] = static_cast<int>(files.size());
        summary["total_functions"] = total_functions;
        summary["average_cyclomatic"] = round2(avg);
        summary["p90_cyclomatic"] = p90;
        summary["max_cyclomatic"] = worst_cyc;
        summary["max_cognitive"] = worst_cog;
        summary["violation_count"] = static_cast<int>(violations.size());

        Json::Value out(Json::objectValue);
        out["files"] = files;
        out["violations"] = violations;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }

private:
    static Json::Value violation(const std::string& path, const FunctionInfo& fn,
                                 const char* metric, int value, int64_t threshold) {
        Json::Value v(Json::objectValue);
        v["path"] = path;
        v["function"] = fn.name;
        v["line"] = fn.start_line;
        v["metric"] = metric;
        v["value"] = value;
        v["threshold"] = Json::Int64(threshold);
        return v;
    }
};

// ---------------------------------------------------------------------------
// dead-code
// ---------------------------------------------------------------------------

bool is_entry_point(const std::string& name, const std::string& path) {
    static const std::unordered_set<std::string> roots = {
        "main", "new", "default", "drop", "fmt", "from", "into", "clone", "eq", "hash",
        "deref", "constructor", "setup", "teardown", "setUp", "tearDown", "init",
        "render", "handle", "run",
    };
    if (roots.count(name)) return true;
    if (name.rfind("test", 0) == 0 || name.rfind("Test", 0) == 0) return true;
    if (name.size() > 4 && name.rfind("__", 0) == 0 && name.compare(name.size() - 2, 2, "__") == 0) {
        return true;
    }
    std::string p = "/" + path;
    return p.find("/tests/") != std::string::npos || p.find("/test/") != std::string::npos;
}

class DeadCodeAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::DeadCode; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto sources = ctx.sources(job);
        std::unordered_set<std::string> referenced;
        for (const auto& src : sources) {
            referenced.insert(src.summary->identifiers.begin(), src.summary->identifiers.end());
        }

        Json::Value dead(Json::arrayValue);
        int total = 0;
        int dead_lines = 0;
        for (const auto& src : sources) {
            for (const auto& fn : src.summary->functions) {
                total++;
                if (referenced.count(fn.name) || is_entry_point(fn.name, src.rel)) continue;
                Json::Value d(Json::objectValue);
                d["path"] = src.rel;
                d["name"] = fn.name;
                d["line"] = fn.start_line;
                d["lines"] = fn.lines();
                dead.append(d);
                dead_lines += fn.lines();
            }
        }

        Json::Value summary(Json::objectValue);
        summary["total_functions"] = total;
        summary["dead_functions"] = static_cast<int>(dead.size());
        summary["dead_lines"] = dead_lines;
        summary["dead_percentage"] = total == 0
            ? 0.0 : round2(100.0 * static_cast<double>(dead.size()) / total);

        Json::Value out(Json::objectValue);
        out["dead_functions"] = dead;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// satd
// ---------------------------------------------------------------------------

class SatdAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Satd; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        Json::Value items(Json::arrayValue);
        std::map<std::string, int> by_severity = {
            {"Critical", 0}, {"High", 0}, {"Medium", 0}, {"Low", 0}};
        std::map<std::string, int> by_category;
        int files_with_debt = 0;

        for (const auto& src : ctx.sources(job)) {
            if (!src.summary->satd.empty()) files_with_debt++;
            for (const auto& item : src.summary->satd) {
                Json::Value j(Json::objectValue);
                j["path"] = src.rel;
                j["line"] = item.line;
                j["marker"] = item.marker;
                j["category"] = item.category;
                j["severity"] = item.severity;
                j["text"] = item.text;
                items.append(j);
                by_severity[item.severity]++;
                by_category[item.category]++;
            }
        }

        Json::Value summary(Json::objectValue);
        summary["total_items"] = static_cast<int>(items.size());
        summary["files_with_debt"] = files_with_debt;
        Json::Value sev(Json::objectValue);
        for (const auto& kv : by_severity) sev[kv.first] = kv.second;
        summary["by_severity"] = sev;
        Json::Value cat(Json::objectValue);
        for (const auto& kv : by_category) cat[kv.first] = kv.second;
        summary["by_category"] = cat;

        Json::Value out(Json::objectValue);
        out["items"] = items;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// makefile
// ---------------------------------------------------------------------------

struct MakeViolation {
    std::string rule;
    int line;
    std::string severity;
    std::string message;
};

std::vector<MakeViolation> lint_makefile(const std::string& content, int64_t max_body,
                                         int& target_count) {
    static const std::vector<std::string> required = {"all", "clean", "test"};
    static const std::set<std::string> common_phony = {
        "all", "clean", "test", "install", "build", "lint", "format", "help", "check",
        "run", "dist", "coverage", "bench", "docs", "release",
    };

    std::vector<MakeViolation> out;
    std::map<std::string, int> targets;
    std::set<std::string> phony;
    auto lines = split_lines(content);

    std::string current;
    int current_line = 0;
    int body = 0;
    auto close_rule = [&]() {
        if (!current.empty() && body > max_body) {
            out.push_back({"maxbodylength", current_line, "warning",
                "Target '" + current + "' has " + std::to_string(body) +
                " recipe lines (max " + std::to_string(max_body) + ")"});
        }
        current.clear();
        body = 0;
    };

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        int lineno = static_cast<int>(i) + 1;
        if (!line.empty() && line[0] == '\t') {
            if (!current.empty()) body++;
            continue;
        }
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;

        if (line[0] == ' ' && !current.empty()) {
            out.push_back({"recipe-spaces", lineno, "error",
                "Recipe line indented with spaces instead of a tab"});
            body++;
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos || (colon + 1 < line.size() && line[colon + 1] == '=') ||
            line.substr(0, colon).find('=') != std::string::npos) {
            close_rule();
            continue;
        }

        close_rule();
        std::string lhs = trim(line.substr(0, colon));
        std::string rhs = line.substr(colon + 1);
        if (!rhs.empty() && rhs[0] == ':') rhs = rhs.substr(1);

        if (lhs == ".PHONY") {
            std::istringstream ss(rhs);
            std::string name;
            while (ss >> name) phony.insert(name);
            continue;
        }
        std::istringstream ss(lhs);
        std::string name;
        while (ss >> name) {
            if (name[0] == '.') continue;
            if (!targets.count(name)) targets[name] = lineno;
            if (current.empty()) {
                current = name;
                current_line = lineno;
            }
        }
    }
    close_rule();

    for (const auto& req : required) {
        if (!targets.count(req)) {
            out.push_back({"minphony", 1, "warning",
                "Missing required phony target '" + req + "'"});
        }
    }
    for (const auto& kv : targets) {
        if (common_phony.count(kv.first) && !phony.count(kv.first)) {
            out.push_back({"phonydeclared", kv.second, "warning",
                "Target '" + kv.first + "' should be declared .PHONY"});
        }
    }
    std::sort(out.begin(), out.end(), [](const MakeViolation& a, const MakeViolation& b) {
        if (a.line != b.line) return a.line < b.line;
        return a.rule < b.rule;
    });
    target_count = static_cast<int>(targets.size());
    return out;
}

class MakefileAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Makefile; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext&) override {
        auto max_body = json::get_int(job.options, "max_body_length", 5);
        if (max_body.is_err()) return std::move(max_body).error();

        Json::Value files(Json::arrayValue);
        int errors = 0;
        int warnings = 0;
        for (const auto& rel : job.files) {
            if (detect_language(rel) != Language::Makefile) continue;
            auto content = read_file(job.abs(rel));
            if (content.is_err()) return std::move(content).error();

            int targets = 0;
            auto violations = lint_makefile(content.value(), max_body.value(), targets);
            Json::Value f(Json::objectValue);
            f["path"] = rel;
            f["targets"] = targets;
            Json::Value vs(Json::arrayValue);
            for (const auto& v : violations) {
                Json::Value j(Json::objectValue);
                j["rule"] = v.rule;
                j["line"] = v.line;
                j["severity"] = v.severity;
                j["message"] = v.message;
                vs.append(j);
                (v.severity == "error" ? errors : warnings)++;
            }
            f["violations"] = vs;
            files.append(f);
        }

        Json::Value summary(Json::objectValue);
        summary["files"] = static_cast<int>(files.size());
        summary["total_violations"] = errors + warnings;
        summary["errors"] = errors;
        summary["warnings"] = warnings;
        summary["quality_score"] = std::max(0, 100 - 10 * errors - 5 * warnings);

        Json::Value out(Json::objectValue);
        out["files"] = files;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// Dependency graph (shared by dag and graph-metrics through the DAG cache)
// ---------------------------------------------------------------------------

std::string normalize(const fs::path& p) {
    return p.lexically_normal().generic_string();
}

std::vector<std::string> import_candidates(Language lang, const std::string& from,
                                           const std::string& target) {
    fs::path dir = fs::path(from).parent_path();
    std::vector<std::string> c;
    switch (lang) {
        case Language::C:
        case Language::Cpp:
            c.push_back(normalize(dir / target));
            c.push_back(normalize(fs::path(target)));
            c.push_back(normalize(fs::path("include") / target));
            c.push_back(normalize(fs::path("src") / target));
            break;
        case Language::Rust: {
            std::string stem = fs::path(from).stem().string();
            c.push_back(normalize(dir / (target + ".rs")));
            c.push_back(normalize(dir / target / "mod.rs"));
            if (stem != "mod" && stem != "lib" && stem != "main") {
                c.push_back(normalize(dir / stem / (target + ".rs")));
                c.push_back(normalize(dir / stem / target / "mod.rs"));
            }
            break;
        }
        case Language::Python: {
            size_t dots = 0;
            while (dots < target.size() && target[dots] == '.') dots++;
            std::string mod = target.substr(dots);
            std::replace(mod.begin(), mod.end(), '.', '/');
            fs::path base;
            if (dots > 0) {
                base = dir;
                for (size_t i = 1; i < dots; ++i) base = base.parent_path();
            }
            if (mod.empty()) {
                c.push_back(normalize(base / "__init__.py"));
            } else {
                c.push_back(normalize(base / (mod + ".py")));
                c.push_back(normalize(base / mod / "__init__.py"));
                if (dots == 0) {
                    c.push_back(normalize(fs::path("src") / (mod + ".py")));
                    c.push_back(normalize(dir / (mod + ".py")));
                }
            }
            break;
        }
        case Language::JavaScript:
        case Language::TypeScript: {
            fs::path base = dir / target;
            c.push_back(normalize(base));
            for (const char* ext : {".ts", ".tsx", ".js", ".jsx", ".mjs"}) {
                c.push_back(normalize(fs::path(base.string() + ext)));
            }
            c.push_back(normalize(base / "index.ts"));
            c.push_back(normalize(base / "index.js"));
            break;
        }
        case Language::Shell:
        case Language::Makefile:
            c.push_back(normalize(dir / target));
            c.push_back(normalize(fs::path(target)));
            break;
        default:
            break;
    }
    return c;
}

// JSON graph: {dag_type, nodes:[{id,path,language}], edges:[{from,to}]}
Result<std::shared_ptr<const Json::Value>> dependency_graph(const AnalysisJob& job,
                                                            AnalysisContext& ctx,
                                                            const std::string& dag_type) {
    SHA256 digest;
    for (size_t i = 0; i < job.files.size(); ++i) {
        digest.update_field(job.files[i]);
        digest.update_field(i < job.hashes.size() ? job.hashes[i] : "");
    }
    cache::DagKey key{job.root, dag_type, SHA256::hex(digest.finalize())};
    if (auto hit = ctx.caches().dag().get(key)) {
        return Result<std::shared_ptr<const Json::Value>>::ok(hit);
    }

    auto sources = ctx.sources(job);
    std::unordered_set<std::string> known;
    for (const auto& src : sources) known.insert(src.rel);

    // JVM imports resolve by package path suffix
    std::unordered_map<std::string, std::string> jvm_index;
    for (const auto& src : sources) {
        if (src.summary->language == Language::Java || src.summary->language == Language::Kotlin) {
            fs::path p(src.rel);
            jvm_index[(p.parent_path() / p.stem()).generic_string()] = src.rel;
        }
    }

    auto node_name = [&dag_type](const std::string& rel) {
        if (dag_type != "module") return rel;
        std::string dir = fs::path(rel).parent_path().generic_string();
        return dir.empty() ? std::string(".") : dir;
    };

    GraphMap<> graph;
    std::map<std::string, std::string> languages;
    for (const auto& src : sources) {
        graph.add_node(node_name(src.rel));
        languages[node_name(src.rel)] = language_name(src.summary->language);
    }

    for (const auto& src : sources) {
        Language lang = src.summary->language;
        for (const auto& imp : src.summary->imports) {
            std::string resolved;
            if (lang == Language::Java || lang == Language::Kotlin) {
                std::string suffix = imp;
                std::replace(suffix.begin(), suffix.end(), '.', '/');
                for (const auto& kv : jvm_index) {
                    const std::string& k = kv.first;
                    if (k == suffix || (k.size() > suffix.size() &&
                        k.compare(k.size() - suffix.size(), suffix.size(), suffix) == 0 &&
                        k[k.size() - suffix.size() - 1] == '/')) {
                        resolved = kv.second;
                        break;
                    }
                }
            } else {
                for (const auto& cand : import_candidates(lang, src.rel, imp)) {
                    if (known.count(cand)) {
                        resolved = cand;
                        break;
                    }
                }
            }
            if (resolved.empty()) continue;
            std::string from = node_name(src.rel);
            std::string to = node_name(resolved);
            if (from == to && dag_type == "module") continue;
            graph.add_edge(from, to);
        }
    }

    const auto& g = graph.inner();
    Json::Value nodes(Json::arrayValue);
    for (size_t i = 0; i < g.node_count(); ++i) {
        Json::Value n(Json::objectValue);
        n["id"] = static_cast<Json::UInt64>(i);
        n["path"] = g.node(i);
        n["language"] = dag_type == "module" ? "module" : languages[g.node(i)];
        nodes.append(n);
    }
    Json::Value edges(Json::arrayValue);
    for (size_t i = 0; i < g.node_count(); ++i) {
        for (const auto& e : g.successors(i)) {
            Json::Value j(Json::objectValue);
            j["from"] = static_cast<Json::UInt64>(e.from);
            j["to"] = static_cast<Json::UInt64>(e.to);
            edges.append(j);
        }
    }

    Json::Value out(Json::objectValue);
    out["dag_type"] = dag_type;
    out["nodes"] = nodes;
    out["edges"] = edges;
    auto st = ctx.caches().dag().put(key, out);
    if (st.is_err()) log::warn("dag cache write failed: %s", st.error().message.c_str());
    return Result<std::shared_ptr<const Json::Value>>::ok(
        std::make_shared<const Json::Value>(std::move(out)));
}

Graph<std::string> graph_from_json(const Json::Value& j) {
    Graph<std::string> g;
    for (const auto& n : j["nodes"]) g.add_node(n["path"].asString());
    for (const auto& e : j["edges"]) {
        auto from = static_cast<size_t>(e["from"].asUInt64());
        auto to = static_cast<size_t>(e["to"].asUInt64());
        if (from < g.node_count() && to < g.node_count()) g.add_edge(from, to);
    }
    return g;
}

Result<std::string> dag_type_option(const AnalysisJob& job) {
    auto t = json::get_string(job.options, "dag_type", "import");
    if (t.is_err()) return t;
    if (t.value() != "import" && t.value() != "module") {
        return PmatError::validation("dag_type", "expected 'import' or 'module'");
    }
    return t;
}

class DagAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Dag; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto dag_type = dag_type_option(job);
        if (dag_type.is_err()) return std::move(dag_type).error();
        auto graph_json = dependency_graph(job, ctx, dag_type.value());
        if (graph_json.is_err()) return std::move(graph_json).error();

        Json::Value out = *graph_json.value();
        auto g = graph_from_json(out);
        for (Json::ArrayIndex i = 0; i < out["nodes"].size(); ++i) {
            out["nodes"][i]["in_degree"] = static_cast<Json::UInt64>(g.in_degree(i));
            out["nodes"][i]["out_degree"] = static_cast<Json::UInt64>(g.out_degree(i));
        }
        Json::Value cycles(Json::arrayValue);
        for (const auto& cyc : g.cycles()) {
            Json::Value c(Json::arrayValue);
            for (auto id : cyc) c.append(g.node(id));
            cycles.append(c);
        }
        out["node_count"] = static_cast<Json::UInt64>(g.node_count());
        out["edge_count"] = static_cast<Json::UInt64>(g.edge_count());
        out["has_cycles"] = !cycles.empty();
        out["cycles"] = cycles;
        return Result<Json::Value>::ok(out);
    }
};

class GraphMetricsAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::GraphMetrics; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto dag_type = dag_type_option(job);
        if (dag_type.is_err()) return std::move(dag_type).error();
        auto iterations = json::get_int(job.options, "iterations", 50);
        if (iterations.is_err()) return std::move(iterations).error();
        double damping = 0.85;
        if (job.options.isMember("damping")) {
            if (!job.options["damping"].isNumeric()) {
                return PmatError::validation("damping", "expected a number");
            }
            damping = job.options["damping"].asDouble();
        }
        if (damping <= 0.0 || damping >= 1.0) {
            return PmatError::validation("damping", "must be between 0 and 1");
        }

        auto graph_json = dependency_graph(job, ctx, dag_type.value());
        if (graph_json.is_err()) return std::move(graph_json).error();
        auto g = graph_from_json(*graph_json.value());
        auto rank = g.pagerank(damping, static_cast<int>(iterations.value()));

        std::vector<size_t> order(g.node_count());
        for (size_t i = 0; i < order.size(); ++i) order[i] = i;
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            if (rank[a] != rank[b]) return rank[a] > rank[b];
            return g.node(a) < g.node(b);
        });

        Json::Value nodes(Json::arrayValue);
        for (auto id : order) {
            Json::Value n(Json::objectValue);
            n["path"] = g.node(id);
            n["in_degree"] = static_cast<Json::UInt64>(g.in_degree(id));
            n["out_degree"] = static_cast<Json::UInt64>(g.out_degree(id));
            n["pagerank"] = rank[id];
            nodes.append(n);
        }

        auto sccs = g.strongly_connected();
        size_t largest = 0;
        for (const auto& c : sccs) largest = std::max(largest, c.size());
        double n = static_cast<double>(g.node_count());

        Json::Value summary(Json::objectValue);
        summary["node_count"] = static_cast<Json::UInt64>(g.node_count());
        summary["edge_count"] = static_cast<Json::UInt64>(g.edge_count());
        summary["density"] = n > 1 ? round2(static_cast<double>(g.edge_count()) / (n * (n - 1))) : 0.0;
        summary["scc_count"] = static_cast<Json::UInt64>(sccs.size());
        summary["largest_scc"] = static_cast<Json::UInt64>(largest);
        auto topo = g.topological_sort();
        summary["has_cycles"] = topo.is_err();
        if (topo.is_ok()) {
            Json::Value t(Json::arrayValue);
            for (auto id : topo.value()) t.append(g.node(id));
            summary["topological_order"] = t;
        } else {
            summary["topological_order"] = Json::Value();
        }

        Json::Value out(Json::objectValue);
        out["nodes"] = nodes;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// symbol-table
// ---------------------------------------------------------------------------

class SymbolTableAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::SymbolTable; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        Json::Value symbols(Json::arrayValue);
        std::map<std::string, int> counts;
        int files = 0;
        for (const auto& src : ctx.sources(job)) {
            files++;
            for (const auto& fn : src.summary->functions) {
                Json::Value s(Json::objectValue);
                s["name"] = fn.name;
                s["kind"] = "function";
                s["path"] = src.rel;
                s["line"] = fn.start_line;
                s["end_line"] = fn.end_line;
                s["language"] = language_name(src.summary->language);
                symbols.append(s);
                counts[fn.name]++;
            }
        }
        Json::Value dup(Json::arrayValue);
        for (const auto& kv : counts) {
            if (kv.second > 1) dup.append(kv.first);
        }

        Json::Value summary(Json::objectValue);
        summary["total_symbols"] = static_cast<int>(symbols.size());
        summary["unique_names"] = static_cast<int>(counts.size());
        summary["files"] = files;
        summary["duplicate_names"] = dup;

        Json::Value out(Json::objectValue);
        out["symbols"] = symbols;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// duplicates
// ---------------------------------------------------------------------------

bool is_trivial_line(const std::string& t) {
    if (t.empty()) return true;
    if (t.rfind("//", 0) == 0 || t.rfind("#", 0) == 0 || t.rfind("/*", 0) == 0 ||
        t.rfind("*", 0) == 0) {
        return true;
    }
    for (char c : t) {
        if (c != '{' && c != '}' && c != '(' && c != ')' && c != ';' && c != ',' &&
            c != '[' && c != ']' && c != ' ') {
            return false;
        }
    }
    return true;
}

std::string collapse_spaces(const std::string& t) {
    std::string out;
    bool space = false;
    for (char c : t) {
        if (c == ' ' || c == '\t') {
            space = true;
            continue;
        }
        if (space && !out.empty()) out.push_back(' ');
        space = false;
        out.push_back(c);
    }
    return out;
}

class DuplicatesAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Duplicates; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext&) override {
        auto min_lines_opt = json::get_int(job.options, "min_lines", 6);
        if (min_lines_opt.is_err()) return std::move(min_lines_opt).error();
        if (min_lines_opt.value() < 2) {
            return PmatError::validation("min_lines", "must be at least 2");
        }
        size_t window = static_cast<size_t>(min_lines_opt.value());

        struct FileLines {
            std::string rel;
            std::vector<int> line_no;        // original line of each normalized line
            std::vector<std::string> hashes; // window hash starting at each index
        };
        std::vector<FileLines> files;
        int total_lines = 0;

        for (const auto& rel : job.files) {
            if (!is_source_language(detect_language(rel))) continue;
            auto content = read_file(job.abs(rel));
            if (content.is_err()) return std::move(content).error();

            FileLines fl;
            fl.rel = rel;
            std::vector<std::string> norm;
            auto lines = split_lines(content.value());
            total_lines += static_cast<int>(lines.size());
            for (size_t i = 0; i < lines.size(); ++i) {
                std::string t = trim(lines[i]);
                if (is_trivial_line(t)) continue;
                norm.push_back(collapse_spaces(t));
                fl.line_no.push_back(static_cast<int>(i) + 1);
            }
            for (size_t k = 0; k + window <= norm.size(); ++k) {
                SHA256 h;
                for (size_t j = k; j < k + window; ++j) h.update_field(norm[j]);
                fl.hashes.push_back(SHA256::hex(h.finalize()));
            }
            files.push_back(std::move(fl));
        }

        // hash -> (file, window index), in scan order
        std::unordered_map<std::string, std::vector<std::pair<size_t, size_t>>> groups;
        for (size_t f = 0; f < files.size(); ++f) {
            for (size_t k = 0; k < files[f].hashes.size(); ++k) {
                auto& locs = groups[files[f].hashes[k]];
                // Overlapping windows inside one file are one region
                if (!locs.empty() && locs.back().first == f && k < locs.back().second + window) continue;
                locs.emplace_back(f, k);
            }
        }

        struct Clone {
            std::vector<std::pair<size_t, size_t>> starts;  // (file, first window)
            size_t windows = 1;
        };
        std::vector<Clone> clones;
        std::map<std::pair<size_t, size_t>, size_t> clone_at;  // first loc of last window -> clone

        for (size_t f = 0; f < files.size(); ++f) {
            for (size_t k = 0; k < files[f].hashes.size(); ++k) {
                const auto& locs = groups[files[f].hashes[k]];
                if (locs.size() < 2 || locs.front() != std::make_pair(f, k)) continue;

                // Continuation when every location's previous window was one clone
                bool extends = k > 0;
                size_t prev_clone = 0;
                if (extends) {
                    auto it = clone_at.find({f, k - 1});
                    extends = it != clone_at.end();
                    if (extends) {
                        prev_clone = it->second;
                        const Clone& pc = clones[prev_clone];
                        extends = pc.starts.size() == locs.size();
                        for (size_t i = 0; extends && i < locs.size(); ++i) {
                            extends = pc.starts[i].first == locs[i].first &&
                                      pc.starts[i].second + pc.windows == locs[i].second;
                        }
                    }
                }
                if (extends) {
                    clones[prev_clone].windows++;
                    clone_at.erase({f, k - 1});
                    clone_at[{f, k}] = prev_clone;
                } else {
                    clones.push_back({locs, 1});
                    clone_at[{f, k}] = clones.size() - 1;
                }
            }
        }

        Json::Value out_clones(Json::arrayValue);
        std::map<std::string, std::set<int>> dup_lines;
        for (const auto& c : clones) {
            Json::Value j(Json::objectValue);
            Json::Value locs(Json::arrayValue);
            size_t span = c.windows + window - 1;
            for (const auto& s : c.starts) {
                const auto& fl = files[s.first];
                int start = fl.line_no[s.second];
                int end = fl.line_no[s.second + span - 1];
                Json::Value l(Json::objectValue);
                l["path"] = fl.rel;
                l["start_line"] = start;
                l["end_line"] = end;
                locs.append(l);
                for (int ln = start; ln <= end; ++ln) dup_lines[fl.rel].insert(ln);
            }
            j["lines"] = static_cast<Json::UInt64>(span);
            j["locations"] = locs;
            out_clones.append(j);
        }

        int duplicated = 0;
        for (const auto& kv : dup_lines) duplicated += static_cast<int>(kv.second.size());
        Json::Value per_file(Json::objectValue);
        for (const auto& kv : dup_lines) per_file[kv.first] = static_cast<int>(kv.second.size());

        Json::Value summary(Json::objectValue);
        summary["clone_groups"] = static_cast<int>(clones.size());
        summary["duplicated_lines"] = duplicated;
        summary["total_lines"] = total_lines;
        summary["duplication_ratio"] = total_lines == 0
            ? 0.0 : round2(static_cast<double>(duplicated) / total_lines);

        Json::Value out(Json::objectValue);
        out["clones"] = out_clones;
        out["duplicated_lines_by_file"] = per_file;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// name-similarity
// ---------------------------------------------------------------------------

class NameSimilarityAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::NameSimilarity; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto query = json::require_string(job.options, "query");
        if (query.is_err()) return std::move(query).error();
        if (query.value().empty()) return PmatError::validation("query", "must not be empty");
        double threshold = 0.5;
        if (job.options.isMember("threshold")) {
            if (!job.options["threshold"].isNumeric()) {
                return PmatError::validation("threshold", "expected a number");
            }
            threshold = job.options["threshold"].asDouble();
        }

        struct Match {
            std::string name;
            std::string kind;
            std::string path;
            int line;
            double score;
        };
        std::vector<Match> matches;
        std::set<std::string> seen_functions;
        std::map<std::string, std::string> identifier_home;

        for (const auto& src : ctx.sources(job)) {
            for (const auto& fn : src.summary->functions) {
                double score = name_similarity(query.value(), fn.name);
                seen_functions.insert(fn.name);
                if (score >= threshold) {
                    matches.push_back({fn.name, "function", src.rel, fn.start_line, score});
                }
            }
            for (const auto& id : src.summary->identifiers) {
                identifier_home.emplace(id, src.rel);
            }
        }
        for (const auto& kv : identifier_home) {
            if (seen_functions.count(kv.first)) continue;
            double score = name_similarity(query.value(), kv.first);
            if (score >= threshold) matches.push_back({kv.first, "identifier", kv.second, 0, score});
        }

        std::sort(matches.begin(), matches.end(), [](const Match& a, const Match& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.name != b.name) return a.name < b.name;
            return a.path < b.path;
        });

        Json::Value arr(Json::arrayValue);
        for (const auto& m : matches) {
            Json::Value j(Json::objectValue);
            j["name"] = m.name;
            j["kind"] = m.kind;
            j["path"] = m.path;
            if (m.line > 0) j["line"] = m.line;
            j["score"] = round2(m.score);
            arr.append(j);
        }
        Json::Value out(Json::objectValue);
        out["query"] = query.value();
        out["matches"] = arr;
        out["total_matches"] = static_cast<int>(matches.size());
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// churn
// ---------------------------------------------------------------------------

std::string repo_dir(const AnalysisJob& job) {
    fs::path r(job.root.empty() ? "." : job.root);
    std::error_code ec;
    if (fs::is_regular_file(r, ec)) r = r.parent_path();
    return r.empty() ? "." : r.string();
}

class ChurnAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Churn; }

    Result<std::vector<std::string>> fingerprint_salt(const AnalysisJob& job) const override {
        GitCli git(repo_dir(job));
        if (!git.is_repository()) {
            return PmatError(PmatError::BadRequest, "not a git repository: " + repo_dir(job),
                             "churn analysis needs a git working tree");
        }
        auto head = git.head_commit();
        if (head.is_err()) return std::move(head).error();
        auto branch = git.current_branch();
        return Result<std::vector<std::string>>::ok(
            {head.value(), branch.is_ok() ? branch.value() : std::string()});
    }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto days = json::get_int(job.options, "days", 30);
        if (days.is_err()) return std::move(days).error();
        if (days.value() <= 0) return PmatError::validation("days", "must be positive");

        auto salt = fingerprint_salt(job);
        if (salt.is_err()) return std::move(salt).error();
        std::string repo = repo_dir(job);
        cache::ChurnKey key{repo, static_cast<int>(days.value()), salt.value()[0], salt.value()[1]};
        if (auto hit = ctx.caches().churn().get(key)) {
            return Result<Json::Value>::ok(*hit);
        }

        GitCli git(repo);
        auto churn = git.churn(static_cast<int>(days.value()));
        if (churn.is_err()) return std::move(churn).error();

        Json::Value files(Json::arrayValue);
        std::map<std::string, int> author_commits;
        int64_t additions = 0;
        int64_t deletions = 0;
        int commits = 0;
        for (const auto& fc : churn.value()) {
            Json::Value f(Json::objectValue);
            f["path"] = fc.path;
            f["commits"] = fc.commits;
            f["additions"] = fc.additions;
            f["deletions"] = fc.deletions;
            f["authors"] = json::string_array(fc.authors);
            f["last_commit_time"] = Json::Int64(fc.last_commit_time);
            files.append(f);
            additions += fc.additions;
            deletions += fc.deletions;
            commits += fc.commits;
            for (const auto& a : fc.authors) author_commits[a] += fc.commits;
        }

        std::vector<std::pair<std::string, int>> authors(author_commits.begin(), author_commits.end());
        std::sort(authors.begin(), authors.end(), [](const auto& a, const auto& b) {
            if (a.second != b.second) return a.second > b.second;
            return a.first < b.first;
        });
        Json::Value top(Json::arrayValue);
        for (size_t i = 0; i < authors.size() && i < 10; ++i) {
            Json::Value a(Json::objectValue);
            a["author"] = authors[i].first;
            a["file_commits"] = authors[i].second;
            top.append(a);
        }

        Json::Value summary(Json::objectValue);
        summary["files_changed"] = static_cast<int>(files.size());
        summary["file_commits"] = commits;
        summary["total_additions"] = Json::Int64(additions);
        summary["total_deletions"] = Json::Int64(deletions);
        summary["top_authors"] = top;

        Json::Value out(Json::objectValue);
        out["period_days"] = Json::Int64(days.value());
        out["head"] = salt.value()[0];
        out["branch"] = salt.value()[1];
        out["files"] = files;
        out["summary"] = summary;

        auto st = ctx.caches().churn().put(key, out);
        if (st.is_err()) log::warn("churn cache write failed: %s", st.error().message.c_str());
        return Result<Json::Value>::ok(out);
    }
};

} // namespace

double name_similarity(const std::string& a_in, const std::string& b_in) {
    std::string a = lower(a_in);
    std::string b = lower(b_in);
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;

    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    double dist = static_cast<double>(prev[b.size()]);
    double score = 1.0 - dist / static_cast<double>(std::max(a.size(), b.size()));
    if (a != b && (b.find(a) != std::string::npos || a.find(b) != std::string::npos)) {
        score = std::max(score, 0.8);
    }
    return score;
}

std::unique_ptr<Analyzer> make_complexity_analyzer() { return std::make_unique<ComplexityAnalyzer>(); }
std::unique_ptr<Analyzer> make_dead_code_analyzer() { return std::make_unique<DeadCodeAnalyzer>(); }
std::unique_ptr<Analyzer> make_satd_analyzer() { return std::make_unique<SatdAnalyzer>(); }
std::unique_ptr<Analyzer> make_makefile_analyzer() { return std::make_unique<MakefileAnalyzer>(); }
std::unique_ptr<Analyzer> make_dag_analyzer() { return std::make_unique<DagAnalyzer>(); }
std::unique_ptr<Analyzer> make_graph_metrics_analyzer() { return std::make_unique<GraphMetricsAnalyzer>(); }
std::unique_ptr<Analyzer> make_symbol_table_analyzer() { return std::make_unique<SymbolTableAnalyzer>(); }
std::unique_ptr<Analyzer> make_duplicates_analyzer() { return std::make_unique<DuplicatesAnalyzer>(); }
std::unique_ptr<Analyzer> make_name_similarity_analyzer() { return std::make_unique<NameSimilarityAnalyzer>(); }
std::unique_ptr<Analyzer> make_churn_analyzer() { return std::make_unique<ChurnAnalyzer>(); }

} // namespace pmat::analysis

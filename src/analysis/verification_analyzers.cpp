#include <pmat/analysis/analyzers.hpp>
#include <pmat/json.hpp>
#include <pmat/log.hpp>
#include <pmat/process.hpp>
#include <pmat/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <initializer_list>
#include <map>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

// Line-scan verification heuristics: per-function provability, proof
// annotations found in the source, and test coverage of changed lines.

namespace pmat::analysis {

namespace {

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool contains_any(const std::string& line, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (line.find(n) != std::string::npos) return true;
    }
    return false;
}

// Raw `x[i]` indexing, not a slice type or an attribute
bool has_raw_index(const std::string& line) {
    for (size_t i = 1; i < line.size(); ++i) {
        if (line[i] != '[') continue;
        char prev = line[i - 1];
        if (!(std::isalnum(static_cast<unsigned char>(prev)) || prev == '_' || prev == ')' ||
              prev == ']')) {
            continue;
        }
        auto close = line.find(']', i);
        if (close != std::string::npos && close > i + 1) return true;
    }
    return false;
}

const FunctionInfo* enclosing_function(const FileSummary& s, int line) {
    const FunctionInfo* best = nullptr;
    for (const auto& fn : s.functions) {
        if (line < fn.start_line || line > fn.end_line) continue;
        if (!best || fn.start_line >= best->start_line) best = &fn;
    }
    return best;
}

// ---------------------------------------------------------------------------
// provability
// ---------------------------------------------------------------------------

struct Property {
    const char* name;
    double confidence;
    std::string evidence;
};

struct ProofSummary {
    double score = 0;
    std::vector<Property> verified;
    bool critical = false;
};

ProofSummary prove_function(const std::vector<std::string>& body) {
    bool maybe_null = false;
    bool raw_index = false;
    bool checked_index = false;
    bool may_alias = false;
    bool global_write = false;
    bool local_write = false;
    bool reads_state = false;
    bool raw_memory = false;
    bool shared_mutable = false;

    for (const auto& raw : body) {
        std::string line = trim(raw);
        if (line.rfind("//", 0) == 0 || line.rfind("#", 0) == 0) continue;
        if (contains_any(line, {".unwrap()", ".expect(", "nullptr", "NULL", " null", "None"})) {
            maybe_null = true;
        }
        if (has_raw_index(line)) raw_index = true;
        if (contains_any(line, {".get(", ".at(", ".len()", ".size()"})) checked_index = true;
        if (contains_any(line, {"&mut ", "*mut ", "*const ", "Rc<", "RefCell", "shared_ptr",
                                "Cell<"})) {
            may_alias = true;
        }
        if (contains_any(line, {"println!", "print!(", "eprintln!", "print(", "printf(",
                                "std::cout", "std::cerr", "console.", "fs::", "open(",
                                "static mut", "global ", "write("})) {
            global_write = true;
        }
        if (contains_any(line, {"self.", "this->", "this."})) {
            reads_state = true;
            auto eq = line.find('=');
            if (eq != std::string::npos && eq + 1 < line.size() && line[eq + 1] != '=' &&
                (eq == 0 || (line[eq - 1] != '=' && line[eq - 1] != '!' &&
                             line[eq - 1] != '<' && line[eq - 1] != '>'))) {
                local_write = true;
            }
        }
        if (contains_any(line, {"unsafe", "malloc(", "free(", "delete ", "reinterpret_cast",
                                "transmute"})) {
            raw_memory = true;
        }
        if (contains_any(line, {"static mut", "thread::spawn", "std::thread", "threading."}) &&
            !contains_any(line, {"Mutex", "mutex", "Arc<", "atomic", "Lock"})) {
            shared_mutable = true;
        }
    }

    ProofSummary out;
    double score = 0;

    if (!maybe_null) {
        score += 1.0;
        out.verified.push_back({"null-safety", 0.9, "no nullable access in the body"});
    } else {
        score += 0.5;
    }

    if (!raw_index) {
        score += 1.0;
        out.verified.push_back({"bounds-check", 0.85, "no unchecked indexing"});
    } else if (checked_index) {
        score += 0.5;
    }

    if (!may_alias) {
        score += 1.0;
        out.verified.push_back({"no-aliasing", 0.8, "no mutable or shared references"});
    } else {
        score += 0.3;
    }

    // Writes to global state earn nothing
    if (!global_write) {
        if (local_write) {
            score += 0.3;
        } else if (reads_state) {
            score += 0.7;
        } else {
            score += 1.0;
            out.verified.push_back({"pure-function", 0.95, "no side effects found"});
        }
    }

    if (!raw_memory) {
        out.verified.push_back({"memory-safety", 0.9, "no unsafe blocks or manual allocation"});
        out.critical = true;
    }
    if (!shared_mutable) {
        out.verified.push_back({"thread-safety", 0.7, "no unsynchronized shared state"});
        out.critical = true;
    }

    out.score = score / 4.0;
    return out;
}

class ProvabilityAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::Provability; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto wanted = json::get_string_list(job.options, "functions");
        if (wanted.is_err()) return std::move(wanted).error();
        auto high_only = json::get_bool(job.options, "high_confidence_only", false);
        if (high_only.is_err()) return std::move(high_only).error();
        auto evidence = json::get_bool(job.options, "include_evidence", false);
        if (evidence.is_err()) return std::move(evidence).error();
        std::set<std::string> only(wanted.value().begin(), wanted.value().end());

        Json::Value functions(Json::arrayValue);
        double total = 0;
        int analyzed = 0;
        int high = 0;
        for (const auto& src : ctx.sources(job)) {
            if (src.summary->functions.empty()) continue;
            auto content = read_file(job.abs(src.rel));
            if (content.is_err()) return std::move(content).error();
            auto lines = split_lines(content.value());

            for (const auto& fn : src.summary->functions) {
                if (!only.empty() && !only.count(fn.name)) continue;
                int first = std::max(fn.start_line, 1);
                int last = std::min(fn.end_line, static_cast<int>(lines.size()));
                std::vector<std::string> body;
                // The header line holds the signature, not the body
                for (int i = first + 1; i <= last; ++i) body.push_back(lines[i - 1]);
                if (body.empty() && first <= last) body.push_back(lines[first - 1]);

                auto proof = prove_function(body);
                analyzed++;
                total += proof.score;
                if (proof.score >= 0.8) high++;
                if (high_only.value() && proof.score < 0.8) continue;

                double factor = 5.0 * (1.0 - proof.score) * (proof.critical ? 0.7 : 1.0);
                Json::Value f(Json::objectValue);
                f["path"] = src.rel;
                f["function"] = fn.name;
                f["line"] = fn.start_line;
                f["provability_score"] = round2(proof.score);
                f["provability_factor"] = round2(factor);
                Json::Value props(Json::arrayValue);
                for (const auto& p : proof.verified) {
                    Json::Value pj(Json::objectValue);
                    pj["property"] = p.name;
                    pj["confidence"] = p.confidence;
                    if (evidence.value()) pj["evidence"] = p.evidence;
                    props.append(pj);
                }
                f["verified_properties"] = props;
                functions.append(f);
            }
        }

        Json::Value summary(Json::objectValue);
        summary["functions_analyzed"] = analyzed;
        summary["average_score"] = analyzed ? round2(total / analyzed) : 0.0;
        summary["high_confidence"] = high;

        Json::Value out(Json::objectValue);
        out["functions"] = functions;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// proof-annotations
// ---------------------------------------------------------------------------

struct ProofMarker {
    const char* needle;
    const char* property;
    const char* method;
    const char* confidence;
};

const ProofMarker PROOF_MARKERS[] = {
    {"#[kani::proof", "functional-correctness", "model-checking", "high"},
    {"kani::assume", "functional-correctness", "model-checking", "medium"},
    {"__CPROVER_assert", "functional-correctness", "model-checking", "high"},
    {"#[requires(", "functional-correctness", "formal-proof", "high"},
    {"#[ensures(", "functional-correctness", "formal-proof", "high"},
    {"#[invariant(", "functional-correctness", "formal-proof", "high"},
    {"@ requires", "functional-correctness", "formal-proof", "high"},
    {"@ ensures", "functional-correctness", "formal-proof", "high"},
    {"@ loop invariant", "termination", "formal-proof", "high"},
    {"#![forbid(unsafe_code)]", "memory-safety", "borrow-checker", "high"},
    {"#![deny(unsafe_code)]", "memory-safety", "borrow-checker", "high"},
    {"unsafe impl Send", "thread-safety", "static-analysis", "low"},
    {"unsafe impl Sync", "thread-safety", "static-analysis", "low"},
    {"// SAFETY:", "memory-safety", "static-analysis", "medium"},
    {"static_assert(", "functional-correctness", "static-analysis", "high"},
    {"const_assert!", "functional-correctness", "static-analysis", "high"},
    {"debug_assert!", "functional-correctness", "abstract-interpretation", "low"},
    {"@invariant", "functional-correctness", "formal-proof", "medium"},
    {"#[must_use]", "resource-bounds", "static-analysis", "low"},
};

class ProofAnnotationsAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::ProofAnnotations; }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto high_only = json::get_bool(job.options, "high_confidence_only", false);
        if (high_only.is_err()) return std::move(high_only).error();
        auto evidence = json::get_bool(job.options, "include_evidence", false);
        if (evidence.is_err()) return std::move(evidence).error();
        auto property = json::get_string(job.options, "property_type");
        if (property.is_err()) return std::move(property).error();
        auto method = json::get_string(job.options, "verification_method");
        if (method.is_err()) return std::move(method).error();

        Json::Value annotations(Json::arrayValue);
        std::map<std::string, int> by_property;
        std::map<std::string, int> by_method;
        int files = 0;
        for (const auto& src : ctx.sources(job)) {
            auto content = read_file(job.abs(src.rel));
            if (content.is_err()) return std::move(content).error();
            files++;
            auto lines = split_lines(content.value());
            for (size_t i = 0; i < lines.size(); ++i) {
                for (const auto& m : PROOF_MARKERS) {
                    if (lines[i].find(m.needle) == std::string::npos) continue;
                    if (high_only.value() && std::string(m.confidence) != "high") break;
                    if (!property.value().empty() && property.value() != "all" &&
                        property.value() != m.property) {
                        break;
                    }
                    if (!method.value().empty() && method.value() != "all" &&
                        method.value() != m.method) {
                        break;
                    }

                    int line = static_cast<int>(i) + 1;
                    Json::Value a(Json::objectValue);
                    a["path"] = src.rel;
                    a["line"] = line;
                    // Attributes sit on the line above the function they cover
                    const FunctionInfo* fn = enclosing_function(*src.summary, line);
                    if (!fn) fn = enclosing_function(*src.summary, line + 1);
                    a["function"] = fn ? fn->name : std::string();
                    a["property"] = m.property;
                    a["method"] = m.method;
                    a["confidence"] = m.confidence;
                    if (evidence.value()) a["evidence"] = trim(lines[i]);
                    annotations.append(a);
                    by_property[m.property]++;
                    by_method[m.method]++;
                    break;
                }
            }
        }

        Json::Value summary(Json::objectValue);
        summary["files_processed"] = files;
        summary["annotations_found"] = static_cast<int>(annotations.size());
        Json::Value props(Json::objectValue);
        for (const auto& kv : by_property) props[kv.first] = kv.second;
        Json::Value methods(Json::objectValue);
        for (const auto& kv : by_method) methods[kv.first] = kv.second;
        summary["by_property"] = props;
        summary["by_method"] = methods;

        Json::Value out(Json::objectValue);
        out["annotations"] = annotations;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }
};

// ---------------------------------------------------------------------------
// incremental-coverage
// ---------------------------------------------------------------------------

std::string repo_dir(const AnalysisJob& job) {
    fs::path r(job.root.empty() ? "." : job.root);
    std::error_code ec;
    if (fs::is_regular_file(r, ec)) r = r.parent_path();
    return r.empty() ? "." : r.string();
}

bool ends_with_path(const std::string& full, const std::string& rel) {
    if (full == rel) return true;
    if (full.size() <= rel.size()) return false;
    return full.compare(full.size() - rel.size(), rel.size(), rel) == 0 &&
           full[full.size() - rel.size() - 1] == '/';
}

bool is_test_file(const std::string& rel) {
    std::string name = fs::path(rel).filename().string();
    return rel.find("tests/") != std::string::npos || rel.find("test/") != std::string::npos ||
           name.rfind("test_", 0) == 0 || name.find("_test.") != std::string::npos ||
           name.find(".test.") != std::string::npos || name.find("_spec.") != std::string::npos;
}

class IncrementalCoverageAnalyzer : public Analyzer {
public:
    AnalysisKind kind() const override { return AnalysisKind::IncrementalCoverage; }

    Result<std::vector<std::string>> fingerprint_salt(const AnalysisJob& job) const override {
        GitCli git(repo_dir(job));
        if (!git.is_repository()) {
            return PmatError(PmatError::BadRequest, "not a git repository: " + repo_dir(job),
                             "incremental coverage diffs against a git base");
        }
        auto base = json::get_string(job.options, "base", "HEAD");
        if (base.is_err()) return std::move(base).error();
        auto commit = git.rev_parse(base.value());
        if (commit.is_err()) {
            return PmatError(PmatError::NotFound, "unknown base revision '" + base.value() + "'")
                .with_cause(commit.error());
        }
        std::vector<std::string> salt{commit.value()};

        auto report = json::get_string(job.options, "coverage_file");
        if (report.is_err()) return std::move(report).error();
        if (!report.value().empty()) {
            auto hash = SHA256::hash_file(fs::path(repo_dir(job)) / report.value());
            if (hash.is_err()) {
                return PmatError(PmatError::NotFound, "cannot read coverage file " + report.value())
                    .with_cause(hash.error());
            }
            salt.push_back(hash.value());
        }
        return Result<std::vector<std::string>>::ok(std::move(salt));
    }

    Result<Json::Value> run(const AnalysisJob& job, AnalysisContext& ctx) override {
        auto base = json::get_string(job.options, "base", "HEAD");
        if (base.is_err()) return std::move(base).error();
        auto report = json::get_string(job.options, "coverage_file");
        if (report.is_err()) return std::move(report).error();
        auto threshold = json::get_int(job.options, "min_coverage", 80);
        if (threshold.is_err()) return std::move(threshold).error();

        std::string repo = repo_dir(job);
        GitCli git(repo);
        if (!git.is_repository()) {
            return PmatError(PmatError::BadRequest, "not a git repository: " + repo);
        }
        auto changed = git.changed_lines(base.value());
        if (changed.is_err()) return std::move(changed).error();
        auto untracked = git.untracked_files();
        if (untracked.is_err()) return std::move(untracked).error();
        std::set<std::string> fresh(untracked.value().begin(), untracked.value().end());

        auto sources = ctx.sources(job);

        std::map<std::string, std::set<int>> covered;
        std::string source = "tests";
        if (!report.value().empty()) {
            auto text = read_file(fs::path(repo) / report.value());
            if (text.is_err()) return std::move(text).error();
            covered = lcov_covered_lines(text.value());
            source = "lcov";
        } else {
            covered = test_referenced_lines(sources);
        }

        Json::Value files(Json::arrayValue);
        int total_new = 0;
        int total_covered = 0;
        for (const auto& src : sources) {
            if (is_test_file(src.rel)) continue;
            std::vector<int> lines;
            if (fresh.count(src.rel)) {
                for (int i = 1; i <= src.summary->lines; ++i) lines.push_back(i);
            } else {
                auto it = changed.value().find(src.rel);
                if (it == changed.value().end()) continue;
                lines = it->second;
            }
            if (lines.empty()) continue;

            const std::set<int>* hits = nullptr;
            for (const auto& kv : covered) {
                if (ends_with_path(kv.first, src.rel)) {
                    hits = &kv.second;
                    break;
                }
            }
            Json::Value uncovered(Json::arrayValue);
            int n = 0;
            for (int l : lines) {
                if (hits && hits->count(l)) {
                    n++;
                } else {
                    uncovered.append(l);
                }
            }
            Json::Value f(Json::objectValue);
            f["path"] = src.rel;
            f["new_lines"] = static_cast<int>(lines.size());
            f["covered_lines"] = n;
            f["coverage"] = round2(100.0 * n / static_cast<double>(lines.size()));
            f["uncovered_lines"] = uncovered;
            files.append(f);
            total_new += static_cast<int>(lines.size());
            total_covered += n;
        }

        double pct = total_new ? 100.0 * total_covered / total_new : 100.0;
        Json::Value summary(Json::objectValue);
        summary["changed_files"] = static_cast<int>(files.size());
        summary["new_lines_total"] = total_new;
        summary["new_lines_covered"] = total_covered;
        summary["delta_coverage"] = round2(pct);
        summary["passed"] = pct >= static_cast<double>(threshold.value());

        Json::Value out(Json::objectValue);
        out["base"] = base.value();
        out["coverage_source"] = source;
        out["files"] = files;
        out["summary"] = summary;
        return Result<Json::Value>::ok(out);
    }

private:
    // Without a report, lines of functions named from a test file count
    static std::map<std::string, std::set<int>> test_referenced_lines(
        const std::vector<SourceFile>& sources) {
        std::set<std::string> referenced;
        for (const auto& src : sources) {
            if (!is_test_file(src.rel)) continue;
            referenced.insert(src.summary->identifiers.begin(), src.summary->identifiers.end());
        }
        std::map<std::string, std::set<int>> out;
        for (const auto& src : sources) {
            if (is_test_file(src.rel)) continue;
            auto& lines = out[src.rel];
            for (const auto& fn : src.summary->functions) {
                if (!referenced.count(fn.name)) continue;
                for (int l = fn.start_line; l <= fn.end_line; ++l) lines.insert(l);
            }
        }
        return out;
    }
};

} // namespace

std::map<std::string, std::set<int>> lcov_covered_lines(const std::string& report) {
    std::map<std::string, std::set<int>> out;
    std::string current;
    for (const auto& line : split_lines(report)) {
        if (line.compare(0, 3, "SF:") == 0) {
            current = fs::path(line.substr(3)).lexically_normal().generic_string();
            out[current];
        } else if (line == "end_of_record") {
            current.clear();
        } else if (!current.empty() && line.compare(0, 3, "DA:") == 0) {
            // DA:<line>,<hits>[,<checksum>]
            auto comma = line.find(',');
            if (comma == std::string::npos) continue;
            long l = std::strtol(line.c_str() + 3, nullptr, 10);
            long hits = std::strtol(line.c_str() + comma + 1, nullptr, 10);
            if (l > 0 && hits > 0) out[current].insert(static_cast<int>(l));
        }
    }
    return out;
}

std::unique_ptr<Analyzer> make_provability_analyzer() {
    return std::make_unique<ProvabilityAnalyzer>();
}
std::unique_ptr<Analyzer> make_proof_annotations_analyzer() {
    return std::make_unique<ProofAnnotationsAnalyzer>();
}
std::unique_ptr<Analyzer> make_incremental_coverage_analyzer() {
    return std::make_unique<IncrementalCoverageAnalyzer>();
}

} // namespace pmat::analysis

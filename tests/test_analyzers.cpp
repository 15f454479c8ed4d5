#include <catch2/catch.hpp>
#include <pmat/analysis/analyzers.hpp>
#include <pmat/analysis/scheduler.hpp>
#include <pmat/process.hpp>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>

namespace fs = std::filesystem;
using namespace pmat;
using namespace pmat::analysis;

namespace {

void write(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream(p) << content;
}

const char* MAIN_RS =
    "mod util;\n"
    "\n"
    "fn main() {\n"
    "    let v = util::helper(3);\n"
    "    println!(\"{}\", v);\n"
    "}\n"
    "\n"
    "fn unused_thing() -> i32 {\n"
    "    // TODO: remove this once the cli lands\n"
    "    42\n"
    "}\n";

const char* UTIL_RS =
    "pub fn helper(x: i32) -> i32 {\n"
    "    if x > 0 && x < 10 {\n"
    "        for i in 0..x {\n"
    "            if i == 3 {\n"
    "                return i;\n"
    "            }\n"
    "        }\n"
    "    }\n"
    "    0\n"
    "}\n"
    "// FIXME: broken for negative input\n";

const char* MAKEFILE =
    "all: build\n"
    "\tcargo build\n"
    "\n"
    "build:\n"
    "    cargo build --release\n";

const char* DUP_PY =
    "def f(x):\n"
    "    total = 0\n"
    "    for i in range(x):\n"
    "        total += i * 2\n"
    "        total -= 1\n"
    "    print(total)\n"
    "    return total\n";

// A small project analyzed through the scheduler with every builtin
struct Project {
    fs::path dir;
    cache::CacheManager caches{CacheSettings{}};
    AnalyzerRegistry registry;
    std::unique_ptr<Scheduler> scheduler;

    explicit Project(const std::string& name) : dir(fs::temp_directory_path() / name) {
        fs::remove_all(dir);
        fs::create_directories(dir);
        register_builtin_analyzers(registry);
        scheduler = std::make_unique<Scheduler>(registry, caches, 2);
    }

    ~Project() {
        scheduler.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    Result<ResultPtr> run(AnalysisKind kind, std::vector<std::string> files,
                          const Json::Value& options = Json::Value(Json::objectValue)) {
        return scheduler->submit(kind, dir.string(), std::move(files), options);
    }
};

struct RustProject : Project {
    RustProject() : Project("pmat_test_analyzers_rust") {
        write(dir / "src/main.rs", MAIN_RS);
        write(dir / "src/util.rs", UTIL_RS);
        write(dir / "Makefile", MAKEFILE);
    }
    std::vector<std::string> files() const { return {"Makefile", "src/main.rs", "src/util.rs"}; }
};

} // namespace

// ---- Source scanning ----

TEST_CASE("rust functions and decision points are measured", "[analyzers]") {
    auto s = summarize_source("util.rs", UTIL_RS, Language::Rust);
    REQUIRE(s.functions.size() == 1);
    const auto& fn = s.functions[0];
    REQUIRE(fn.name == "helper");
    REQUIRE(fn.start_line == 1);
    REQUIRE(fn.end_line == 10);
    REQUIRE(fn.cyclomatic == 5);
    REQUIRE(fn.cognitive > fn.cyclomatic);
    REQUIRE(fn.max_nesting >= 2);
    REQUIRE(s.satd.size() == 1);
    REQUIRE(s.satd[0].marker == "FIXME");
    REQUIRE(s.satd[0].line == 11);
}

TEST_CASE("python functions end at the dedent", "[analyzers]") {
    const char* src =
        "import os\n"
        "\n"
        "def outer(a):\n"
        "    if a:\n"
        "        return 1\n"
        "    elif a is None:\n"
        "        return 2\n"
        "    return 0\n"
        "\n"
        "x = outer(1)\n";
    auto s = summarize_source("m.py", src, Language::Python);
    REQUIRE(s.functions.size() == 1);
    REQUIRE(s.functions[0].name == "outer");
    REQUIRE(s.functions[0].start_line == 3);
    REQUIRE(s.functions[0].end_line == 8);
    REQUIRE(s.functions[0].cyclomatic == 3);
    REQUIRE(s.imports == std::vector<std::string>{"os"});
    REQUIRE(s.blank_lines == 2);
}

TEST_CASE("language detection by name and extension", "[analyzers]") {
    REQUIRE(detect_language("src/lib.rs") == Language::Rust);
    REQUIRE(detect_language("Makefile") == Language::Makefile);
    REQUIRE(detect_language("rules.mk") == Language::Makefile);
    REQUIRE(detect_language("app.TSX") == Language::TypeScript);
    REQUIRE(detect_language("a.hpp") == Language::Cpp);
    REQUIRE(detect_language("README.md") == Language::Unknown);
    REQUIRE_FALSE(is_source_language(Language::Makefile));
    REQUIRE(is_source_language(Language::Go));
}

TEST_CASE("satd markers classify by category and severity", "[analyzers]") {
    auto hack = classify_satd("HACK around the parser", 3);
    REQUIRE(hack.marker == "HACK");
    REQUIRE(hack.category == "Design");
    REQUIRE(hack.severity == "Medium");
    REQUIRE(hack.line == 3);

    auto sec = classify_satd("security hole when the token is empty", 1);
    REQUIRE(sec.category == "Security");
    REQUIRE(sec.severity == "Critical");

    auto todo = classify_satd("// todo: split this", 1);
    REQUIRE(todo.marker == "TODO");
    REQUIRE(todo.severity == "Low");
    REQUIRE(todo.text == "todo: split this");

    REQUIRE(classify_satd("plain note", 1).marker.empty());
}

TEST_CASE("name similarity is case-insensitive edit distance", "[analyzers]") {
    REQUIRE(name_similarity("abc", "abc") == Approx(1.0));
    REQUIRE(name_similarity("Foo", "foo") == Approx(1.0));
    REQUIRE(name_similarity("", "") == Approx(1.0));
    REQUIRE(name_similarity("a", "") == Approx(0.0));
    REQUIRE(name_similarity("helpr", "helper") == Approx(1.0 - 1.0 / 6.0));
    // Containment lifts the score
    REQUIRE(name_similarity("get", "get_value") == Approx(0.8));
}

// ---- Registry ----

TEST_CASE("builtin registry covers every kind", "[analyzers]") {
    AnalyzerRegistry registry;
    register_builtin_analyzers(registry);
    REQUIRE(registry.kinds().size() == all_kinds().size());
    for (AnalysisKind kind : all_kinds()) {
        REQUIRE(registry.contains(kind));
        REQUIRE(registry.find(kind)->kind() == kind);
    }
}

// ---- Analyzers ----

TEST_CASE("complexity reports functions and threshold violations", "[analyzers]") {
    RustProject p;
    Json::Value opts(Json::objectValue);
    opts["max_cyclomatic"] = 4;
    auto r = p.run(AnalysisKind::Complexity, p.files(), opts);
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["summary"]["total_files"].asInt() == 2);
    REQUIRE(out["summary"]["total_functions"].asInt() == 3);
    REQUIRE(out["summary"]["max_cyclomatic"].asInt() == 5);
    REQUIRE(out["summary"]["violation_count"].asInt() == 1);
    REQUIRE(out["violations"][0]["function"].asString() == "helper");
    REQUIRE(out["violations"][0]["path"].asString() == "src/util.rs");
    REQUIRE(out["violations"][0]["metric"].asString() == "cyclomatic");
    REQUIRE(out["violations"][0]["threshold"].asInt() == 4);
}

TEST_CASE("complexity rejects a non-numeric threshold", "[analyzers]") {
    RustProject p;
    Json::Value opts(Json::objectValue);
    opts["max_cyclomatic"] = "lots";
    auto r = p.run(AnalysisKind::Complexity, p.files(), opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::ValidationFailed);
    REQUIRE(r.error().field == "max_cyclomatic");
}

TEST_CASE("dead code finds unreferenced functions", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::DeadCode, p.files());
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["summary"]["total_functions"].asInt() == 3);
    REQUIRE(out["summary"]["dead_functions"].asInt() == 1);
    REQUIRE(out["dead_functions"][0]["name"].asString() == "unused_thing");
    REQUIRE(out["dead_functions"][0]["lines"].asInt() == 4);
    REQUIRE(out["summary"]["dead_percentage"].asDouble() == Approx(33.33));
}

TEST_CASE("satd groups debt by severity and category", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::Satd, p.files());
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["summary"]["total_items"].asInt() == 2);
    REQUIRE(out["summary"]["files_with_debt"].asInt() == 2);
    REQUIRE(out["summary"]["by_severity"]["High"].asInt() == 1);
    REQUIRE(out["summary"]["by_severity"]["Low"].asInt() == 1);
    REQUIRE(out["summary"]["by_severity"]["Critical"].asInt() == 0);
    REQUIRE(out["summary"]["by_category"]["Defect"].asInt() == 1);
    REQUIRE(out["summary"]["by_category"]["Requirement"].asInt() == 1);
}

TEST_CASE("makefile lint flags spaces and missing phony targets", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::Makefile, p.files());
    REQUIRE(r.is_ok());
    const auto& s = (*r.value())["summary"];
    REQUIRE(s["files"].asInt() == 1);
    REQUIRE(s["errors"].asInt() == 1);
    REQUIRE(s["warnings"].asInt() == 4);
    REQUIRE(s["total_violations"].asInt() == 5);
    REQUIRE(s["quality_score"].asInt() == 70);

    const auto& vs = (*r.value())["files"][0]["violations"];
    bool spaces = false;
    for (const auto& v : vs) {
        if (v["rule"].asString() == "recipe-spaces") {
            spaces = true;
            REQUIRE(v["line"].asInt() == 5);
        }
    }
    REQUIRE(spaces);
}

TEST_CASE("dag resolves rust modules", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::Dag, p.files());
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["dag_type"].asString() == "import");
    REQUIRE(out["node_count"].asUInt64() == 2);
    REQUIRE(out["edge_count"].asUInt64() == 1);
    REQUIRE_FALSE(out["has_cycles"].asBool());
    auto from = out["edges"][0]["from"].asUInt();
    auto to = out["edges"][0]["to"].asUInt();
    REQUIRE(out["nodes"][from]["path"].asString() == "src/main.rs");
    REQUIRE(out["nodes"][to]["path"].asString() == "src/util.rs");
    REQUIRE(p.caches.dag().len() == 1);
}

TEST_CASE("dag rejects an unknown dag type", "[analyzers]") {
    RustProject p;
    Json::Value opts(Json::objectValue);
    opts["dag_type"] = "call";
    auto r = p.run(AnalysisKind::Dag, p.files(), opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().field == "dag_type");
}

TEST_CASE("graph metrics share the cached dependency graph", "[analyzers]") {
    RustProject p;
    REQUIRE(p.run(AnalysisKind::Dag, p.files()).is_ok());
    auto hits_before = p.caches.dag().stats().snapshot().hits;

    auto r = p.run(AnalysisKind::GraphMetrics, p.files());
    REQUIRE(r.is_ok());
    const auto& s = (*r.value())["summary"];
    REQUIRE(s["node_count"].asUInt64() == 2);
    REQUIRE(s["edge_count"].asUInt64() == 1);
    REQUIRE(s["density"].asDouble() == Approx(0.5));
    REQUIRE(s["scc_count"].asUInt64() == 2);
    REQUIRE(s["largest_scc"].asUInt64() == 1);
    REQUIRE_FALSE(s["has_cycles"].asBool());
    REQUIRE(s["topological_order"][0].asString() == "src/main.rs");
    REQUIRE(p.caches.dag().stats().snapshot().hits == hits_before + 1);
}

TEST_CASE("graph metrics validate damping", "[analyzers]") {
    RustProject p;
    Json::Value opts(Json::objectValue);
    opts["damping"] = 1.5;
    auto r = p.run(AnalysisKind::GraphMetrics, p.files(), opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().field == "damping");
}

TEST_CASE("duplicates merges overlapping windows into one clone", "[analyzers]") {
    Project p("pmat_test_analyzers_dup");
    write(p.dir / "a.py", DUP_PY);
    write(p.dir / "b.py", DUP_PY);
    auto r = p.run(AnalysisKind::Duplicates, {"a.py", "b.py"});
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["summary"]["clone_groups"].asInt() == 1);
    REQUIRE(out["clones"][0]["lines"].asUInt64() == 7);
    REQUIRE(out["clones"][0]["locations"].size() == 2);
    REQUIRE(out["clones"][0]["locations"][0]["start_line"].asInt() == 1);
    REQUIRE(out["clones"][0]["locations"][0]["end_line"].asInt() == 7);
    REQUIRE(out["summary"]["duplicated_lines"].asInt() == 14);
    REQUIRE(out["duplicated_lines_by_file"]["b.py"].asInt() == 7);

    Json::Value opts(Json::objectValue);
    opts["min_lines"] = 8;
    auto none = p.run(AnalysisKind::Duplicates, {"a.py", "b.py"}, opts);
    REQUIRE(none.is_ok());
    REQUIRE((*none.value())["summary"]["clone_groups"].asInt() == 0);

    opts["min_lines"] = 1;
    REQUIRE(p.run(AnalysisKind::Duplicates, {"a.py", "b.py"}, opts).is_err());
}

TEST_CASE("name similarity ranks function names", "[analyzers]") {
    RustProject p;
    Json::Value opts(Json::objectValue);
    opts["query"] = "helpr";
    opts["threshold"] = 0.7;
    auto r = p.run(AnalysisKind::NameSimilarity, p.files(), opts);
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["query"].asString() == "helpr");
    REQUIRE(out["total_matches"].asInt() >= 1);
    REQUIRE(out["matches"][0]["name"].asString() == "helper");
    REQUIRE(out["matches"][0]["kind"].asString() == "function");
    REQUIRE(out["matches"][0]["line"].asInt() == 1);
}

TEST_CASE("name similarity needs a query", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::NameSimilarity, p.files());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::ValidationFailed);
    REQUIRE(r.error().field == "query");
}

TEST_CASE("churn outside a git repository is a bad request", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::Churn, p.files());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::BadRequest);
}

TEST_CASE("quality gate combines nested analyses", "[analyzers]") {
    RustProject p;
    auto strict = p.run(AnalysisKind::QualityGate, p.files());
    REQUIRE(strict.is_ok());
    REQUIRE_FALSE((*strict.value())["passed"].asBool());
    REQUIRE((*strict.value())["checks"].size() == 4);

    Json::Value opts(Json::objectValue);
    opts["max_satd"] = 1;
    opts["max_dead_code_percent"] = 50;
    auto relaxed = p.run(AnalysisKind::QualityGate, p.files(), opts);
    REQUIRE(relaxed.is_ok());
    REQUIRE((*relaxed.value())["passed"].asBool());

    // Nested complexity ran once and was cached for the second gate
    auto stats = p.scheduler->stats();
    REQUIRE(stats.cache_hits >= 4);
}

TEST_CASE("provability scores each function body", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::Provability, {"src/main.rs", "src/util.rs"});
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    std::map<std::string, Json::Value> by_name;
    for (const auto& f : out["functions"]) by_name[f["function"].asString()] = f;
    REQUIRE(by_name.size() == 3);

    // helper only branches and loops over its argument
    REQUIRE(by_name["helper"]["provability_score"].asDouble() == Approx(1.0));
    REQUIRE(by_name["helper"]["provability_factor"].asDouble() == Approx(0.0));
    REQUIRE(by_name["helper"]["verified_properties"].size() == 6);

    // println! is a global side effect
    REQUIRE(by_name["main"]["provability_score"].asDouble() == Approx(0.75));
    REQUIRE(by_name["main"]["provability_factor"].asDouble() == Approx(0.875).margin(0.01));
    REQUIRE(out["summary"]["functions_analyzed"].asInt() == 3);
    REQUIRE(out["summary"]["high_confidence"].asInt() == 2);

    Json::Value opts(Json::objectValue);
    opts["high_confidence_only"] = true;
    opts["functions"] = "main,helper";
    opts["include_evidence"] = true;
    auto filtered = p.run(AnalysisKind::Provability, {"src/main.rs", "src/util.rs"}, opts);
    REQUIRE(filtered.is_ok());
    const auto& fns = (*filtered.value())["functions"];
    REQUIRE(fns.size() == 1);
    REQUIRE(fns[0]["function"].asString() == "helper");
    REQUIRE(fns[0]["verified_properties"][0].isMember("evidence"));
}

TEST_CASE("provability flags unsafe and unchecked code", "[analyzers]") {
    Project p("pmat_test_analyzers_unsafe");
    write(p.dir / "raw.rs",
          "fn poke(buf: &mut Vec<u8>, i: usize) {\n"
          "    unsafe { *buf.as_mut_ptr() = 1; }\n"
          "    buf[i] = 2;\n"
          "    let x = buf.first().unwrap();\n"
          "}\n");
    auto r = p.run(AnalysisKind::Provability, {"raw.rs"});
    REQUIRE(r.is_ok());
    const auto& fn = (*r.value())["functions"][0];
    REQUIRE(fn["function"].asString() == "poke");
    REQUIRE(fn["provability_score"].asDouble() < 0.8);
    for (const auto& prop : fn["verified_properties"]) {
        REQUIRE(prop["property"].asString() != "memory-safety");
        REQUIRE(prop["property"].asString() != "bounds-check");
        REQUIRE(prop["property"].asString() != "null-safety");
    }
}

TEST_CASE("proof annotations are collected with their function", "[analyzers]") {
    Project p("pmat_test_analyzers_proofs");
    write(p.dir / "src/proofs.rs",
          "#![forbid(unsafe_code)]\n"
          "\n"
          "#[kani::proof]\n"
          "fn check_add() {\n"
          "    debug_assert!(1 + 2 == 3);\n"
          "}\n");
    auto r = p.run(AnalysisKind::ProofAnnotations, {"src/proofs.rs"});
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    const auto& anns = out["annotations"];
    REQUIRE(anns.size() == 3);
    REQUIRE(anns[0]["line"].asInt() == 1);
    REQUIRE(anns[0]["property"].asString() == "memory-safety");
    REQUIRE(anns[0]["method"].asString() == "borrow-checker");
    REQUIRE(anns[1]["line"].asInt() == 3);
    REQUIRE(anns[1]["function"].asString() == "check_add");
    REQUIRE(anns[1]["method"].asString() == "model-checking");
    REQUIRE(anns[2]["confidence"].asString() == "low");
    REQUIRE_FALSE(anns[2].isMember("evidence"));
    REQUIRE(out["summary"]["by_method"]["model-checking"].asInt() == 1);

    Json::Value high(Json::objectValue);
    high["high_confidence_only"] = true;
    REQUIRE((*p.run(AnalysisKind::ProofAnnotations, {"src/proofs.rs"}, high).value())
                ["annotations"].size() == 2);

    Json::Value method(Json::objectValue);
    method["verification_method"] = "model-checking";
    method["include_evidence"] = true;
    auto only = p.run(AnalysisKind::ProofAnnotations, {"src/proofs.rs"}, method);
    REQUIRE((*only.value())["annotations"].size() == 1);
    REQUIRE((*only.value())["annotations"][0]["evidence"].asString() == "#[kani::proof]");
}

TEST_CASE("lcov tracefiles yield executed lines", "[analyzers]") {
    auto lines = lcov_covered_lines("TN:\n"
                                    "SF:/work/src/lib.rs\n"
                                    "DA:1,3\n"
                                    "DA:2,0\n"
                                    "DA:5,1,abcd\n"
                                    "end_of_record\n"
                                    "SF:src/other.rs\n"
                                    "DA:9,1\n"
                                    "end_of_record\n");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines["/work/src/lib.rs"] == std::set<int>{1, 5});
    REQUIRE(lines["src/other.rs"] == std::set<int>{9});
}

TEST_CASE("incremental coverage outside a git repository is a bad request", "[analyzers]") {
    RustProject p;
    auto r = p.run(AnalysisKind::IncrementalCoverage, p.files());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::BadRequest);
}

TEST_CASE("incremental coverage measures lines changed since the base", "[analyzers]") {
    Project p("pmat_test_analyzers_coverage");
    auto git = [&](std::vector<std::string> args) {
        args.insert(args.begin(), "git");
        REQUIRE(run_command(args, p.dir.string()).value().exit_code == 0);
    };
    git({"init", "-q"});
    git({"config", "user.email", "dev@example.com"});
    git({"config", "user.name", "Dev"});
    write(p.dir / "src/lib.rs", "pub fn old() -> i32 {\n    1\n}\n");
    git({"add", "src/lib.rs"});
    git({"commit", "-q", "-m", "init"});

    write(p.dir / "src/lib.rs",
          "pub fn old() -> i32 {\n    1\n}\n"
          "pub fn added(x: i32) -> i32 {\n    x + 1\n}\n"
          "pub fn lonely() -> i32 {\n    0\n}\n");
    write(p.dir / "tests/lib_test.rs", "fn check() {\n    assert_eq!(added(1), 2);\n}\n");
    std::vector<std::string> files{"src/lib.rs", "tests/lib_test.rs"};

    auto r = p.run(AnalysisKind::IncrementalCoverage, files);
    REQUIRE(r.is_ok());
    const auto& out = *r.value();
    REQUIRE(out["coverage_source"].asString() == "tests");
    REQUIRE(out["files"].size() == 1);
    REQUIRE(out["files"][0]["path"].asString() == "src/lib.rs");
    REQUIRE(out["summary"]["new_lines_total"].asInt() == 6);
    REQUIRE(out["summary"]["new_lines_covered"].asInt() == 3);
    REQUIRE(out["summary"]["delta_coverage"].asDouble() == Approx(50.0));
    REQUIRE_FALSE(out["summary"]["passed"].asBool());
    REQUIRE(out["files"][0]["uncovered_lines"][0].asInt() == 7);

    write(p.dir / "lcov.info", "SF:" + (p.dir / "src/lib.rs").string() +
                                   "\nDA:4,1\nDA:5,1\nDA:6,0\nDA:7,2\nend_of_record\n");
    Json::Value opts(Json::objectValue);
    opts["coverage_file"] = "lcov.info";
    opts["min_coverage"] = 50;
    auto lcov = p.run(AnalysisKind::IncrementalCoverage, files, opts);
    REQUIRE(lcov.is_ok());
    REQUIRE((*lcov.value())["coverage_source"].asString() == "lcov");
    REQUIRE((*lcov.value())["summary"]["new_lines_covered"].asInt() == 3);
    REQUIRE((*lcov.value())["summary"]["passed"].asBool());

    Json::Value bad(Json::objectValue);
    bad["base"] = "no-such-branch";
    auto missing = p.run(AnalysisKind::IncrementalCoverage, files, bad);
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == PmatError::NotFound);
}

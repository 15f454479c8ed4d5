#include <catch2/catch.hpp>
#include <pmat/process.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace pmat;

TEST_CASE("run_command captures output and exit code", "[process]") {
    auto r = run_command({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "out\n");
    REQUIRE(r.value().stderr_str == "err\n");
}

TEST_CASE("run_command honours the working directory", "[process]") {
    auto r = run_command({"pwd"}, "/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "/\n");
}

TEST_CASE("run_command times out", "[process]") {
    auto r = run_command({"sleep", "5"}, "", 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::Timeout);
}

TEST_CASE("run_command on a missing program is NotFound", "[process]") {
    auto r = run_command({"pmat-definitely-not-a-program"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PmatError::NotFound);
}

TEST_CASE("parse_numstat_log aggregates per file", "[process]") {
    std::string log =
        "commit:aaa|alice|1700000000\n"
        "\n"
        "10\t2\tsrc/main.rs\n"
        "1\t1\tREADME.md\n"
        "commit:bbb|bob|1700000500\n"
        "\n"
        "3\t4\tsrc/main.rs\n"
        "-\t-\tlogo.png\n";
    auto files = parse_numstat_log(log);
    REQUIRE(files.size() == 3);
    REQUIRE(files[0].path == "src/main.rs");
    REQUIRE(files[0].commits == 2);
    REQUIRE(files[0].additions == 13);
    REQUIRE(files[0].deletions == 6);
    REQUIRE(files[0].authors == std::vector<std::string>{"alice", "bob"});
    REQUIRE(files[0].last_commit_time == 1700000500);

    auto png = std::find_if(files.begin(), files.end(),
                            [](const FileChurn& f) { return f.path == "logo.png"; });
    REQUIRE(png != files.end());
    REQUIRE(png->additions == 0);
}

TEST_CASE("parse_diff_added_lines reads hunk headers", "[process]") {
    std::string diff =
        "diff --git a/src/lib.rs b/src/lib.rs\n"
        "--- a/src/lib.rs\n"
        "+++ b/src/lib.rs\n"
        "@@ -3,0 +4,2 @@ fn old()\n"
        "+fn a() {}\n"
        "+fn b() {}\n"
        "@@ -10 +12 @@\n"
        "-x\n"
        "+y\n"
        "@@ -20,2 +21,0 @@\n"
        "diff --git a/gone.rs b/gone.rs\n"
        "--- a/gone.rs\n"
        "+++ /dev/null\n"
        "@@ -1,3 +0,0 @@\n";
    auto lines = parse_diff_added_lines(diff);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines["src/lib.rs"] == std::vector<int>{4, 5, 12});
}

TEST_CASE("GitCli reads a fresh repository", "[process]") {
    auto dir = fs::temp_directory_path() / "pmat_test_git";
    fs::remove_all(dir);
    fs::create_directories(dir);
    GitCli git(dir.string());
    REQUIRE_FALSE(git.is_repository());

    REQUIRE(run_command({"git", "init", "-q"}, dir.string()).value().exit_code == 0);
    REQUIRE(run_command({"git", "config", "user.email", "dev@example.com"}, dir.string()).is_ok());
    REQUIRE(run_command({"git", "config", "user.name", "Dev"}, dir.string()).is_ok());
    std::ofstream(dir / "lib.rs") << "pub fn f() {}\n";

    REQUIRE(git.is_repository());
    REQUIRE(git.commit({"lib.rs"}, "add lib").is_ok());
    auto head = git.head_commit();
    REQUIRE(head.is_ok());
    REQUIRE(head.value().size() == 40);

    auto churn = git.churn(30);
    REQUIRE(churn.is_ok());
    REQUIRE(churn.value().size() == 1);
    REQUIRE(churn.value()[0].path == "lib.rs");

    REQUIRE(git.rev_parse("HEAD").value() == head.value());
    REQUIRE(git.rev_parse("missing-ref").is_err());
    std::ofstream(dir / "lib.rs", std::ios::app) << "pub fn g() {}\n";
    std::ofstream(dir / "new.rs") << "fn n() {}\n";
    auto changed = git.changed_lines("HEAD");
    REQUIRE(changed.is_ok());
    REQUIRE(changed.value().at("lib.rs") == std::vector<int>{2});
    REQUIRE(git.untracked_files().value() == std::vector<std::string>{"new.rs"});
    fs::remove_all(dir);
}

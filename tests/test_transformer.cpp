#include <catch2/catch.hpp>
#include <pmat/refactor/transformer.hpp>

using namespace pmat::refactor;

TEST_CASE("transform removes debt comments", "[transformer]") {
    std::string src =
        "fn main() {\n"
        "    // TODO: handle errors\n"
        "    let x = 1;\n"
        "    // plain explanation\n"
        "    // FIXME broken on windows\n"
        "}\n";
    auto c = transform_source("src/main.rs", src, TransformOptions{});
    REQUIRE(c.satd_removed == 2);
    REQUIRE(c.content ==
            "fn main() {\n"
            "    let x = 1;\n"
            "    // plain explanation\n"
            "}\n");
    REQUIRE(c.changed(src));
}

TEST_CASE("transform keeps doc comments and shebangs", "[transformer]") {
    std::string rs = "/// TODO in docs stays\nfn a() {}\n";
    REQUIRE(transform_source("a.rs", rs, TransformOptions{}).content == rs);

    std::string sh = "#!/bin/sh todo\n# HACK: retry twice\necho hi\n";
    auto c = transform_source("run.sh", sh, TransformOptions{});
    REQUIRE(c.content == "#!/bin/sh todo\necho hi\n");
    REQUIRE(c.satd_removed == 1);
}

TEST_CASE("transform leaves trailing code comments alone", "[transformer]") {
    std::string py = "x = 1  # TODO: tune\n";
    auto c = transform_source("a.py", py, TransformOptions{});
    REQUIRE(c.content == py);
    REQUIRE_FALSE(c.changed(py));
}

TEST_CASE("transform normalizes whitespace", "[transformer]") {
    std::string src = "int f() {   \n\treturn 1;\t\n}\n\n\n";
    auto c = transform_source("f.c", src, TransformOptions{});
    REQUIRE(c.content == "int f() {\n\treturn 1;\n}\n");
    REQUIRE(c.lines_trimmed == 2);

    REQUIRE(transform_source("f.c", "int x;", TransformOptions{}).content == "int x;\n");
    REQUIRE(transform_source("f.c", "", TransformOptions{}).content.empty());
}

TEST_CASE("conservative transform only normalizes", "[transformer]") {
    std::string src = "// TODO: later\nint x;  \n";
    TransformOptions opts;
    opts.conservative = true;
    auto c = transform_source("x.cpp", src, opts);
    REQUIRE(c.satd_removed == 0);
    REQUIRE(c.content == "// TODO: later\nint x;\n");

    TransformOptions keep;
    keep.remove_satd = false;
    REQUIRE(transform_source("x.cpp", src, keep).satd_removed == 0);
}

TEST_CASE("transform of unknown languages skips comment rules", "[transformer]") {
    std::string md = "// TODO: not code\n";
    auto c = transform_source("notes.md", md, TransformOptions{});
    REQUIRE(c.content == md);
    REQUIRE(c.satd_removed == 0);
}

#pragma once

#include <pmat/result.hpp>
#include <json/json.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pmat::analysis {

enum class Language {
    Rust, TypeScript, JavaScript, Python, C, Cpp, Go, Java, Kotlin,
    Shell, Makefile, Unknown
};

Language detect_language(const std::filesystem::path& path);
const char* language_name(Language lang);
bool is_source_language(Language lang);

struct FunctionInfo {
    std::string name;
    int start_line = 0;
    int end_line = 0;
    int cyclomatic = 1;
    int cognitive = 0;
    int max_nesting = 0;

    int lines() const { return end_line - start_line + 1; }
};

// Self-admitted technical debt marker found in a comment
struct SatdItem {
    int line = 0;
    std::string marker;     // matched word, upper-cased (TODO, FIXME, HACK, ...)
    std::string category;   // Design, Defect, Requirement, Security, Performance, Test
    std::string severity;   // Low, Medium, High, Critical
    std::string text;
};

// Language-agnostic summary of one source file. Heuristic: functions are
// located by header patterns and brace or indentation extent.
struct FileSummary {
    std::string path;
    Language language = Language::Unknown;
    std::string content_hash;
    int64_t mtime_ns = 0;
    int lines = 0;
    int code_lines = 0;
    int comment_lines = 0;
    int blank_lines = 0;
    std::vector<FunctionInfo> functions;
    std::vector<SatdItem> satd;
    std::vector<std::string> imports;   // raw local import targets
    std::vector<std::string> identifiers; // distinct identifiers referenced

    int max_cyclomatic() const;
    int total_cyclomatic() const;
    int max_cognitive() const;
    int longest_function() const;
    size_t approx_bytes() const;
};

// Pure analysis of in-memory content
FileSummary summarize_source(const std::string& path, const std::string& content,
                             Language lang);

Result<std::string> read_file(const std::filesystem::path& path);
Result<FileSummary> scan_file(const std::filesystem::path& path);

// Classify a comment's debt marker; empty marker when none
SatdItem classify_satd(const std::string& comment_text, int line);

Json::Value to_json(const FunctionInfo& fn);
Json::Value to_json(const FileSummary& summary, bool include_functions = true);

} // namespace pmat::analysis

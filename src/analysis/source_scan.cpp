#include <pmat/analysis/source_scan.hpp>
#include <pmat/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_set>

namespace fs = std::filesystem;

namespace pmat::analysis {

// ---------------------------------------------------------------------------
// Languages
// ---------------------------------------------------------------------------

Language detect_language(const fs::path& path) {
    std::string name = path.filename().string();
    if (name == "Makefile" || name == "makefile" || name == "GNUmakefile") {
        return Language::Makefile;
    }
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".rs") return Language::Rust;
    if (ext == ".ts" || ext == ".tsx" || ext == ".mts") return Language::TypeScript;
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs") return Language::JavaScript;
    if (ext == ".py" || ext == ".pyi") return Language::Python;
    if (ext == ".c" || ext == ".h") return Language::C;
    if (ext == ".cc" || ext == ".cpp" || ext == ".cxx" || ext == ".hpp" || ext == ".hh" || ext == ".hxx") {
        return Language::Cpp;
    }
    if (ext == ".go") return Language::Go;
    if (ext == ".java") return Language::Java;
    if (ext == ".kt" || ext == ".kts") return Language::Kotlin;
    if (ext == ".sh" || ext == ".bash") return Language::Shell;
    if (ext == ".mk") return Language::Makefile;
    return Language::Unknown;
}

const char* language_name(Language lang) {
    switch (lang) {
        case Language::Rust: return "rust";
        case Language::TypeScript: return "typescript";
        case Language::JavaScript: return "javascript";
        case Language::Python: return "python";
        case Language::C: return "c";
        case Language::Cpp: return "cpp";
        case Language::Go: return "go";
        case Language::Java: return "java";
        case Language::Kotlin: return "kotlin";
        case Language::Shell: return "shell";
        case Language::Makefile: return "makefile";
        case Language::Unknown: return "unknown";
    }
    return "unknown";
}

bool is_source_language(Language lang) {
    return lang != Language::Unknown && lang != Language::Makefile;
}

static bool uses_hash_comments(Language lang) {
    return lang == Language::Python || lang == Language::Shell || lang == Language::Makefile;
}

static bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

static bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// ---------------------------------------------------------------------------
// Line splitting: separate code from comment text, blank out string contents
// ---------------------------------------------------------------------------

namespace {

struct ScanLine {
    std::string code;
    std::string comment;
    bool blank = false;
};

class LineSplitter {
public:
    explicit LineSplitter(Language lang) : lang_(lang) {}

    ScanLine split(const std::string& line) {
        ScanLine out;
        out.blank = line.find_first_not_of(" \t\r") == std::string::npos;
        if (uses_hash_comments(lang_)) {
            split_hash(line, out);
        } else {
            split_c(line, out);
        }
        return out;
    }

private:
    void split_c(const std::string& line, ScanLine& out) {
        size_t n = line.size();
        size_t i = 0;
        while (i < n) {
            char c = line[i];
            if (in_block_) {
                if (c == '*' && i + 1 < n && line[i + 1] == '/') {
                    in_block_ = false;
                    i += 2;
                } else {
                    out.comment.push_back(c);
                    i++;
                }
                continue;
            }
            if (c == '/' && i + 1 < n && line[i + 1] == '/') {
                out.comment.append(line, i + 2, std::string::npos);
                return;
            }
            if (c == '/' && i + 1 < n && line[i + 1] == '*') {
                in_block_ = true;
                i += 2;
                continue;
            }
            if (c == '\'' && lang_ == Language::Rust) {
                // Char literal or lifetime
                if (i + 2 < n && line[i + 2] == '\'') {
                    out.code += "' '";
                    i += 3;
                    continue;
                }
                if (i + 1 < n && line[i + 1] == '\\') {
                    i = skip_string(line, i, '\'', out);
                    continue;
                }
                out.code.push_back(c);
                i++;
                continue;
            }
            if (c == '"' || c == '\'' || c == '`') {
                i = skip_string(line, i, c, out);
                continue;
            }
            out.code.push_back(c);
            i++;
        }
    }

    void split_hash(const std::string& line, ScanLine& out) {
        size_t n = line.size();
        size_t i = 0;

        if (lang_ == Language::Python) {
            std::string trimmed = line.substr(std::min(line.find_first_not_of(" \t"), n));
            if (!doc_delim_.empty()) {
                auto close = line.find(doc_delim_);
                if (close == std::string::npos) {
                    out.comment = line;
                    return;
                }
                out.comment = line.substr(0, close);
                doc_delim_.clear();
                i = close + 3;
            } else if (trimmed.rfind("\"\"\"", 0) == 0 || trimmed.rfind("'''", 0) == 0) {
                std::string delim = trimmed.substr(0, 3);
                size_t open = line.find(delim);
                auto close = line.find(delim, open + 3);
                if (close == std::string::npos) {
                    out.comment = line.substr(open + 3);
                    doc_delim_ = delim;
                    return;
                }
                out.comment = line.substr(open + 3, close - open - 3);
                i = close + 3;
            }
        }

        while (i < n) {
            char c = line[i];
            if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
                out.comment.append(line, i + 1, std::string::npos);
                return;
            }
            if ((c == '"' || c == '\'') && lang_ != Language::Makefile) {
                i = skip_string(line, i, c, out);
                continue;
            }
            out.code.push_back(c);
            i++;
        }
    }

    // Keeps the delimiters, drops the contents
    static size_t skip_string(const std::string& line, size_t i, char quote, ScanLine& out) {
        out.code.push_back(quote);
        i++;
        while (i < line.size()) {
            if (line[i] == '\\') {
                i += 2;
                continue;
            }
            if (line[i] == quote) {
                out.code.push_back(quote);
                return i + 1;
            }
            i++;
        }
        out.code.push_back(quote);
        return i;
    }

    Language lang_;
    bool in_block_ = false;
    std::string doc_delim_;
};

struct Token {
    std::string text;
    size_t pos;
};

std::vector<Token> tokenize(const std::string& code) {
    std::vector<Token> out;
    size_t i = 0;
    while (i < code.size()) {
        char c = code[i];
        if (is_ident_start(c)) {
            size_t start = i;
            while (i < code.size() && is_ident_char(code[i])) i++;
            out.push_back({code.substr(start, i - start), start});
            continue;
        }
        if (i + 1 < code.size()) {
            std::string two = code.substr(i, 2);
            if (two == "&&" || two == "||" || two == "=>" || two == "::") {
                out.push_back({two, i});
                i += 2;
                continue;
            }
        }
        if (c == '?' || c == '{' || c == '}') {
            out.push_back({std::string(1, c), i});
        }
        i++;
    }
    return out;
}

const std::unordered_set<std::string>& control_keywords() {
    static const std::unordered_set<std::string> kw = {
        "if", "for", "while", "switch", "match", "catch", "except", "loop", "until",
        "case", "elif", "else", "return", "do", "try", "with", "sizeof", "new",
        "delete", "throw", "function", "fn", "def", "func", "fun",
    };
    return kw;
}

// ---------------------------------------------------------------------------
// Function headers
// ---------------------------------------------------------------------------

std::string match_regex_header(Language lang, const std::string& code) {
    static const std::regex rust_fn(R"(\bfn\s+([A-Za-z_]\w*))");
    static const std::regex go_fn(R"(^\s*func\s+(?:\([^)]*\)\s*)?([A-Za-z_]\w*)\s*[\[(])");
    static const std::regex kotlin_fn(R"(\bfun\s+(?:<[^>]*>\s*)?(?:[\w.]+\.)?([A-Za-z_]\w*)\s*\()");
    static const std::regex js_fn(R"(\bfunction\s*\*?\s*([A-Za-z_$][\w$]*)\s*\()");
    static const std::regex js_arrow(
        R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=]+)?=\s*(?:async\s*)?(?:\([^)]*\)|[A-Za-z_$][\w$]*)\s*(?::[^=]+)?=>)");
    static const std::regex js_method(
        R"(^\s*(?:(?:public|private|protected|static|async|readonly|override|get|set)\s+)*([A-Za-z_$][\w$]*)\s*\([^)]*\)\s*(?::\s*[^{;]+)?\{)");
    static const std::regex py_def(R"(^\s*(?:async\s+)?def\s+([A-Za-z_]\w*))");
    static const std::regex sh_fn(R"(^\s*(?:function\s+)?([A-Za-z_][\w-]*)\s*\(\)\s*\{?)");
    static const std::regex sh_fn_kw(R"(^\s*function\s+([A-Za-z_][\w-]*))");

    std::smatch m;
    switch (lang) {
        case Language::Rust:
            if (std::regex_search(code, m, rust_fn)) return m[1];
            break;
        case Language::Go:
            if (std::regex_search(code, m, go_fn)) return m[1];
            break;
        case Language::Kotlin:
            if (std::regex_search(code, m, kotlin_fn)) return m[1];
            break;
        case Language::JavaScript:
        case Language::TypeScript:
            if (std::regex_search(code, m, js_fn)) return m[1];
            if (std::regex_search(code, m, js_arrow)) return m[1];
            if (std::regex_search(code, m, js_method)) {
                std::string name = m[1];
                if (!control_keywords().count(name)) return name;
            }
            break;
        case Language::Python:
            if (std::regex_search(code, m, py_def)) return m[1];
            break;
        case Language::Shell:
            if (std::regex_search(code, m, sh_fn_kw)) return m[1];
            if (std::regex_search(code, m, sh_fn)) return m[1];
            break;
        default:
            break;
    }
    return "";
}

// C, C++ and Java: `<type tokens> name(` with no assignment or call context
std::string match_c_header(const std::string& code) {
    size_t paren = code.find('(');
    if (paren == std::string::npos || paren == 0) return "";
    size_t end = paren;
    while (end > 0 && std::isspace(static_cast<unsigned char>(code[end - 1]))) end--;
    size_t start = end;
    while (start > 0 && (is_ident_char(code[start - 1]) || code[start - 1] == ':' ||
                         code[start - 1] == '~')) {
        start--;
    }
    if (start == end) return "";
    std::string qualified = code.substr(start, end - start);
    std::string prefix = code.substr(0, start);

    size_t last_colon = qualified.rfind(':');
    std::string name = last_colon == std::string::npos ? qualified : qualified.substr(last_colon + 1);
    if (name.empty() || !is_ident_start(name[0] == '~' && name.size() > 1 ? name[1] : name[0])) {
        return "";
    }
    if (control_keywords().count(name)) return "";

    for (char c : prefix) {
        if (!(is_ident_char(c) || std::isspace(static_cast<unsigned char>(c)) ||
              c == ':' || c == '<' || c == '>' || c == ',' || c == '*' || c == '&' ||
              c == '[' || c == ']')) {
            return "";
        }
    }

    auto prefix_tokens = tokenize(prefix);
    bool has_type = false;
    for (const auto& t : prefix_tokens) {
        if (t.text == "return" || t.text == "new" || t.text == "else" || t.text == "throw" ||
            t.text == "case" || t.text == "goto") {
            return "";
        }
        if (is_ident_start(t.text[0])) has_type = true;
    }
    if (!has_type && qualified.find("::") == std::string::npos) return "";
    return name;
}

std::string match_header(Language lang, const std::string& code) {
    if (lang == Language::C || lang == Language::Cpp || lang == Language::Java) {
        return match_c_header(code);
    }
    return match_regex_header(lang, code);
}

int indent_of(const std::string& line) {
    int n = 0;
    for (char c : line) {
        if (c == ' ') n++;
        else if (c == '\t') n += 4;
        else break;
    }
    return n;
}

// Decision and nesting counts over one function body
struct ComplexityCounter {
    Language lang;
    int cyclomatic = 1;
    int cognitive = 0;
    int max_nesting = 0;

    void line(const std::string& code, int nesting) {
        max_nesting = std::max(max_nesting, nesting);
        auto tokens = tokenize(code);
        std::string prev;
        bool in_bool_seq = false;
        for (const auto& t : tokens) {
            const std::string& w = t.text;
            if (w == "if" || w == "elif") {
                cyclomatic++;
                // `else if` was already counted by its else
                if (prev != "else") cognitive += w == "elif" ? 1 : 1 + nesting;
            } else if (w == "for" || w == "while" || w == "until" || w == "catch" ||
                       w == "except") {
                cyclomatic++;
                cognitive += 1 + nesting;
            } else if (w == "loop" && lang == Language::Rust) {
                cognitive += 1 + nesting;
            } else if (w == "switch" || w == "match") {
                cognitive += 1 + nesting;
            } else if (w == "case" && lang != Language::Python) {
                cyclomatic++;
            } else if (w == "=>" && lang == Language::Rust) {
                cyclomatic++;
            } else if (w == "else") {
                cognitive++;
            } else if (w == "&&" || w == "||" ||
                       (lang == Language::Python && (w == "and" || w == "or"))) {
                cyclomatic++;
                if (!in_bool_seq) cognitive++;
                in_bool_seq = true;
                prev = w;
                continue;
            } else if (w == "?" && lang != Language::Rust && lang != Language::Kotlin) {
                cyclomatic++;
                cognitive += 1 + nesting;
            }
            in_bool_seq = false;
            prev = w;
        }
    }
};

} // namespace

// ---------------------------------------------------------------------------
// SATD classification
// ---------------------------------------------------------------------------

namespace {

struct DebtPattern {
    std::regex regex;
    const char* category;
    const char* severity;
};

const std::vector<DebtPattern>& debt_patterns() {
    static const std::vector<DebtPattern> patterns = [] {
        auto icase = std::regex::ECMAScript | std::regex::icase;
        std::vector<DebtPattern> p;
        p.push_back({std::regex(R"(\b(hack|kludge|smell|xxx)\b)", icase), "Design", "Medium"});
        p.push_back({std::regex(R"(\b(fixme|broken|bug)\b)", icase), "Defect", "High"});
        p.push_back({std::regex(R"(\btodo\b)", icase), "Requirement", "Low"});
        p.push_back({std::regex(R"(\b(security|vuln|cve)\b)", icase), "Security", "Critical"});
        p.push_back({std::regex(R"(\bperformance\s+(issue|problem)\b)", icase), "Performance", "Medium"});
        p.push_back({std::regex(R"(\btest.*\b(disabled|skipped|failing)\b)", icase), "Test", "Medium"});
        p.push_back({std::regex(R"(\btechnical\s+debt\b)", icase), "Design", "Medium"});
        p.push_back({std::regex(R"(\b(workaround|temporary)\b)", icase), "Design", "Low"});
        return p;
    }();
    return patterns;
}

} // namespace

SatdItem classify_satd(const std::string& comment_text, int line) {
    SatdItem item;
    item.line = line;
    for (const auto& p : debt_patterns()) {
        std::smatch m;
        if (std::regex_search(comment_text, m, p.regex)) {
            item.marker = m.str(0);
            std::transform(item.marker.begin(), item.marker.end(), item.marker.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            item.category = p.category;
            item.severity = p.severity;
            auto start = comment_text.find_first_not_of(" \t*!/#-");
            item.text = start == std::string::npos ? "" : comment_text.substr(start);
            while (!item.text.empty() && std::isspace(static_cast<unsigned char>(item.text.back()))) {
                item.text.pop_back();
            }
            break;
        }
    }
    return item;
}

// ---------------------------------------------------------------------------
// Imports
// ---------------------------------------------------------------------------

static void collect_imports(Language lang, const std::string& raw, const std::string& code,
                            std::vector<std::string>& out) {
    static const std::regex c_include(R"(^\s*#\s*include\s*\"([^\"]+)\")");
    static const std::regex rust_mod(R"(^\s*(?:pub(?:\([^)]*\))?\s+)?mod\s+([A-Za-z_]\w*)\s*;)");
    static const std::regex py_from(R"(^\s*from\s+([.\w]+)\s+import\b)");
    static const std::regex py_import(R"(^\s*import\s+([\w.]+))");
    static const std::regex js_from(R"(\bfrom\s+['"](\.[^'"]+)['"])");
    static const std::regex js_require(R"(\brequire\s*\(\s*['"](\.[^'"]+)['"]\s*\))");
    static const std::regex js_bare(R"(^\s*import\s+['"](\.[^'"]+)['"])");
    static const std::regex jvm_import(R"(^\s*import\s+([\w.]+)\s*;?)");
    static const std::regex sh_source(R"(^\s*(?:source|\.)\s+([^\s;]+))");
    static const std::regex make_include(R"(^\s*-?include\s+(\S+))");

    std::smatch m;
    switch (lang) {
        case Language::C:
        case Language::Cpp:
            // String contents are blanked in code, so match the raw line
            if (std::regex_search(raw, m, c_include)) out.push_back(m[1]);
            break;
        case Language::Rust:
            if (std::regex_search(code, m, rust_mod)) out.push_back(m[1]);
            break;
        case Language::Python:
            if (std::regex_search(code, m, py_from)) out.push_back(m[1]);
            else if (std::regex_search(code, m, py_import)) out.push_back(m[1]);
            break;
        case Language::JavaScript:
        case Language::TypeScript:
            if (std::regex_search(raw, m, js_from)) out.push_back(m[1]);
            else if (std::regex_search(raw, m, js_require)) out.push_back(m[1]);
            else if (std::regex_search(raw, m, js_bare)) out.push_back(m[1]);
            break;
        case Language::Java:
        case Language::Kotlin:
            if (std::regex_search(code, m, jvm_import)) out.push_back(m[1]);
            break;
        case Language::Shell:
            if (std::regex_search(raw, m, sh_source)) out.push_back(m[1]);
            break;
        case Language::Makefile:
            if (std::regex_search(raw, m, make_include)) out.push_back(m[1]);
            break;
        default:
            break;
    }
}

// ---------------------------------------------------------------------------
// Summary
// ---------------------------------------------------------------------------

int FileSummary::max_cyclomatic() const {
    int best = 0;
    for (const auto& f : functions) best = std::max(best, f.cyclomatic);
    return best;
}

int FileSummary::total_cyclomatic() const {
    int total = 0;
    for (const auto& f : functions) total += f.cyclomatic;
    return total;
}

int FileSummary::max_cognitive() const {
    int best = 0;
    for (const auto& f : functions) best = std::max(best, f.cognitive);
    return best;
}

int FileSummary::longest_function() const {
    int best = 0;
    for (const auto& f : functions) best = std::max(best, f.lines());
    return best;
}

size_t FileSummary::approx_bytes() const {
    size_t n = sizeof(FileSummary) + path.size() + content_hash.size();
    for (const auto& f : functions) n += sizeof(FunctionInfo) + f.name.size();
    for (const auto& s : satd) {
        n += sizeof(SatdItem) + s.marker.size() + s.category.size() + s.severity.size() + s.text.size();
    }
    for (const auto& s : imports) n += sizeof(std::string) + s.size();
    for (const auto& s : identifiers) n += sizeof(std::string) + s.size();
    return n;
}

static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::string cur;
    for (char c : content) {
        if (c == '\n') {
            if (!cur.empty() && cur.back() == '\r') cur.pop_back();
            lines.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) lines.push_back(std::move(cur));
    return lines;
}

// Brace-delimited body starting at or after line `from`; -1 when the header
// turns out to be a declaration.
static int find_brace_body_end(const std::vector<ScanLine>& lines, size_t from) {
    int depth = 0;
    bool opened = false;
    size_t limit = std::min(lines.size(), from + 4);
    for (size_t i = from; i < lines.size(); ++i) {
        for (char c : lines[i].code) {
            if (!opened && c == ';') return -1;
            if (c == '{') {
                depth++;
                opened = true;
            } else if (c == '}' && opened) {
                depth--;
                if (depth == 0) return static_cast<int>(i);
            }
        }
        if (!opened && i + 1 >= limit) return -1;
    }
    return opened ? static_cast<int>(lines.size()) - 1 : -1;
}

static FunctionInfo measure_brace_function(Language lang, const std::string& name,
                                           const std::vector<ScanLine>& lines,
                                           size_t start, size_t end) {
    FunctionInfo fn;
    fn.name = name;
    fn.start_line = static_cast<int>(start) + 1;
    fn.end_line = static_cast<int>(end) + 1;

    ComplexityCounter counter{lang};
    int depth = 0;
    for (size_t i = start; i <= end; ++i) {
        const std::string& code = lines[i].code;
        // Nesting at the first statement on this line
        int line_depth = depth;
        size_t first = code.find_first_not_of(" \t");
        if (first != std::string::npos && code[first] == '}') line_depth = std::max(0, depth - 1);
        counter.line(code, std::max(0, line_depth - 1));
        for (char c : code) {
            if (c == '{') depth++;
            else if (c == '}') depth--;
        }
        counter.max_nesting = std::max(counter.max_nesting, std::max(0, depth - 1));
    }
    fn.cyclomatic = counter.cyclomatic;
    fn.cognitive = counter.cognitive;
    fn.max_nesting = counter.max_nesting;
    return fn;
}

static FunctionInfo measure_indent_function(const std::string& name,
                                            const std::vector<std::string>& raw,
                                            const std::vector<ScanLine>& lines,
                                            size_t start, size_t& end_out) {
    FunctionInfo fn;
    fn.name = name;
    fn.start_line = static_cast<int>(start) + 1;

    int header_indent = indent_of(raw[start]);
    int unit = 0;
    size_t end = start;
    for (size_t i = start + 1; i < raw.size(); ++i) {
        if (lines[i].blank) continue;
        int ind = indent_of(raw[i]);
        if (ind <= header_indent) break;
        if (unit == 0) unit = ind - header_indent;
        end = i;
    }
    if (unit == 0) unit = 4;

    ComplexityCounter counter{Language::Python};
    for (size_t i = start; i <= end; ++i) {
        if (lines[i].blank || lines[i].code.find_first_not_of(" \t") == std::string::npos) continue;
        int rel = (indent_of(raw[i]) - header_indent) / unit - 1;
        counter.line(lines[i].code, std::max(0, rel));
    }
    fn.end_line = static_cast<int>(end) + 1;
    fn.cyclomatic = counter.cyclomatic;
    fn.cognitive = counter.cognitive;
    fn.max_nesting = counter.max_nesting;
    end_out = end;
    return fn;
}

FileSummary summarize_source(const std::string& path, const std::string& content, Language lang) {
    FileSummary s;
    s.path = path;
    s.language = lang;
    s.content_hash = SHA256::hash_hex(content);

    auto raw = split_lines(content);
    s.lines = static_cast<int>(raw.size());

    LineSplitter splitter(lang);
    std::vector<ScanLine> lines;
    lines.reserve(raw.size());
    for (const auto& r : raw) lines.push_back(splitter.split(r));

    for (size_t i = 0; i < lines.size(); ++i) {
        const auto& l = lines[i];
        bool has_code = l.code.find_first_not_of(" \t\r") != std::string::npos;
        if (l.blank) s.blank_lines++;
        else if (has_code) s.code_lines++;
        else s.comment_lines++;

        if (!l.comment.empty()) {
            auto item = classify_satd(l.comment, static_cast<int>(i) + 1);
            if (!item.marker.empty()) s.satd.push_back(std::move(item));
        }
        if (has_code || lang == Language::C || lang == Language::Cpp) {
            collect_imports(lang, raw[i], l.code, s.imports);
        }
    }

    if (!is_source_language(lang)) return s;

    // Function headers; the defining occurrence of a name is not a reference
    std::vector<std::pair<size_t, std::string>> headers;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].code.empty()) continue;
        std::string name = match_header(lang, lines[i].code);
        if (name.empty()) continue;

        if (lang == Language::Python) {
            size_t end = i;
            s.functions.push_back(measure_indent_function(name, raw, lines, i, end));
            headers.emplace_back(i, name);
            continue;
        }
        int end = find_brace_body_end(lines, i);
        if (end < 0) continue;
        s.functions.push_back(measure_brace_function(lang, name, lines, i,
                                                     static_cast<size_t>(end)));
        headers.emplace_back(i, name);
    }

    std::set<std::string> idents;
    size_t h = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string skip;
        while (h < headers.size() && headers[h].first < i) h++;
        if (h < headers.size() && headers[h].first == i) skip = headers[h].second;
        for (const auto& t : tokenize(lines[i].code)) {
            if (!is_ident_start(t.text[0]) || control_keywords().count(t.text)) continue;
            if (!skip.empty() && t.text == skip) {
                skip.clear();
                continue;
            }
            idents.insert(t.text);
        }
    }
    s.identifiers.assign(idents.begin(), idents.end());
    return s;
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        return PmatError::io("cannot read file").with_file(path.string());
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) {
        return PmatError::io("error while reading file").with_file(path.string());
    }
    return Result<std::string>::ok(ss.str());
}

Result<FileSummary> scan_file(const fs::path& path) {
    auto content = read_file(path);
    if (content.is_err()) return std::move(content).error();

    auto summary = summarize_source(path.string(), content.value(), detect_language(path));
    std::error_code ec;
    auto mtime = fs::last_write_time(path, ec);
    if (!ec) {
        summary.mtime_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
            mtime.time_since_epoch()).count();
    }
    return Result<FileSummary>::ok(std::move(summary));
}

// ---------------------------------------------------------------------------
// JSON
// ---------------------------------------------------------------------------

Json::Value to_json(const FunctionInfo& fn) {
    Json::Value j(Json::objectValue);
    j["name"] = fn.name;
    j["start_line"] = fn.start_line;
    j["end_line"] = fn.end_line;
    j["lines"] = fn.lines();
    j["cyclomatic"] = fn.cyclomatic;
    j["cognitive"] = fn.cognitive;
    j["max_nesting"] = fn.max_nesting;
    return j;
}

Json::Value to_json(const FileSummary& summary, bool include_functions) {
    Json::Value j(Json::objectValue);
    j["path"] = summary.path;
    j["language"] = language_name(summary.language);
    j["lines"] = summary.lines;
    j["code_lines"] = summary.code_lines;
    j["comment_lines"] = summary.comment_lines;
    j["blank_lines"] = summary.blank_lines;
    j["function_count"] = static_cast<int>(summary.functions.size());
    j["max_cyclomatic"] = summary.max_cyclomatic();
    j["total_cyclomatic"] = summary.total_cyclomatic();
    j["max_cognitive"] = summary.max_cognitive();
    if (include_functions) {
        Json::Value fns(Json::arrayValue);
        for (const auto& fn : summary.functions) fns.append(to_json(fn));
        j["functions"] = fns;
    }
    return j;
}

} // namespace pmat::analysis

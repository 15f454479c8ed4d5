#include <pmat/glob.hpp>
#include <algorithm>

namespace fs = std::filesystem;

namespace pmat {

static std::string normalize_path(const std::string& p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
        if (c == '\\') c = '/';
        if (c == '/' && !out.empty() && out.back() == '/') continue;
        out.push_back(c);
    }
    if (out.size() > 2 && out[0] == '.' && out[1] == '/') out.erase(0, 2);
    if (out.size() > 1 && out.back() == '/') out.pop_back();
    return out;
}

static std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> segs(1);
    for (char c : s) {
        if (c == '/') segs.emplace_back();
        else segs.back().push_back(c);
    }
    return segs;
}

// Character class starting after '['; advances pi past ']'
static bool match_class(const std::string& pat, size_t& pi, char sc) {
    bool negate = pi < pat.size() && pat[pi] == '!';
    if (negate) pi++;
    bool matched = false;
    while (pi < pat.size() && pat[pi] != ']') {
        char lo = pat[pi];
        if (pi + 2 < pat.size() && pat[pi + 1] == '-' && pat[pi + 2] != ']') {
            if (sc >= lo && sc <= pat[pi + 2]) matched = true;
            pi += 3;
        } else {
            if (sc == lo) matched = true;
            pi++;
        }
    }
    if (pi < pat.size()) pi++;
    return matched != negate;
}

static bool match_segment(const std::string& pat, size_t pi,
                          const std::string& str, size_t si) {
    while (pi < pat.size()) {
        char pc = pat[pi];
        if (pc == '*') {
            while (pi < pat.size() && pat[pi] == '*') pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= str.size(); k++) {
                if (match_segment(pat, pi, str, k)) return true;
            }
            return false;
        }
        if (si >= str.size()) return false;
        if (pc == '?') {
            pi++;
        } else if (pc == '[') {
            pi++;
            if (!match_class(pat, pi, str[si])) return false;
        } else {
            if (pc != str[si]) return false;
            pi++;
        }
        si++;
    }
    return si == str.size();
}

static bool match_segments(const std::vector<std::string>& pat, size_t pi,
                           const std::vector<std::string>& path, size_t si) {
    while (pi < pat.size()) {
        if (pat[pi] == "**") {
            while (pi < pat.size() && pat[pi] == "**") pi++;
            if (pi == pat.size()) return true;
            for (size_t k = si; k <= path.size(); k++) {
                if (match_segments(pat, pi, path, k)) return true;
            }
            return false;
        }
        if (si >= path.size() || !match_segment(pat[pi], 0, path[si], 0)) return false;
        pi++;
        si++;
    }
    return si == path.size();
}

bool glob_match(const std::string& pattern, const std::string& path) {
    return match_segments(split_segments(normalize_path(pattern)), 0,
                          split_segments(normalize_path(path)), 0);
}

bool glob_selects(const std::vector<std::string>& patterns, const std::string& path) {
    if (patterns.empty()) return true;
    bool included = false;
    bool any_include = false;
    for (const auto& pat : patterns) {
        if (!pat.empty() && pat[0] == '!') {
            if (glob_match(pat.substr(1), path)) included = false;
        } else {
            any_include = true;
            if (glob_match(pat, path)) included = true;
        }
    }
    // Exclude-only lists start from "everything"
    if (!any_include) {
        included = true;
        for (const auto& pat : patterns) {
            if (glob_match(pat.substr(1), path)) included = false;
        }
    }
    return included;
}

bool is_ignored_dir(const std::string& name) {
    static const char* const kIgnored[] = {
        ".git", ".hg", ".svn", "target", "node_modules", "build",
        "dist", "__pycache__", ".venv", ".pmat", ".idea", ".vscode"
    };
    for (const char* d : kIgnored) {
        if (name == d) return true;
    }
    return false;
}

Result<std::vector<std::string>> discover_files(const fs::path& root,
                                                const DiscoverOptions& opts) {
    std::error_code ec;
    if (fs::is_regular_file(root, ec)) {
        return Result<std::vector<std::string>>::ok({root.filename().string()});
    }
    if (!fs::is_directory(root, ec)) {
        return PmatError(PmatError::NotFound,
            "path does not exist or is not a directory: " + root.string());
    }

    std::vector<std::string> results;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return PmatError::io("cannot read directory " + root.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return PmatError::io("error walking " + root.string() + ": " + ec.message());
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();
        bool hidden = !name.empty() && name[0] == '.';

        if (entry.is_directory(ec)) {
            if (is_ignored_dir(name) || (hidden && !opts.include_hidden)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec) || (hidden && !opts.include_hidden)) continue;
        if (opts.max_file_bytes > 0 && entry.file_size(ec) > opts.max_file_bytes) continue;

        auto rel = normalize_path(fs::relative(entry.path(), root, ec).generic_string());
        if (ec) continue;
        if (glob_selects(opts.patterns, rel)) {
            results.push_back(std::move(rel));
        }
    }

    std::sort(results.begin(), results.end());
    return Result<std::vector<std::string>>::ok(std::move(results));
}

} // namespace pmat

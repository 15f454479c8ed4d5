#include <pmat/refactor/transformer.hpp>
#include <pmat/analysis/source_scan.hpp>

#include <sstream>
#include <vector>

namespace pmat::refactor {

using analysis::Language;

static const char* line_comment_token(Language lang) {
    switch (lang) {
        case Language::Python:
        case Language::Shell:
        case Language::Makefile:
            return "#";
        case Language::Unknown:
            return nullptr;
        default:
            return "//";
    }
}

static std::string rstrip(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r");
    return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

Candidate transform_source(const std::string& path, const std::string& content,
                           const TransformOptions& opts) {
    Language lang = analysis::detect_language(path);
    const char* token = line_comment_token(lang);
    bool strip_satd = opts.remove_satd && !opts.conservative && token != nullptr;

    std::vector<std::string> lines;
    std::istringstream in(content);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);

    Candidate out;
    std::string body;
    body.reserve(content.size());
    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& raw = lines[i];
        std::string trimmed = rstrip(raw);
        if (trimmed.size() != raw.size()) out.lines_trimmed++;

        if (strip_satd) {
            auto first = trimmed.find_first_not_of(" \t");
            // Shebangs and doc comments stay
            if (first != std::string::npos && trimmed.compare(first, std::char_traits<char>::length(token), token) == 0 &&
                trimmed.compare(first, 2, "#!") != 0 && trimmed.compare(first, 3, "///") != 0) {
                auto item = analysis::classify_satd(trimmed.substr(first), static_cast<int>(i) + 1);
                if (!item.marker.empty()) {
                    out.satd_removed++;
                    continue;
                }
            }
        }
        body += trimmed;
        body += '\n';
    }

    // Exactly one trailing newline
    while (body.size() >= 2 && body[body.size() - 1] == '\n' && body[body.size() - 2] == '\n') {
        body.pop_back();
    }
    out.content = std::move(body);
    return out;
}

} // namespace pmat::refactor

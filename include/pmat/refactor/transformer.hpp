#pragma once

#include <string>

namespace pmat::refactor {

struct TransformOptions {
    bool remove_satd = true;
    // Regeneration after a failed verify: whitespace normalization only
    bool conservative = false;
};

struct Candidate {
    std::string content;
    int satd_removed = 0;
    int lines_trimmed = 0;

    bool changed(const std::string& original) const { return content != original; }
};

// Rule-based rewrite of one file. Deletes whole-line comments that carry a
// debt marker (TODO, FIXME, HACK, ...), strips trailing whitespace and ends
// the file with exactly one newline. Language comes from the path.
Candidate transform_source(const std::string& path, const std::string& content,
                           const TransformOptions& opts);

} // namespace pmat::refactor

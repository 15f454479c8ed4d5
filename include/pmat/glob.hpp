#pragma once

#include <pmat/result.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>

namespace pmat {

// Match a glob pattern against a path (both normalized to forward slashes).
// Supports: * (any chars except /), ? (single char except /),
//           ** (zero or more path segments), [abc], [a-z], [!0-9]
bool glob_match(const std::string& pattern, const std::string& path);

// Ordered include/exclude filter; '!'-prefixed patterns exclude, last match wins.
bool glob_selects(const std::vector<std::string>& patterns, const std::string& path);

struct DiscoverOptions {
    std::vector<std::string> patterns;       // empty = every file
    uint64_t max_file_bytes = 512 * 1024;    // 0 = unlimited
    bool include_hidden = false;
};

// Walk root for regular files, skipping VCS and build output directories.
// Returns paths relative to root, sorted. A regular file passed as root
// yields just its filename, relative to its parent directory.
Result<std::vector<std::string>> discover_files(const std::filesystem::path& root,
                                                const DiscoverOptions& opts = {});

// Directory names never descended into by discover_files
bool is_ignored_dir(const std::string& name);

} // namespace pmat

#pragma once

#include <pmat/result.hpp>
#include <string>

namespace pmat {

// Semantic version: major.minor.patch[-prerelease]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const { return !(*this == o); }
    bool operator<(const Version& o) const;
    bool operator>(const Version& o) const { return o < *this; }
};

} // namespace pmat

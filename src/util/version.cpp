#include <pmat/version.hpp>
#include <cctype>

namespace pmat {

static bool parse_component(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    // No leading zeros except for "0" itself
    if (s.size() > 1 && s[0] == '0') return false;
    out = std::stoi(s);
    return true;
}

Result<Version> Version::parse(const std::string& s) {
    auto bad = [&s]() {
        return PmatError(PmatError::BadRequest,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-prerelease]");
    };

    std::string core = s;
    Version v;
    auto dash = s.find('-');
    if (dash != std::string::npos) {
        core = s.substr(0, dash);
        v.prerelease = s.substr(dash + 1);
        if (v.prerelease.empty()) return bad();
        for (char c : v.prerelease) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-') {
                return bad();
            }
        }
    }

    auto dot1 = core.find('.');
    if (dot1 == std::string::npos) return bad();
    auto dot2 = core.find('.', dot1 + 1);
    if (dot2 == std::string::npos) return bad();

    if (!parse_component(core.substr(0, dot1), v.major) ||
        !parse_component(core.substr(dot1 + 1, dot2 - dot1 - 1), v.minor) ||
        !parse_component(core.substr(dot2 + 1), v.patch)) {
        return bad();
    }
    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." + std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!prerelease.empty()) s += "-" + prerelease;
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor && patch == o.patch &&
           prerelease == o.prerelease;
}

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    // A prerelease sorts before the release it precedes
    if (prerelease.empty() != o.prerelease.empty()) return !prerelease.empty();
    return prerelease < o.prerelease;
}

} // namespace pmat

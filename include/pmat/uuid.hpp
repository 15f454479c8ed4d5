#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace pmat {

// Random (version 4) UUIDs for trace ids and session ids.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();
    std::string to_string() const;

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
};

} // namespace pmat

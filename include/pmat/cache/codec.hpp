#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Compact binary encoding (varint + length-prefixed strings) for values
// stored in the persistent cache.
namespace pmat::cache::ser {

using Bytes = std::vector<uint8_t>;

inline void write_varint(Bytes& buf, uint64_t val) {
    while (val >= 0x80) {
        buf.push_back(static_cast<uint8_t>(val & 0x7F) | 0x80);
        val >>= 7;
    }
    buf.push_back(static_cast<uint8_t>(val));
}

inline bool read_varint(const uint8_t*& p, const uint8_t* end, uint64_t& val) {
    val = 0;
    unsigned shift = 0;
    while (p < end) {
        uint8_t b = *p++;
        val |= static_cast<uint64_t>(b & 0x7F) << shift;
        if (!(b & 0x80)) return true;
        shift += 7;
        if (shift >= 64) return false;
    }
    return false;
}

inline void write_string(Bytes& buf, const std::string& s) {
    write_varint(buf, s.size());
    buf.insert(buf.end(), s.begin(), s.end());
}

inline bool read_string(const uint8_t*& p, const uint8_t* end, std::string& s) {
    uint64_t len;
    if (!read_varint(p, end, len)) return false;
    if (len > static_cast<uint64_t>(end - p)) return false;
    s.assign(reinterpret_cast<const char*>(p), static_cast<size_t>(len));
    p += len;
    return true;
}

// Zigzag so small negative numbers stay short
inline void write_int(Bytes& buf, int64_t v) {
    write_varint(buf, (static_cast<uint64_t>(v) << 1) ^ static_cast<uint64_t>(v >> 63));
}

inline bool read_int(const uint8_t*& p, const uint8_t* end, int64_t& v) {
    uint64_t raw;
    if (!read_varint(p, end, raw)) return false;
    v = static_cast<int64_t>((raw >> 1) ^ (~(raw & 1) + 1));
    return true;
}

inline bool read_int(const uint8_t*& p, const uint8_t* end, int& v) {
    int64_t wide;
    if (!read_int(p, end, wide)) return false;
    v = static_cast<int>(wide);
    return true;
}

inline void write_byte(Bytes& buf, uint8_t v) {
    buf.push_back(v);
}

inline bool read_byte(const uint8_t*& p, const uint8_t* end, uint8_t& v) {
    if (p >= end) return false;
    v = *p++;
    return true;
}

inline bool read_magic(const uint8_t*& p, const uint8_t* end, const char* magic, size_t len) {
    if (static_cast<size_t>(end - p) < len) return false;
    for (size_t i = 0; i < len; ++i) {
        if (p[i] != static_cast<uint8_t>(magic[i])) return false;
    }
    p += len;
    return true;
}

} // namespace pmat::cache::ser

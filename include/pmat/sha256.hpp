#pragma once

#include <pmat/result.hpp>
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>
#include <filesystem>

namespace pmat {

// Streaming SHA-256 (FIPS 180-4). Used for content hashes, template
// checksums and analysis fingerprints.
class SHA256 {
public:
    using Digest = std::array<uint8_t, 32>;

    SHA256();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Field separator for multi-part digests ("ab","c" != "a","bc")
    void update_field(const std::string& s);

    // Object must not be reused after finalize().
    Digest finalize();

    static std::string hex(const Digest& d);
    static std::string hash_hex(const std::string& input);
    static Result<std::string> hash_file(const std::filesystem::path& path);

private:
    void compress(const uint8_t* block);

    std::array<uint32_t, 8> h_;
    uint8_t pending_[64];
    size_t pending_len_ = 0;
    uint64_t length_ = 0;
};

} // namespace pmat

#include <pmat/sha256.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>

namespace pmat {

// Round constants, FIPS 180-4 section 4.2.2
static constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

static inline uint32_t rotr(uint32_t x, unsigned n) {
    return (x >> n) | (x << (32 - n));
}

SHA256::SHA256()
    : h_{0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
         0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19} {}

void SHA256::compress(const uint8_t* block) {
    uint32_t w[64];
    for (int i = 0; i < 16; ++i) {
        w[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
               (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; ++i) {
        uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
        uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
        w[i] = w[i - 16] + s0 + w[i - 7] + s1;
    }

    uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3];
    uint32_t e = h_[4], f = h_[5], g = h_[6], h = h_[7];

    for (int i = 0; i < 64; ++i) {
        uint32_t t1 = h + (rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25)) +
                      ((e & f) ^ (~e & g)) + K[i] + w[i];
        uint32_t t2 = (rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22)) +
                      ((a & b) ^ (a & c) ^ (b & c));
        h = g; g = f; f = e; e = d + t1;
        d = c; c = b; b = a; a = t1 + t2;
    }

    h_[0] += a; h_[1] += b; h_[2] += c; h_[3] += d;
    h_[4] += e; h_[5] += f; h_[6] += g; h_[7] += h;
}

void SHA256::update(const uint8_t* data, size_t len) {
    length_ += len;
    while (len > 0) {
        size_t take = std::min(len, sizeof(pending_) - pending_len_);
        std::memcpy(pending_ + pending_len_, data, take);
        pending_len_ += take;
        data += take;
        len -= take;
        if (pending_len_ == sizeof(pending_)) {
            compress(pending_);
            pending_len_ = 0;
        }
    }
}

void SHA256::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void SHA256::update_field(const std::string& s) {
    update(s);
    const uint8_t sep = 0x1f;
    update(&sep, 1);
}

SHA256::Digest SHA256::finalize() {
    uint64_t bits = length_ * 8;

    pending_[pending_len_++] = 0x80;
    if (pending_len_ > 56) {
        std::memset(pending_ + pending_len_, 0, 64 - pending_len_);
        compress(pending_);
        pending_len_ = 0;
    }
    std::memset(pending_ + pending_len_, 0, 56 - pending_len_);
    for (int i = 0; i < 8; ++i) {
        pending_[56 + i] = static_cast<uint8_t>(bits >> (56 - 8 * i));
    }
    compress(pending_);

    Digest out;
    for (int i = 0; i < 8; ++i) {
        out[i * 4]     = static_cast<uint8_t>(h_[i] >> 24);
        out[i * 4 + 1] = static_cast<uint8_t>(h_[i] >> 16);
        out[i * 4 + 2] = static_cast<uint8_t>(h_[i] >> 8);
        out[i * 4 + 3] = static_cast<uint8_t>(h_[i]);
    }
    return out;
}

std::string SHA256::hex(const Digest& d) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(64);
    for (uint8_t b : d) {
        out += digits[b >> 4];
        out += digits[b & 0x0f];
    }
    return out;
}

std::string SHA256::hash_hex(const std::string& input) {
    SHA256 ctx;
    ctx.update(input);
    return hex(ctx.finalize());
}

Result<std::string> SHA256::hash_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return PmatError::io("cannot open file for hashing: " + path.string());
    }

    SHA256 ctx;
    char buf[8192];
    while (in.read(buf, sizeof(buf)) || in.gcount() > 0) {
        ctx.update(reinterpret_cast<const uint8_t*>(buf),
                   static_cast<size_t>(in.gcount()));
    }
    return Result<std::string>::ok(hex(ctx.finalize()));
}

} // namespace pmat

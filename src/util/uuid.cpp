#include <pmat/uuid.hpp>
#include <fstream>
#include <mutex>
#include <random>

namespace pmat {

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    static std::mutex mu;
    static std::mt19937_64 gen{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mu);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(gen() & 0xFF);
    }
}

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), u.bytes.size());
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;  // version 4
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant
    return u;
}

std::string Uuid::to_string() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

} // namespace pmat

#include "utils/crypto.hpp"
#include <openssl/rand.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace lumen {
namespace crypto {

std::string hex_encode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    for (uint8_t b : data) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return ss.str();
}

std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

std::string random_hex(size_t bytes) {
    return hex_encode(random_bytes(bytes));
}

std::string uuid_v4() {
    auto b = random_bytes(16);
    b[6] = static_cast<uint8_t>((b[6] & 0x0F) | 0x40);  // Version 4
    b[8] = static_cast<uint8_t>((b[8] & 0x3F) | 0x80);  // Variant

    std::string hex = hex_encode(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace crypto
} // namespace lumen

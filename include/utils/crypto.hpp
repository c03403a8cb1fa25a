#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace lumen {
namespace crypto {

/**
 * Hex encoding.
 */
std::string hex_encode(const std::vector<uint8_t>& data);

/**
 * Generate random bytes from the OpenSSL CSPRNG.
 * Throws std::runtime_error if the generator is not seeded.
 */
std::vector<uint8_t> random_bytes(size_t count);

/**
 * Generate random lowercase hex string of 2 * bytes characters.
 */
std::string random_hex(size_t bytes);

/**
 * RFC 4122 version 4 UUID, e.g. "3f2b8c1e-9d4a-4f6b-8e21-0c5d7a9b1e42".
 */
std::string uuid_v4();

} // namespace crypto
} // namespace lumen

#pragma once

// ============================================================
// crypto.hpp -- OpenSSL wrappers: SHA-256, randomness, base64
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

namespace crypto {

// Lowercase hex SHA-256 of the given bytes. Throws std::runtime_error.
std::string sha256_hex(const std::string& data);

// n bytes from the OpenSSL CSPRNG. Throws std::runtime_error.
std::vector<u8> random_bytes(size_t n);

// Standard base64 with padding
std::string base64_encode(const std::vector<u8>& data);

// Constant-time comparison; length mismatch returns false immediately
bool equal_ct(const std::string& a, const std::string& b);

} // namespace crypto

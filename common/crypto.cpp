// ============================================================
// crypto.cpp -- OpenSSL wrappers
// ============================================================

#include "crypto.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace crypto {

std::string sha256_hex(const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[(digest[i] >> 4) & 0xF];
        out += hex[digest[i] & 0xF];
    }
    return out;
}

std::vector<u8> random_bytes(size_t n) {
    std::vector<u8> buf(n);
    if (n > 0 && RAND_bytes(buf.data(), (int)n) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return buf;
}

std::string base64_encode(const std::vector<u8>& data) {
    if (data.empty()) return "";
    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock appends
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            data.data(), (int)data.size());
    out.resize((size_t)n);
    return out;
}

bool equal_ct(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace crypto

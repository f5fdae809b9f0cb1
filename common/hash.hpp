#pragma once

// ============================================================
// hash.hpp -- CRC32 for ZIP entries, xxHash3 for HTTP validators
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <string>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// ---- CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320) ----

inline const std::array<u32, 256>& crc32_table() {
    static const std::array<u32, 256> table = [] {
        std::array<u32, 256> t{};
        for (u32 i = 0; i < 256; ++i) {
            u32 c = i;
            for (int j = 0; j < 8; ++j) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();
    return table;
}

// Continue a CRC over another block. Start with crc = 0.
inline u32 crc32_update(u32 crc, const void* data, size_t len) {
    const auto& table = crc32_table();
    const u8* p = static_cast<const u8*>(data);
    u32 c = crc ^ 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        c = table[(c ^ p[i]) & 0xFF] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

inline u32 crc32(const void* data, size_t len) {
    return crc32_update(0, data, len);
}

// ---- xxHash3 ----

inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

inline std::string to_hex64(u64 v) {
    static const char* digits = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[(size_t)i] = digits[v & 0xF];
        v >>= 4;
    }
    return out;
}

// Validator for a file's identity: changes when the name, size or
// modification time changes. Content is not read.
inline std::string file_etag(const std::string& name, u64 size, u64 mtime_ns) {
    std::string key = name;
    key.push_back('\0');
    key.append(reinterpret_cast<const char*>(&size), sizeof(size));
    key.append(reinterpret_cast<const char*>(&mtime_ns), sizeof(mtime_ns));
    return "\"" + to_hex64(xxh3_64(key.data(), key.size())) + "\"";
}

} // namespace hash

#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <ifaddrs.h>
#include <net/if.h>

namespace utils {

// Monotonic milliseconds, for throttling and speed sampling
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << (double)bytes / 1024.0 << " KB";
    } else if (bytes < 1024ULL * 1024 * 1024) {
        ss << (double)bytes / (1024.0 * 1024) << " MB";
    } else {
        ss << (double)bytes / (1024.0 * 1024 * 1024) << " GB";
    }
    return ss.str();
}

// Size as shown on the listing page: always MB with one decimal
inline std::string format_mb(u64 bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << (double)bytes / (1024.0 * 1024) << " MB";
    return ss.str();
}

// Format speed given in MiB/s as "X.XX MB/s"
inline std::string format_mbps(double mbps) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << mbps << " MB/s";
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    in_addr tmp{};
    return inet_pton(AF_INET, ip.c_str(), &tmp) == 1;
}

// Port 0 is allowed where an ephemeral port is wanted
inline bool validate_port(int port, bool allow_zero = false) {
    return (allow_zero ? port >= 0 : port >= 1) && port <= 65535;
}

// Validate that a path is non-empty and doesn't contain null bytes
inline bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (c == '\0') return false;
    }
    return true;
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

inline bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return to_lower(s.substr(s.size() - suffix.size())) == to_lower(suffix);
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// Strict decimal parse: digits only, no sign, no overflow.
inline bool parse_u64(const std::string& s, u64& out) {
    if (s.empty() || s.size() > 20) return false;
    u64 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        u64 d = (u64)(c - '0');
        if (v > (UINT64_MAX - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

// First IPv4 address that is up, not loopback and not 0.0.0.0.
// Returns "" if none exists.
inline std::string first_lan_ipv4() {
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) return "";

    std::string found;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;

        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        if (sin->sin_addr.s_addr == htonl(INADDR_ANY)) continue;

        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            found = buf;
            break;
        }
    }
    freeifaddrs(list);
    return found;
}

} // namespace utils

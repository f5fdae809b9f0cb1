#pragma once

// ============================================================
// auth_manager.hpp -- Password check and session token
//
// Built once from the plaintext password, which is not kept.
// Holds a salted SHA-256 of it and one current access token.
// Thread-safe: connection threads validate concurrently while
// refresh_token() may rotate the token.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <mutex>

class AuthManager {
public:
    // Throws std::runtime_error if the random source or digest fails
    explicit AuthManager(const std::string& password);

    AuthManager(const AuthManager&) = delete;
    AuthManager& operator=(const AuthManager&) = delete;

    bool validate_password(const std::string& candidate) const;
    bool validate_token(const std::string& candidate) const;

    // Replace the token; the previous one stops validating immediately
    void refresh_token();

    std::string token() const;

private:
    std::string hash_with_salt(const std::string& password) const;
    static std::string generate_token();

    std::string salt_b64_;
    std::string password_hash_;   // lowercase hex

    mutable std::mutex token_mutex_;
    std::string token_;
};

// ============================================================
// auth_manager.cpp -- Password hashing and token issuance
// ============================================================

#include "auth_manager.hpp"
#include "../common/crypto.hpp"

static constexpr size_t SALT_BYTES  = 16;
static constexpr size_t TOKEN_BYTES = 32;

AuthManager::AuthManager(const std::string& password)
    : salt_b64_(crypto::base64_encode(crypto::random_bytes(SALT_BYTES)))
{
    password_hash_ = hash_with_salt(password);
    token_         = generate_token();
}

std::string AuthManager::hash_with_salt(const std::string& password) const {
    return crypto::sha256_hex(salt_b64_ + ":" + password);
}

// base64 of 32 random bytes, restricted to [A-Za-z0-9_-] so the token can
// travel in a query string unescaped
std::string AuthManager::generate_token() {
    std::string raw = crypto::base64_encode(crypto::random_bytes(TOKEN_BYTES));
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        bool keep = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (keep) out += c;
    }
    return out;
}

bool AuthManager::validate_password(const std::string& candidate) const {
    return crypto::equal_ct(hash_with_salt(candidate), password_hash_);
}

bool AuthManager::validate_token(const std::string& candidate) const {
    if (candidate.empty()) return false;
    std::lock_guard<std::mutex> lk(token_mutex_);
    return crypto::equal_ct(candidate, token_);
}

void AuthManager::refresh_token() {
    std::string fresh = generate_token();
    std::lock_guard<std::mutex> lk(token_mutex_);
    token_ = std::move(fresh);
}

std::string AuthManager::token() const {
    std::lock_guard<std::mutex> lk(token_mutex_);
    return token_;
}

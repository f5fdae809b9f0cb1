// ============================================================
// test_auth_manager.cpp -- Password and token validation
// ============================================================

#include "../server/auth_manager.hpp"
#include <gtest/gtest.h>
#include <set>

TEST(AuthManager, ExactPasswordValidates) {
    AuthManager auth("p@ss1");
    EXPECT_TRUE(auth.validate_password("p@ss1"));
}

TEST(AuthManager, SingleCharacterMutationsFail) {
    const std::string pw = "p@ss1";
    AuthManager auth(pw);

    for (size_t i = 0; i < pw.size(); ++i) {
        std::string changed = pw;
        changed[i] = (char)(changed[i] + 1);
        EXPECT_FALSE(auth.validate_password(changed)) << changed;

        std::string removed = pw;
        removed.erase(i, 1);
        EXPECT_FALSE(auth.validate_password(removed)) << removed;

        std::string inserted = pw;
        inserted.insert(i, 1, 'x');
        EXPECT_FALSE(auth.validate_password(inserted)) << inserted;
    }
    EXPECT_FALSE(auth.validate_password(pw + "x"));
    EXPECT_FALSE(auth.validate_password("P@ss1"));
    EXPECT_FALSE(auth.validate_password(""));
}

TEST(AuthManager, TokenIsUrlSafeAndValidates) {
    AuthManager auth("secret");
    std::string token = auth.token();
    ASSERT_FALSE(token.empty());
    for (char c : token) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '-' || c == '_';
        EXPECT_TRUE(ok) << "unexpected character '" << c << "'";
    }
    EXPECT_TRUE(auth.validate_token(token));
    EXPECT_FALSE(auth.validate_token(""));
    EXPECT_FALSE(auth.validate_token(token + "a"));
    EXPECT_FALSE(auth.validate_token(token.substr(1)));
}

TEST(AuthManager, RefreshInvalidatesPreviousToken) {
    AuthManager auth("secret");
    std::string before = auth.token();
    auth.refresh_token();
    std::string after = auth.token();

    EXPECT_NE(before, after);
    EXPECT_FALSE(auth.validate_token(before));
    EXPECT_TRUE(auth.validate_token(after));
}

TEST(AuthManager, InstancesDoNotShareTokens) {
    std::set<std::string> tokens;
    for (int i = 0; i < 20; ++i) {
        AuthManager auth("same");
        EXPECT_TRUE(tokens.insert(auth.token()).second);
    }
    AuthManager a("same");
    AuthManager b("same");
    EXPECT_FALSE(a.validate_token(b.token()));
}

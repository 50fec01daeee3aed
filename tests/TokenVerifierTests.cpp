#include "core/TokenVerifier.h"

#include <gtest/gtest.h>

using namespace facilitator::core;

TEST(TokenVerifier, AcceptAnyRejectsOnlyEmpty) {
    AcceptAnyVerifier v;
    EXPECT_TRUE(v.verify("anything"));
    EXPECT_FALSE(v.verify(""));
}

TEST(TokenVerifier, StaticAllowList) {
    StaticTokenVerifier v({"alpha", "beta"});
    EXPECT_TRUE(v.verify("alpha"));
    EXPECT_TRUE(v.verify("beta"));
    EXPECT_FALSE(v.verify("gamma"));
    EXPECT_FALSE(v.verify(""));
}

TEST(TokenVerifier, HmacAcceptsSignedTokens) {
    HmacTokenVerifier v("s3cret");
    const auto token = v.sign("user-42");

    EXPECT_EQ(token.substr(token.find('.') + 1), "user-42");
    EXPECT_TRUE(v.verify(token));
}

TEST(TokenVerifier, HmacRejectsTamperedOrForeignTokens) {
    HmacTokenVerifier v("s3cret");
    HmacTokenVerifier other("different");

    auto token = v.sign("user-42");
    EXPECT_FALSE(v.verify(other.sign("user-42")));

    auto tampered = token;
    tampered.back() = '3';
    EXPECT_FALSE(v.verify(tampered));

    EXPECT_FALSE(v.verify("user-42"));
    EXPECT_FALSE(v.verify(".user-42"));
    EXPECT_FALSE(v.verify(token.substr(0, token.find('.') + 1)));
}

TEST(TokenVerifier, HmacNeedsASecret) {
    EXPECT_THROW(HmacTokenVerifier(""), std::invalid_argument);
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_token.cpp
// Purpose: Startup session token gate
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcpstdio/auth/SessionToken.hpp"

using namespace mcpstdio::auth;

TEST(SessionToken, AcceptsMatchingToken) {
    StaticTokenVerifier v("s3cret");
    auto r = CheckSessionToken(std::string("s3cret"), v);
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.errorMessage.empty());
}

TEST(SessionToken, StripsBearerPrefixAndWhitespace) {
    StaticTokenVerifier v("s3cret");
    EXPECT_TRUE(CheckSessionToken(std::string("Bearer s3cret"), v).ok);
    EXPECT_TRUE(CheckSessionToken(std::string("bearer   s3cret \n"), v).ok);
}

TEST(SessionToken, RejectsMissingEmptyAndWrongTokens) {
    StaticTokenVerifier v("s3cret");
    auto missing = CheckSessionToken(std::nullopt, v);
    EXPECT_FALSE(missing.ok);
    EXPECT_EQ(missing.errorMessage, "missing session token");

    auto empty = CheckSessionToken(std::string("Bearer "), v);
    EXPECT_FALSE(empty.ok);
    EXPECT_EQ(empty.errorMessage, "empty session token");

    auto wrong = CheckSessionToken(std::string("s3cre"), v);
    EXPECT_FALSE(wrong.ok);
    EXPECT_EQ(wrong.errorMessage, "session token mismatch");
    EXPECT_EQ(wrong.errorMessage.find("s3cre"), std::string::npos);

    EXPECT_FALSE(CheckSessionToken(std::string("s3cret-and-more"), v).ok);
}

TEST(SessionToken, VerifierWithoutExpectedTokenRejectsEverything) {
    StaticTokenVerifier v("");
    auto r = CheckSessionToken(std::string("anything"), v);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.errorMessage, "no session token configured");
}

namespace {
class RecordingVerifier : public ITokenVerifier {
public:
    std::string seen;
    bool Verify(const std::string& token, std::string& errorMessage) override {
        seen = token;
        errorMessage.clear();
        return false;
    }
};
} // namespace

TEST(SessionToken, CustomVerifierSeesNormalizedToken) {
    RecordingVerifier v;
    auto r = CheckSessionToken(std::string("  Bearer abc  "), v);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(v.seen, "abc");
    EXPECT_EQ(r.errorMessage, "session token rejected");
}

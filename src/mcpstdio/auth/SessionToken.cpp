//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpstdio/auth/SessionToken.cpp
// Purpose: Session token gate implementation
//==========================================================================================================

#include <cctype>
#include <string>

#include "mcpstdio/auth/SessionToken.hpp"
#include "logging/Logger.h"

namespace mcpstdio::auth {

namespace {
    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    static bool startsWithBearer(const std::string& s) {
        const std::string pfx = "Bearer ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    static std::string trim(const std::string& s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
            ++b;
        }
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
            --e;
        }
        return s.substr(b, e - b);
    }

    static bool constantTimeEqual(const std::string& a, const std::string& b) {
        unsigned char diff = static_cast<unsigned char>(a.size() != b.size());
        const size_t n = a.size() > b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            unsigned char ca = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
            unsigned char cb = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
            diff |= static_cast<unsigned char>(ca ^ cb);
        }
        return diff == 0;
    }
}

StaticTokenVerifier::StaticTokenVerifier(std::string expected) : expected(std::move(expected)) {}

bool StaticTokenVerifier::Verify(const std::string& token, std::string& errorMessage) {
    if (expected.empty()) {
        errorMessage = "no session token configured";
        return false;
    }
    if (!constantTimeEqual(token, expected)) {
        errorMessage = "session token mismatch";
        return false;
    }
    return true;
}

SessionTokenCheckResult CheckSessionToken(const std::optional<std::string>& presented, ITokenVerifier& verifier) {
    SessionTokenCheckResult r;
    if (!presented.has_value()) {
        r.ok = false;
        r.errorMessage = "missing session token";
        return r;
    }
    std::string token = trim(presented.value());
    if (startsWithBearer(token)) {
        token = trim(token.substr(7));
    }
    if (token.empty()) {
        r.ok = false;
        r.errorMessage = "empty session token";
        return r;
    }
    std::string err;
    if (!verifier.Verify(token, err)) {
        r.ok = false;
        r.errorMessage = err.empty() ? std::string("session token rejected") : err;
        LOG_DEBUG("Session token rejected: {}", r.errorMessage);
        return r;
    }
    r.ok = true;
    return r;
}

} // namespace mcpstdio::auth

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionToken.hpp
// Purpose: Optional startup gate requiring the launching process to present a shared session token
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace mcpstdio::auth {

//==========================================================================================================
// ITokenVerifier
// Purpose: Interface to validate a presented session token.
// Returns: true on success; false on failure (set errorMessage).
//==========================================================================================================
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;
    virtual bool Verify(const std::string& token, std::string& errorMessage) = 0;
};

//==========================================================================================================
// StaticTokenVerifier
// Purpose: Accepts exactly one configured token. Comparison time does not depend on where the
//          first mismatching byte is.
//==========================================================================================================
class StaticTokenVerifier : public ITokenVerifier {
public:
    explicit StaticTokenVerifier(std::string expected);
    bool Verify(const std::string& token, std::string& errorMessage) override;

private:
    std::string expected;
};

//==========================================================================================================
// SessionTokenCheckResult
// Fields:
//   ok: True if the token was accepted.
//   errorMessage: Reason for rejection, suitable for logging (never contains the token).
//==========================================================================================================
struct SessionTokenCheckResult {
    bool ok{false};
    std::string errorMessage;
};

//==========================================================================================================
// CheckSessionToken
// Purpose: Validate the presented token (typically from MCPSTDIO_SESSION_TOKEN).
// Args:
//   presented: Token text; an optional "Bearer " prefix (any case) is stripped. Empty optional when unset.
//   verifier: Token verifier.
// Returns:
//   SessionTokenCheckResult indicating success or failure details.
//==========================================================================================================
SessionTokenCheckResult CheckSessionToken(const std::optional<std::string>& presented, ITokenVerifier& verifier);

} // namespace mcpstdio::auth

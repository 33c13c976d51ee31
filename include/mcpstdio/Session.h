//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.h
// Purpose: Handshake state machine for the one session a server process serves
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpstdio/Protocol.h"

namespace mcpstdio {

enum class SessionState {
    Uninitialized,
    Initialized,
    Closed
};

const char* toString(SessionState state);

//==========================================================================================================
// Session
// Purpose: Tracks handshake progress and what was negotiated.
// Transitions:
//   Uninitialized -> Initialized  on a successful Initialize().
//   any           -> Closed       on Close() (end of stream or fatal I/O).
// Notes:
//   Only the dispatch thread touches a Session; it is not synchronized.
//==========================================================================================================
class Session {
public:
    Session(Implementation serverInfo, ServerCapabilities capabilities,
            std::optional<std::string> instructions = std::nullopt);

    //==========================================================================================================
    // Initialize
    // Purpose: Handle the initialize request.
    // Args:
    //   params: Request params (may be absent).
    // Returns:
    //   The initialize result object: protocolVersion, capabilities, serverInfo, instructions?.
    // Throws:
    //   errors::McpException InvalidRequest when not Uninitialized (state unchanged);
    //   errors::McpException InvalidParams when protocolVersion is missing or a field has the wrong type.
    //==========================================================================================================
    JSONValue Initialize(const std::optional<JSONValue>& params);

    // notifications/initialized: records the acknowledgement; ignored unless Initialized.
    void MarkClientInitialized();

    void Close();

    SessionState State() const { return state; }
    bool IsInitialized() const { return state == SessionState::Initialized; }
    bool ClientAcknowledged() const { return clientAcknowledged; }

    const std::string& NegotiatedProtocolVersion() const { return negotiatedVersion; }
    const std::optional<Implementation>& PeerInfo() const { return peerInfo; }
    const ClientCapabilities& PeerCapabilities() const { return clientCapabilities; }
    const Implementation& ServerInfo() const { return serverInfo; }
    const ServerCapabilities& Capabilities() const { return capabilities; }

private:
    Implementation serverInfo;
    ServerCapabilities capabilities;
    std::optional<std::string> instructions;

    SessionState state{SessionState::Uninitialized};
    bool clientAcknowledged{false};
    std::string negotiatedVersion;
    std::optional<Implementation> peerInfo;
    ClientCapabilities clientCapabilities;
};

// Serializes capabilities as advertised in the initialize result.
JSONValue serializeServerCapabilities(const ServerCapabilities& caps);

} // namespace mcpstdio

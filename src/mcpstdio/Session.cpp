//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: Session state machine and initialize handshake
//==========================================================================================================

#include "mcpstdio/Session.h"
#include "mcpstdio/errors/Errors.h"
#include "logging/Logger.h"

namespace mcpstdio {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initialized: return "Initialized";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

JSONValue serializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools.has_value()) {
        JSONValue::Object t;
        t["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(std::move(t));
    }
    if (caps.resources.has_value()) {
        JSONValue::Object r;
        r["subscribe"] = std::make_shared<JSONValue>(caps.resources->subscribe);
        r["listChanged"] = std::make_shared<JSONValue>(caps.resources->listChanged);
        obj["resources"] = std::make_shared<JSONValue>(std::move(r));
    }
    if (caps.prompts.has_value()) {
        JSONValue::Object p;
        p["listChanged"] = std::make_shared<JSONValue>(caps.prompts->listChanged);
        obj["prompts"] = std::make_shared<JSONValue>(std::move(p));
    }
    return JSONValue{std::move(obj)};
}

Session::Session(Implementation serverInfo, ServerCapabilities capabilities,
                 std::optional<std::string> instructions)
    : serverInfo(std::move(serverInfo)), capabilities(std::move(capabilities)),
      instructions(std::move(instructions)) {}

JSONValue Session::Initialize(const std::optional<JSONValue>& params) {
    FUNC_SCOPE();
    if (state == SessionState::Initialized) {
        throw errors::McpException(errors::invalidRequest("session is already initialized"));
    }
    if (state == SessionState::Closed) {
        throw errors::McpException(errors::invalidRequest("session is closed"));
    }
    if (!params.has_value() || !std::holds_alternative<JSONValue::Object>(params->value)) {
        throw errors::McpException(errors::invalidParams("", "initialize params must be an object"));
    }
    const auto& obj = std::get<JSONValue::Object>(params->value);

    auto itVer = obj.find("protocolVersion");
    if (itVer == obj.end() || !itVer->second) {
        throw errors::McpException(errors::invalidParams("protocolVersion", "is required"));
    }
    if (!std::holds_alternative<std::string>(itVer->second->value)) {
        throw errors::McpException(errors::invalidParams("protocolVersion", "must be a string"));
    }
    const std::string& requested = std::get<std::string>(itVer->second->value);

    ClientCapabilities caps;
    auto itCaps = obj.find("capabilities");
    if (itCaps != obj.end() && itCaps->second) {
        if (!std::holds_alternative<JSONValue::Object>(itCaps->second->value)) {
            throw errors::McpException(errors::invalidParams("capabilities", "must be an object"));
        }
        caps.raw = *itCaps->second;
    }

    std::optional<Implementation> peer;
    auto itInfo = obj.find("clientInfo");
    if (itInfo != obj.end() && itInfo->second) {
        if (!std::holds_alternative<JSONValue::Object>(itInfo->second->value)) {
            throw errors::McpException(errors::invalidParams("clientInfo", "must be an object"));
        }
        const auto& info = std::get<JSONValue::Object>(itInfo->second->value);
        Implementation impl;
        auto itName = info.find("name");
        if (itName != info.end() && itName->second) {
            if (!std::holds_alternative<std::string>(itName->second->value)) {
                throw errors::McpException(errors::invalidParams("clientInfo.name", "must be a string"));
            }
            impl.name = std::get<std::string>(itName->second->value);
        }
        auto itVersion = info.find("version");
        if (itVersion != info.end() && itVersion->second) {
            if (!std::holds_alternative<std::string>(itVersion->second->value)) {
                throw errors::McpException(errors::invalidParams("clientInfo.version", "must be a string"));
            }
            impl.version = std::get<std::string>(itVersion->second->value);
        }
        peer = std::move(impl);
    }

    // Echo a supported version, otherwise offer our newest and let the client decide.
    negotiatedVersion = isSupportedProtocolVersion(requested) ? requested : std::string(PROTOCOL_VERSION);
    if (negotiatedVersion != requested) {
        LOG_WARN("Client requested unsupported protocol version '{}'; offering '{}'", requested, negotiatedVersion);
    }
    peerInfo = std::move(peer);
    clientCapabilities = std::move(caps);
    state = SessionState::Initialized;
    LOG_INFO("Session initialized: client='{}' version='{}' protocol={}",
             peerInfo ? peerInfo->name : std::string("<unnamed>"),
             peerInfo ? peerInfo->version : std::string(""), negotiatedVersion);

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(negotiatedVersion);
    result["capabilities"] = std::make_shared<JSONValue>(serializeServerCapabilities(capabilities));
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(serverInfo.name);
    info["version"] = std::make_shared<JSONValue>(serverInfo.version);
    result["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
    if (instructions.has_value()) {
        result["instructions"] = std::make_shared<JSONValue>(instructions.value());
    }
    return JSONValue{std::move(result)};
}

void Session::MarkClientInitialized() {
    if (state != SessionState::Initialized) {
        LOG_WARN("Ignoring initialized notification in state {}", toString(state));
        return;
    }
    clientAcknowledged = true;
    LOG_DEBUG("Client acknowledged initialization");
}

void Session::Close() {
    if (state != SessionState::Closed) {
        LOG_INFO("Session closed (was {})", toString(state));
    }
    state = SessionState::Closed;
}

} // namespace mcpstdio

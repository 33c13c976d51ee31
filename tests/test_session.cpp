//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session.cpp
// Purpose: Session handshake state machine and version negotiation
//==========================================================================================================

#include <gtest/gtest.h>

#include <functional>

#include "mcpstdio/Session.h"
#include "mcpstdio/errors/Errors.h"
#include "mcpstdio/typed/Content.h"

using namespace mcpstdio;

namespace {

JSONValue initParams(const std::string& version) {
    JSONValue::Object clientInfo;
    clientInfo["name"] = std::make_shared<JSONValue>(std::string("test-client"));
    clientInfo["version"] = std::make_shared<JSONValue>(std::string("0.1"));
    JSONValue::Object p;
    p["protocolVersion"] = std::make_shared<JSONValue>(version);
    p["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    p["clientInfo"] = std::make_shared<JSONValue>(std::move(clientInfo));
    return JSONValue{p};
}

ServerCapabilities toolsOnly() {
    ServerCapabilities caps;
    caps.tools = ToolsCapability{};
    return caps;
}

int codeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const errors::McpException& e) {
        return e.error().code;
    }
    return 0;
}

} // namespace

TEST(Session, StartsUninitialized) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly());
    EXPECT_EQ(s.State(), SessionState::Uninitialized);
    EXPECT_FALSE(s.IsInitialized());
    EXPECT_STREQ(toString(s.State()), "Uninitialized");
}

TEST(Session, InitializeEchoesSupportedVersion) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly(), std::string("be nice"));
    JSONValue result = s.Initialize(initParams("2025-06-18"));
    EXPECT_EQ(s.State(), SessionState::Initialized);
    EXPECT_EQ(s.NegotiatedProtocolVersion(), "2025-06-18");
    EXPECT_EQ(typed::getStringField(result, "protocolVersion").value_or(""), "2025-06-18");
    EXPECT_EQ(typed::getStringField(result, "instructions").value_or(""), "be nice");

    const auto& o = std::get<JSONValue::Object>(result.value);
    const auto& info = *o.at("serverInfo");
    EXPECT_EQ(typed::getStringField(info, "name").value_or(""), "srv");
    EXPECT_EQ(typed::getStringField(info, "version").value_or(""), "1.0");
    const auto& caps = std::get<JSONValue::Object>(o.at("capabilities")->value);
    EXPECT_EQ(caps.count("tools"), 1u);
    EXPECT_EQ(caps.count("resources"), 0u);
    EXPECT_EQ(caps.count("prompts"), 0u);

    ASSERT_TRUE(s.PeerInfo().has_value());
    EXPECT_EQ(s.PeerInfo()->name, "test-client");
}

TEST(Session, UnsupportedVersionGetsNewestSupported) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly());
    JSONValue result = s.Initialize(initParams("1999-01-01"));
    EXPECT_EQ(typed::getStringField(result, "protocolVersion").value_or(""), std::string(PROTOCOL_VERSION));
    EXPECT_TRUE(s.IsInitialized());
}

TEST(Session, SecondInitializeIsRejectedWithoutStateChange) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly());
    s.Initialize(initParams("2024-11-05"));
    int code = codeOf([&]() { s.Initialize(initParams("2025-06-18")); });
    EXPECT_EQ(code, JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(s.State(), SessionState::Initialized);
    EXPECT_EQ(s.NegotiatedProtocolVersion(), "2024-11-05");
}

TEST(Session, InvalidParamsLeaveSessionUninitialized) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly());
    EXPECT_EQ(codeOf([&]() { s.Initialize(std::nullopt); }), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(codeOf([&]() { s.Initialize(JSONValue{JSONValue::Object{}}); }), JSONRPCErrorCodes::InvalidParams);

    JSONValue::Object badVersion;
    badVersion["protocolVersion"] = std::make_shared<JSONValue>(static_cast<int64_t>(2025));
    EXPECT_EQ(codeOf([&]() { s.Initialize(JSONValue{badVersion}); }), JSONRPCErrorCodes::InvalidParams);

    JSONValue::Object badCaps;
    badCaps["protocolVersion"] = std::make_shared<JSONValue>(std::string("2025-06-18"));
    badCaps["capabilities"] = std::make_shared<JSONValue>(std::string("all"));
    EXPECT_EQ(codeOf([&]() { s.Initialize(JSONValue{badCaps}); }), JSONRPCErrorCodes::InvalidParams);

    EXPECT_EQ(s.State(), SessionState::Uninitialized);
}

TEST(Session, InitializedNotificationOnlyCountsAfterHandshake) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly());
    s.MarkClientInitialized();
    EXPECT_FALSE(s.ClientAcknowledged());
    s.Initialize(initParams("2025-03-26"));
    s.MarkClientInitialized();
    EXPECT_TRUE(s.ClientAcknowledged());
}

TEST(Session, ClosedSessionRefusesInitialize) {
    Session s(Implementation{"srv", "1.0"}, toolsOnly());
    s.Close();
    EXPECT_EQ(s.State(), SessionState::Closed);
    EXPECT_EQ(codeOf([&]() { s.Initialize(initParams("2025-06-18")); }), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(s.State(), SessionState::Closed);
}

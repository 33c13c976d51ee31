//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatcher.cpp
// Purpose: Routing, session preconditions, argument checks, error mapping, timeouts and cancellation
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "mcpstdio/Dispatcher.h"
#include "mcpstdio/errors/Errors.h"
#include "mcpstdio/typed/Content.h"

using namespace mcpstdio;
using namespace std::chrono_literals;

namespace {

struct Counters {
    std::atomic<int> echoCalls{0};
    std::atomic<int> slowCalls{0};
};

JSONValue echoSchema() {
    return parseJSONValue(R"({"type":"object","properties":{"message":{"type":"string"}},"required":["message"]})");
}

std::shared_ptr<const CapabilityRegistries> makeRegistries(std::shared_ptr<Counters> counters) {
    RegistryBuilder b;
    b.RegisterTool(Tool("echo", "Echo a message", echoSchema()),
        [counters](const JSONValue& args, std::stop_token) {
            counters->echoCalls++;
            return typed::makeTextResult(typed::getStringField(args, "message").value_or(""));
        });
    b.RegisterTool(Tool("noschema", "No declared schema"),
        [](const JSONValue&, std::stop_token) { return typed::makeTextResult("fine"); });
    b.RegisterTool(Tool("domain-fail", "Fails with a business error"),
        [](const JSONValue&, std::stop_token) -> CallToolResult { throw errors::DomainError("quota exhausted"); });
    b.RegisterTool(Tool("crash", "Throws something unexpected"),
        [](const JSONValue&, std::stop_token) -> CallToolResult { throw std::runtime_error("null deref in module X"); });
    b.RegisterTool(Tool("slow", "Waits until stopped"),
        [counters](const JSONValue&, std::stop_token st) {
            counters->slowCalls++;
            auto deadline = std::chrono::steady_clock::now() + 5s;
            while (!st.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(5ms);
            }
            return typed::makeTextResult("late");
        });
    b.RegisterResource(Resource("config://app", "Config", std::nullopt, std::string("application/json")),
        [](const std::string& uri, std::stop_token) {
            ReadResourceResult r;
            r.contents.push_back(typed::makeTextResourceContents(uri, std::string("application/json"), "{}"));
            return r;
        });
    b.RegisterResourceTemplate(ResourceTemplate("mem://{key}", "Memory"),
        [](const std::string& uri, std::stop_token) {
            ReadResourceResult r;
            r.contents.push_back(typed::makeTextResourceContents(uri, std::nullopt, "value of " + uri));
            return r;
        });
    b.RegisterPrompt(Prompt("summarize", "Summarize text", {PromptArgument{"text", std::nullopt, true}}),
        [](const JSONValue& args, std::stop_token) {
            GetPromptResult r;
            r.messages.push_back(typed::makePromptMessage("user", "Summarize: " +
                typed::getStringField(args, "text").value_or("")));
            return r;
        });
    return b.Build();
}

class DispatcherTest : public ::testing::Test {
protected:
    std::shared_ptr<Counters> counters = std::make_shared<Counters>();
    std::shared_ptr<const CapabilityRegistries> registries = makeRegistries(counters);
    Session session{Implementation{"test-server", "9.9"}, registries->Advertised()};
    DispatcherOptions options = makeOptions();
    Dispatcher dispatcher{registries, session, options};

    static DispatcherOptions makeOptions() {
        DispatcherOptions o;
        o.handlerTimeout = 200ms;
        return o;
    }

    std::unique_ptr<JSONRPCResponse> call(int64_t id, const std::string& method, const char* params = nullptr) {
        std::optional<JSONValue> p;
        if (params != nullptr) {
            p = parseJSONValue(params);
        }
        return dispatcher.Dispatch(JSONRPCRequest(JSONRPCId{id}, method, std::move(p)));
    }

    void initialize() {
        auto resp = call(0, Methods::Initialize,
                         R"({"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"t","version":"1"}})");
        ASSERT_FALSE(resp->IsError());
        dispatcher.Dispatch(JSONRPCNotification(Methods::Initialized));
    }

    static int errorCode(const JSONRPCResponse& resp) {
        auto err = errors::mcpErrorFromResponse(resp);
        return err ? err->code : 0;
    }

    static std::string errorMessage(const JSONRPCResponse& resp) {
        auto err = errors::mcpErrorFromResponse(resp);
        return err ? err->message : std::string();
    }

    static const JSONValue::Object& resultObject(const JSONRPCResponse& resp) {
        return std::get<JSONValue::Object>(resp.result->value);
    }
};

} // namespace

TEST_F(DispatcherTest, PingWorksBeforeInitialize) {
    auto resp = call(1, Methods::Ping);
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(resp->Serialize(), R"({"jsonrpc":"2.0","id":1,"result":{}})");
}

TEST_F(DispatcherTest, CapabilityMethodsRequireInitialize) {
    for (const char* m : {"tools/list", "tools/call", "resources/list", "resources/read",
                          "resources/templates/list", "prompts/list", "prompts/get", "tools/unknown"}) {
        auto resp = call(2, m, R"({"name":"echo","arguments":{"message":"x"}})");
        EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::NotInitialized) << m;
    }
    EXPECT_EQ(counters->echoCalls.load(), 0);
    EXPECT_EQ(session.State(), SessionState::Uninitialized);
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
    EXPECT_EQ(errorCode(*call(3, "frobnicate")), JSONRPCErrorCodes::MethodNotFound);
    initialize();
    EXPECT_EQ(errorCode(*call(4, "tools/frobnicate")), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(DispatcherTest, InitializeHandshakeAndDuplicate) {
    initialize();
    EXPECT_TRUE(session.IsInitialized());
    EXPECT_TRUE(session.ClientAcknowledged());
    auto again = call(5, Methods::Initialize, R"({"protocolVersion":"2025-06-18"})");
    EXPECT_EQ(errorCode(*again), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(session.IsInitialized());
}

TEST_F(DispatcherTest, ToolsListInRegistrationOrderWithDefaultSchema) {
    initialize();
    auto resp = call(6, Methods::ListTools);
    ASSERT_FALSE(resp->IsError());
    const auto& tools = std::get<JSONValue::Array>(resultObject(*resp).at("tools")->value);
    ASSERT_EQ(tools.size(), 5u);
    EXPECT_EQ(typed::getStringField(*tools[0], "name").value_or(""), "echo");
    EXPECT_EQ(typed::getStringField(*tools[1], "name").value_or(""), "noschema");
    EXPECT_EQ(typed::getStringField(*tools[4], "name").value_or(""), "slow");
    const auto& noschema = std::get<JSONValue::Object>(tools[1]->value);
    EXPECT_EQ(serializeJSONValue(*noschema.at("inputSchema")), R"({"type":"object"})");
}

TEST_F(DispatcherTest, ToolCallSuccess) {
    initialize();
    auto resp = call(7, Methods::CallTool, R"({"name":"echo","arguments":{"message":"hello"}})");
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(serializeJSONValue(resp->result.value()),
              R"({"content":[{"text":"hello","type":"text"}],"isError":false})");
    EXPECT_EQ(counters->echoCalls.load(), 1);
}

TEST_F(DispatcherTest, MissingArgumentNeverReachesHandler) {
    initialize();
    auto resp = call(8, Methods::CallTool, R"({"name":"echo","arguments":{}})");
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);
    auto noArgs = call(9, Methods::CallTool, R"({"name":"echo"})");
    EXPECT_EQ(errorCode(*noArgs), JSONRPCErrorCodes::InvalidParams);
    auto noName = call(10, Methods::CallTool, R"({"arguments":{}})");
    EXPECT_EQ(errorCode(*noName), JSONRPCErrorCodes::InvalidParams);
    auto arrayParams = call(11, Methods::CallTool, R"(["echo"])");
    EXPECT_EQ(errorCode(*arrayParams), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(counters->echoCalls.load(), 0);
}

TEST_F(DispatcherTest, UnknownKeysAreCapabilityNotFound) {
    initialize();
    EXPECT_EQ(errorCode(*call(12, Methods::CallTool, R"({"name":"nope"})")), JSONRPCErrorCodes::CapabilityNotFound);
    EXPECT_EQ(errorCode(*call(13, Methods::ReadResource, R"({"uri":"nope://x"})")), JSONRPCErrorCodes::CapabilityNotFound);
    EXPECT_EQ(errorCode(*call(14, Methods::GetPrompt, R"({"name":"nope"})")), JSONRPCErrorCodes::CapabilityNotFound);
}

TEST_F(DispatcherTest, HandlerFailuresAreMapped) {
    initialize();
    auto domain = call(15, Methods::CallTool, R"({"name":"domain-fail"})");
    EXPECT_EQ(errorCode(*domain), JSONRPCErrorCodes::DomainError);
    EXPECT_EQ(errorMessage(*domain), "quota exhausted");

    auto crash = call(16, Methods::CallTool, R"({"name":"crash"})");
    EXPECT_EQ(errorCode(*crash), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*crash), "Internal error");
    EXPECT_EQ(crash->Serialize().find("null deref"), std::string::npos);

    // Session survives both
    EXPECT_FALSE(call(17, Methods::Ping)->IsError());
    EXPECT_TRUE(session.IsInitialized());
}

TEST_F(DispatcherTest, ResourcesExactAndTemplate) {
    initialize();
    auto list = call(18, Methods::ListResources);
    const auto& resources = std::get<JSONValue::Array>(resultObject(*list).at("resources")->value);
    ASSERT_EQ(resources.size(), 1u);
    EXPECT_EQ(typed::getStringField(*resources[0], "uri").value_or(""), "config://app");

    auto templates = call(19, Methods::ListResourceTemplates);
    const auto& tl = std::get<JSONValue::Array>(resultObject(*templates).at("resourceTemplates")->value);
    ASSERT_EQ(tl.size(), 1u);
    EXPECT_EQ(typed::getStringField(*tl[0], "uriTemplate").value_or(""), "mem://{key}");

    auto exact = call(20, Methods::ReadResource, R"({"uri":"config://app"})");
    ASSERT_FALSE(exact->IsError());
    const auto& contents = std::get<JSONValue::Array>(resultObject(*exact).at("contents")->value);
    EXPECT_EQ(typed::getStringField(*contents[0], "mimeType").value_or(""), "application/json");

    auto templated = call(21, Methods::ReadResource, R"({"uri":"mem://alpha"})");
    ASSERT_FALSE(templated->IsError());
    const auto& tc = std::get<JSONValue::Array>(resultObject(*templated).at("contents")->value);
    EXPECT_EQ(typed::getStringField(*tc[0], "text").value_or(""), "value of mem://alpha");
}

TEST_F(DispatcherTest, PromptsGetValidatesAndFallsBackToDescriptorDescription) {
    initialize();
    auto list = call(22, Methods::ListPrompts);
    const auto& prompts = std::get<JSONValue::Array>(resultObject(*list).at("prompts")->value);
    ASSERT_EQ(prompts.size(), 1u);

    auto missing = call(23, Methods::GetPrompt, R"({"name":"summarize","arguments":{}})");
    EXPECT_EQ(errorCode(*missing), JSONRPCErrorCodes::InvalidParams);

    auto ok = call(24, Methods::GetPrompt, R"({"name":"summarize","arguments":{"text":"abc"}})");
    ASSERT_FALSE(ok->IsError());
    EXPECT_EQ(typed::getStringField(ok->result.value(), "description").value_or(""), "Summarize text");
    const auto& msgs = std::get<JSONValue::Array>(resultObject(*ok).at("messages")->value);
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(typed::getStringField(*msgs[0], "role").value_or(""), "user");
}

TEST_F(DispatcherTest, TimeoutBecomesInternalErrorAndSessionContinues) {
    initialize();
    auto begin = std::chrono::steady_clock::now();
    auto resp = call(25, Methods::CallTool, R"({"name":"slow"})");
    auto elapsed = std::chrono::steady_clock::now() - begin;
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*resp), "Request timed out");
    EXPECT_LT(elapsed, 3s);

    auto next = call(26, Methods::CallTool, R"({"name":"echo","arguments":{"message":"still here"}})");
    EXPECT_FALSE(next->IsError());
}

TEST_F(DispatcherTest, OversizedTimeoutIsClampedNotImmediate) {
    DispatcherOptions huge;
    huge.handlerTimeout = std::chrono::milliseconds(10000000000000LL);
    Session s{Implementation{"srv", "1"}, registries->Advertised()};
    Dispatcher d{registries, s, huge};
    d.Dispatch(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(1)}, Methods::Initialize,
                              parseJSONValue(R"({"protocolVersion":"2025-06-18"})")));
    auto resp = d.Dispatch(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(2)}, Methods::CallTool,
                                          parseJSONValue(R"({"name":"echo","arguments":{"message":"hi"}})")));
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(counters->echoCalls.load(), 1);
}

TEST_F(DispatcherTest, CancelBeforeDispatchSkipsHandler) {
    initialize();
    dispatcher.Cancel(JSONRPCId{static_cast<int64_t>(27)});
    auto resp = call(27, Methods::CallTool, R"({"name":"echo","arguments":{"message":"x"}})");
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errorMessage(*resp), "Request cancelled");
    EXPECT_EQ(counters->echoCalls.load(), 0);

    // The pending cancellation is consumed once
    auto again = call(27, Methods::CallTool, R"({"name":"echo","arguments":{"message":"x"}})");
    EXPECT_FALSE(again->IsError());
}

TEST_F(DispatcherTest, CancelledNotificationRecordsPendingCancellation) {
    initialize();
    dispatcher.Dispatch(JSONRPCNotification(Methods::Cancelled, parseJSONValue(R"({"requestId":"job-1","reason":"user"})")));
    auto resp = dispatcher.Dispatch(JSONRPCRequest(JSONRPCId{std::string("job-1")}, Methods::CallTool,
                                                   parseJSONValue(R"({"name":"echo","arguments":{"message":"x"}})")));
    EXPECT_EQ(errorMessage(*resp), "Request cancelled");
    EXPECT_EQ(counters->echoCalls.load(), 0);
}

TEST_F(DispatcherTest, CancelForAnsweredRequestIsIgnored) {
    initialize();
    ASSERT_FALSE(call(28, Methods::Ping)->IsError());
    dispatcher.Cancel(JSONRPCId{static_cast<int64_t>(28)});
    EXPECT_FALSE(call(28, Methods::Ping)->IsError());
}

TEST_F(DispatcherTest, CancelInFlightHandler) {
    DispatcherOptions longWait;
    longWait.handlerTimeout = 10s;
    Session s{Implementation{"srv", "1"}, registries->Advertised()};
    Dispatcher d{registries, s, longWait};
    d.Dispatch(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(1)}, Methods::Initialize,
                              parseJSONValue(R"({"protocolVersion":"2025-06-18"})")));

    std::thread canceller([&d, this]() {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (counters->slowCalls.load() == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(2ms);
        }
        d.Cancel(JSONRPCId{static_cast<int64_t>(2)});
    });
    auto begin = std::chrono::steady_clock::now();
    auto resp = d.Dispatch(JSONRPCRequest(JSONRPCId{static_cast<int64_t>(2)}, Methods::CallTool,
                                          parseJSONValue(R"({"name":"slow"})")));
    auto elapsed = std::chrono::steady_clock::now() - begin;
    canceller.join();
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InternalError);
    EXPECT_LT(elapsed, 5s);
}

TEST_F(DispatcherTest, UnknownNotificationsAreIgnored) {
    dispatcher.Dispatch(JSONRPCNotification("notifications/whatever"));
    dispatcher.Dispatch(JSONRPCNotification(Methods::Cancelled));
    EXPECT_EQ(session.State(), SessionState::Uninitialized);
}

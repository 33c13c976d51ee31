//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: Strict JSON parsing and deterministic serialization
//==========================================================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

#include "mcpstdio/JSONRPCTypes.h"

using namespace mcpstdio;

TEST(JSONParser, ParsesNestedDocument) {
    JSONValue v = parseJSONValue(R"( {"a": [1, 2.5, "x", true, null], "b": {"c": -7}} )");
    ASSERT_TRUE(std::holds_alternative<JSONValue::Object>(v.value));
    const auto& o = std::get<JSONValue::Object>(v.value);
    const auto& a = std::get<JSONValue::Array>(o.at("a")->value);
    ASSERT_EQ(a.size(), 5u);
    EXPECT_EQ(std::get<int64_t>(a[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>(a[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>(a[2]->value), "x");
    EXPECT_TRUE(std::get<bool>(a[3]->value));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(a[4]->value));
    const auto& b = std::get<JSONValue::Object>(o.at("b")->value);
    EXPECT_EQ(std::get<int64_t>(b.at("c")->value), -7);
}

TEST(JSONParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = parseJSONValue(R"("tab\tnl\n\u00e9\ud83d\ude00\/")");
    EXPECT_EQ(std::get<std::string>(v.value), "tab\tnl\n\xC3\xA9\xF0\x9F\x98\x80/");
}

TEST(JSONParser, IntegersOutsideInt64BecomeDoubles) {
    JSONValue v = parseJSONValue("123456789012345678901234567890");
    ASSERT_TRUE(std::holds_alternative<double>(v.value));
    EXPECT_GT(std::get<double>(v.value), 1e29);
}

TEST(JSONParser, RejectsMalformedInput) {
    const char* bad[] = {
        "{not json",
        "",
        "   ",
        "{\"a\":1,}",
        "[1,2",
        "01",
        "1.",
        "-",
        "1e",
        "\"unterminated",
        "\"raw\ncontrol\"",
        "\"\\ud83d\"",
        "\"\\x41\"",
        "tru",
        "{\"a\" 1}",
        "{} {}",
        "nullx",
        "NaN",
    };
    for (const char* text : bad) {
        EXPECT_THROW(parseJSONValue(text), JSONParseError) << "input: " << text;
    }
}

TEST(JSONParser, AcceptsWellFormedUtf8) {
    JSONValue v = parseJSONValue("\"caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80\"");
    EXPECT_EQ(std::get<std::string>(v.value), "caf\xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80");
}

TEST(JSONParser, RejectsMalformedUtf8) {
    const char* cases[] = {
        "\"\xff\xfe\"",          // bytes that never start a sequence
        "\"no\xc3\"",            // truncated two-byte sequence
        "\"\xc0\xaf\"",          // overlong '/'
        "\"\xe0\x80\xaf\"",      // overlong three-byte form
        "\"\xed\xa0\x80\"",      // encoded surrogate
        "\"\xf4\x90\x80\x80\"",  // above U+10FFFF
        "\"\x80\"",              // stray continuation byte
        "{\"k\xfe\":1}",         // object keys too
    };
    for (const char* text : cases) {
        try {
            parseJSONValue(text);
            ADD_FAILURE() << "accepted malformed UTF-8";
        } catch (const JSONParseError& e) {
            EXPECT_NE(std::string(e.what()).find("Invalid UTF-8"), std::string::npos);
        }
    }
}

TEST(JSONParser, EnforcesNestingLimit) {
    std::string ok(MaxNestingDepth, '[');
    ok += std::string(MaxNestingDepth, ']');
    EXPECT_NO_THROW(parseJSONValue(ok));

    std::string deep(MaxNestingDepth + 1, '[');
    deep += std::string(MaxNestingDepth + 1, ']');
    EXPECT_THROW(parseJSONValue(deep), JSONParseError);
}

TEST(JSONSerialize, SortsKeysAndEscapesControlCharacters) {
    JSONValue::Object o;
    o["zeta"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
    o["alpha"] = std::make_shared<JSONValue>(std::string("line1\nline2\x01"));
    o["mid"] = std::make_shared<JSONValue>(JSONValue::Array{});
    std::string out = serializeJSONValue(JSONValue{o});
    EXPECT_EQ(out, "{\"alpha\":\"line1\\nline2\\u0001\",\"mid\":[],\"zeta\":1}");
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(JSONSerialize, MalformedUtf8IsReplaced) {
    std::string out = serializeJSONValue(JSONValue{std::string("ok\xff-\xc3\xa9-\xed\xa0\x80")});
    EXPECT_EQ(out, "\"ok\xef\xbf\xbd-\xc3\xa9-\xef\xbf\xbd\xef\xbf\xbd\xef\xbf\xbd\"");
    EXPECT_NO_THROW(parseJSONValue(out));
}

TEST(JSONSerialize, NonFiniteNumbersBecomeNull) {
    EXPECT_EQ(serializeJSONValue(JSONValue{std::numeric_limits<double>::infinity()}), "null");
    EXPECT_EQ(serializeJSONValue(JSONValue{std::nan("")}), "null");
    EXPECT_EQ(serializeJSONValue(JSONValue{0.25}), "0.25");
}

TEST(JSONSerialize, ReparsesToSameStructure) {
    const std::string text = R"({"b":[true,false,null],"a":{"s":"q\"uote"},"n":-3})";
    std::string once = serializeJSONValue(parseJSONValue(text));
    EXPECT_EQ(once, R"({"a":{"s":"q\"uote"},"b":[true,false,null],"n":-3})");
    EXPECT_EQ(serializeJSONValue(parseJSONValue(once)), once);
}

TEST(JSONRPCTypes, ResponseCarriesEitherResultOrError) {
    JSONRPCResponse ok(JSONRPCId{static_cast<int64_t>(7)}, JSONValue{JSONValue::Object{}});
    EXPECT_EQ(ok.Serialize(), R"({"jsonrpc":"2.0","id":7,"result":{}})");
    EXPECT_FALSE(ok.IsError());

    auto err = CreateErrorResponse(JSONRPCId{std::string("abc")}, JSONRPCErrorCodes::MethodNotFound, "nope");
    EXPECT_TRUE(err->IsError());
    EXPECT_EQ(err->Serialize(), R"({"jsonrpc":"2.0","id":"abc","error":{"code":-32601,"message":"nope"}})");

    auto nullId = CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::ParseError, "Parse error");
    EXPECT_EQ(nullId->Serialize(), R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})");
}

TEST(JSONRPCTypes, IdToStringRendersEachKind) {
    EXPECT_EQ(idToString(JSONRPCId{static_cast<int64_t>(42)}), "42");
    EXPECT_EQ(idToString(JSONRPCId{std::string("r-1")}), "\"r-1\"");
    EXPECT_EQ(idToString(JSONRPCId{nullptr}), "null");
}

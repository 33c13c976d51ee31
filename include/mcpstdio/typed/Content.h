//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing and extracting typed content blocks (text, resource contents, prompt
//          messages) used by capability handlers and tests
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpstdio/Protocol.h"

namespace mcpstdio {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// Entry of resources/read "contents": { uri, mimeType?, text }
inline JSONValue makeTextResourceContents(const std::string& uri, const std::optional<std::string>& mimeType,
                                          const std::string& text) {
    JSONValue::Object obj;
    obj["uri"] = std::make_shared<JSONValue>(uri);
    if (mimeType.has_value()) {
        obj["mimeType"] = std::make_shared<JSONValue>(mimeType.value());
    }
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// Prompt message: { role, content: { type: "text", text } }
inline JSONValue makePromptMessage(const std::string& role, const std::string& text) {
    JSONValue::Object obj;
    obj["role"] = std::make_shared<JSONValue>(role);
    obj["content"] = std::make_shared<JSONValue>(makeText(text));
    return JSONValue{obj};
}

inline CallToolResult makeTextResult(const std::string& text, bool isError = false) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    r.isError = isError;
    return r;
}

//------------------------------ Inspectors ------------------------------
inline std::optional<std::string> getStringField(const JSONValue& v, const char* key) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) return std::nullopt;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return std::nullopt;
    if (!std::holds_alternative<std::string>(it->second->value)) return std::nullopt;
    return std::get<std::string>(it->second->value);
}

inline bool isText(const JSONValue& v) {
    auto t = getStringField(v, "type");
    return t.has_value() && t.value() == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    return getStringField(v, "text");
}

inline std::vector<std::string> collectText(const std::vector<JSONValue>& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    auto v = collectText(r.content);
    if (v.empty()) return std::nullopt;
    return v.front();
}

} // namespace typed
} // namespace mcpstdio

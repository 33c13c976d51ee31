//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeValidator.cpp
// Purpose: Frame -> request/notification decoding with JSON-RPC 2.0 envelope checks
//==========================================================================================================

#include "mcpstdio/EnvelopeValidator.h"
#include "logging/Logger.h"

namespace mcpstdio {

namespace {

// Extracts a usable id; std::nullopt when the member holds a type JSON-RPC does not allow.
std::optional<JSONRPCId> toId(const JSONValue& v) {
    if (std::holds_alternative<std::string>(v.value)) {
        return JSONRPCId{std::get<std::string>(v.value)};
    }
    if (std::holds_alternative<int64_t>(v.value)) {
        return JSONRPCId{std::get<int64_t>(v.value)};
    }
    if (std::holds_alternative<std::nullptr_t>(v.value)) {
        return JSONRPCId{nullptr};
    }
    return std::nullopt;
}

EnvelopeRejection reject(JSONRPCId id, const std::string& detail) {
    LOG_DEBUG("Envelope rejected (id={}): {}", idToString(id), detail);
    return EnvelopeRejection{std::move(id), errors::invalidRequest(detail)};
}

} // namespace

Envelope ValidateEnvelope(const std::string& frame) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = parseJSONValue(frame);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Frame is not valid JSON: {}", e.what());
        return EnvelopeRejection{JSONRPCId{nullptr}, errors::parseError()};
    }

    if (std::holds_alternative<JSONValue::Array>(doc.value)) {
        return reject(JSONRPCId{nullptr}, "batch requests are not supported");
    }
    if (!std::holds_alternative<JSONValue::Object>(doc.value)) {
        return reject(JSONRPCId{nullptr}, "message must be a JSON object");
    }
    const auto& obj = std::get<JSONValue::Object>(doc.value);

    // The id is examined first so every later rejection can echo it.
    bool hasId = false;
    JSONRPCId id{nullptr};
    auto itId = obj.find("id");
    if (itId != obj.end() && itId->second) {
        auto parsed = toId(*itId->second);
        if (!parsed.has_value()) {
            return reject(JSONRPCId{nullptr}, "id must be a string, an integer or null");
        }
        hasId = true;
        id = std::move(parsed.value());
    }

    auto itVer = obj.find("jsonrpc");
    if (itVer == obj.end() || !itVer->second ||
        !std::holds_alternative<std::string>(itVer->second->value) ||
        std::get<std::string>(itVer->second->value) != "2.0") {
        return reject(id, "jsonrpc must be \"2.0\"");
    }

    auto itMethod = obj.find("method");
    if (itMethod == obj.end() || !itMethod->second) {
        return reject(id, "missing method");
    }
    if (!std::holds_alternative<std::string>(itMethod->second->value)) {
        return reject(id, "method must be a string");
    }
    std::string method = std::get<std::string>(itMethod->second->value);

    std::optional<JSONValue> params;
    auto itParams = obj.find("params");
    if (itParams != obj.end() && itParams->second) {
        const JSONValue& p = *itParams->second;
        if (!std::holds_alternative<JSONValue::Object>(p.value) &&
            !std::holds_alternative<JSONValue::Array>(p.value)) {
            return reject(id, "params must be an object or an array");
        }
        params = p;
    }

    if (hasId) {
        return JSONRPCRequest(std::move(id), std::move(method), std::move(params));
    }
    return JSONRPCNotification(std::move(method), std::move(params));
}

} // namespace mcpstdio

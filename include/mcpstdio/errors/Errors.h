//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exception types, and the single mapping from failures to JSON-RPC errors
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcpstdio/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace mcpstdio {
namespace errors {

// Categorization of the codes this server emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    NotInitialized,
    CapabilityNotFound,
    Domain,
    Unknown
};

// Typed error representation; every failure path ends up as one of these before it is written.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or application-defined).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::NotInitialized: return ErrorCategory::NotInitialized;
        case JSONRPCErrorCodes::CapabilityNotFound: return ErrorCategory::CapabilityNotFound;
        case JSONRPCErrorCodes::DomainError: return ErrorCategory::Domain;
        default: return ErrorCategory::Unknown;
    }
}

inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

inline McpError parseError() {
    return makeError(JSONRPCErrorCodes::ParseError, "Parse error");
}

inline McpError invalidRequest(const std::string& detail) {
    return makeError(JSONRPCErrorCodes::InvalidRequest, "Invalid Request: " + detail);
}

inline McpError methodNotFound(const std::string& method) {
    return makeError(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method);
}

// Args:
//   field: Offending parameter path ("" when the params object itself is wrong).
//   reason: Short explanation, echoed in both message and data.
inline McpError invalidParams(const std::string& field, const std::string& reason) {
    JSONValue::Object data;
    data["field"] = std::make_shared<JSONValue>(field);
    data["reason"] = std::make_shared<JSONValue>(reason);
    std::string message = field.empty() ? "Invalid params: " + reason
                                        : "Invalid params: '" + field + "' " + reason;
    return makeError(JSONRPCErrorCodes::InvalidParams, std::move(message), JSONValue{std::move(data)});
}

inline McpError internalError(const std::string& message = "Internal error") {
    return makeError(JSONRPCErrorCodes::InternalError, message);
}

inline McpError notInitialized() {
    return makeError(JSONRPCErrorCodes::NotInitialized, "Server not initialized");
}

// Args:
//   kind: "Tool", "Resource" or "Prompt".
//   key: Identifier that failed to resolve.
inline McpError capabilityNotFound(const std::string& kind, const std::string& key) {
    JSONValue::Object data;
    data["kind"] = std::make_shared<JSONValue>(kind);
    data["key"] = std::make_shared<JSONValue>(key);
    return makeError(JSONRPCErrorCodes::CapabilityNotFound, kind + " not found: " + key, JSONValue{std::move(data)});
}

//==========================================================================================================
// McpException
// Purpose: Carries a fully-formed protocol error through the dispatch stack.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

//==========================================================================================================
// DomainError
// Purpose: Raised by capability handlers for business-level failures (bad file, denied access, ...).
//          The message is written for the client and is returned verbatim.
// Args:
//   message: Client-facing text.
//   code: Application code, DomainError (-32003) unless the handler chooses another application code.
//   data: Optional structured payload.
//==========================================================================================================
class DomainError : public std::runtime_error {
public:
    explicit DomainError(const std::string& message,
                         int code = JSONRPCErrorCodes::DomainError,
                         std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const noexcept { return code_; }
    const std::optional<JSONValue>& data() const noexcept { return data_; }

private:
    int code_;
    std::optional<JSONValue> data_;
};

//==========================================================================================================
// mapException
// Purpose: Converts anything thrown during dispatch into an McpError.
// Args:
//   ep: Captured exception (std::current_exception()).
//   context: Short label for the log line (method name, tool name).
// Returns:
//   McpException -> its error; DomainError -> its code/message/data; everything else -> InternalError with
//   the generic message. Detail of unexpected exceptions only reaches the logger.
//==========================================================================================================
inline McpError mapException(std::exception_ptr ep, const std::string& context) {
    try {
        if (ep) {
            std::rethrow_exception(ep);
        }
    } catch (const McpException& e) {
        return e.error();
    } catch (const DomainError& e) {
        LOG_DEBUG("{}: domain error {}: {}", context, e.code(), e.what());
        return makeError(e.code(), e.what(), e.data());
    } catch (const std::exception& e) {
        LOG_ERROR("{}: unhandled exception: {}", context, e.what());
        return internalError();
    } catch (...) {
        LOG_ERROR("{}: unhandled non-standard exception", context);
        return internalError();
    }
    LOG_ERROR("{}: mapException called without an exception", context);
    return internalError();
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

// Extract McpError from an error response; std::nullopt for success responses or malformed errors.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value() ||
        !std::holds_alternative<JSONValue::Object>(response.error->value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(response.error->value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end() || !itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }
    return makeError(static_cast<int>(std::get<int64_t>(itCode->second->value)),
                     std::get<std::string>(itMsg->second->value), std::move(data));
}

} // namespace errors
} // namespace mcpstdio

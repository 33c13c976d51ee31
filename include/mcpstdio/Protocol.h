//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Protocol data structures, version constants and method routing table
//==========================================================================================================

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "mcpstdio/JSONRPCTypes.h"

namespace mcpstdio {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Newest first; the first entry is what the server offers when the client asks for something unknown.
constexpr std::array<const char*, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-11-25",
    "2025-06-18",
    "2025-03-26",
    "2024-11-05"
};
constexpr const char* PROTOCOL_VERSION = SUPPORTED_PROTOCOL_VERSIONS[0];

inline bool isSupportedProtocolVersion(std::string_view v) {
    for (const char* s : SUPPORTED_PROTOCOL_VERSIONS) {
        if (v == s) return true;
    }
    return false;
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (serverInfo / clientInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

// Registries are immutable, so listChanged is always false; a section is present only when its registry
// has at least one entry.
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
};

// Kept verbatim from the client's initialize request (object or absent).
struct ClientCapabilities {
    JSONValue raw{JSONValue::Object{}};
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct ToolAnnotations {
    std::optional<std::string> title;
    std::optional<bool> readOnlyHint;
    std::optional<bool> destructiveHint;
    std::optional<bool> idempotentHint;
    std::optional<bool> openWorldHint;
};

struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<ToolAnnotations> annotations;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{},
         std::optional<ToolAnnotations> annotations = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), annotations(std::move(annotations)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Ordered content blocks
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ResourceTemplate {
    std::string uriTemplate;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    ResourceTemplate() = default;
    ResourceTemplate(std::string uriTemplate, std::string name,
                     std::optional<std::string> description = std::nullopt,
                     std::optional<std::string> mimeType = std::nullopt)
        : uriTemplate(std::move(uriTemplate)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ReadResourceResult {
    std::vector<JSONValue> contents;  // Array of resource contents
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////
struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    Prompt() = default;
    Prompt(std::string name, std::string description, std::vector<PromptArgument> arguments = {})
        : name(std::move(name)), description(std::move(description)),
          arguments(std::move(arguments)) {}
};

struct GetPromptResult {
    std::string description;
    std::vector<JSONValue> messages;  // Array of {role, content} objects
};

///////////////////////////////////////// Methods ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* LegacyInitialized = "initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

//==========================================================================================================
// MethodKind
// Purpose: Closed set of request methods the dispatcher routes; everything else is Unknown.
//==========================================================================================================
enum class MethodKind {
    Initialize,
    Ping,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    ResourceTemplatesList,
    PromptsList,
    PromptsGet,
    Unknown
};

inline MethodKind classifyMethod(std::string_view method) {
    if (method == Methods::Initialize) return MethodKind::Initialize;
    if (method == Methods::Ping) return MethodKind::Ping;
    if (method == Methods::ListTools) return MethodKind::ToolsList;
    if (method == Methods::CallTool) return MethodKind::ToolsCall;
    if (method == Methods::ListResources) return MethodKind::ResourcesList;
    if (method == Methods::ReadResource) return MethodKind::ResourcesRead;
    if (method == Methods::ListResourceTemplates) return MethodKind::ResourceTemplatesList;
    if (method == Methods::ListPrompts) return MethodKind::PromptsList;
    if (method == Methods::GetPrompt) return MethodKind::PromptsGet;
    return MethodKind::Unknown;
}

// Methods that touch a capability registry and therefore require a completed handshake.
inline bool isCapabilityMethod(MethodKind kind) {
    switch (kind) {
        case MethodKind::ToolsList:
        case MethodKind::ToolsCall:
        case MethodKind::ResourcesList:
        case MethodKind::ResourcesRead:
        case MethodKind::ResourceTemplatesList:
        case MethodKind::PromptsList:
        case MethodKind::PromptsGet:
            return true;
        default:
            return false;
    }
}

// Any method under the tools/, resources/ or prompts/ namespaces, routed or not.
inline bool isCapabilityNamespace(std::string_view method) {
    return method.rfind("tools/", 0) == 0 || method.rfind("resources/", 0) == 0 ||
           method.rfind("prompts/", 0) == 0;
}

enum class NotificationKind {
    Initialized,
    Cancelled,
    Unknown
};

inline NotificationKind classifyNotification(std::string_view method) {
    if (method == Methods::Initialized || method == Methods::LegacyInitialized) return NotificationKind::Initialized;
    if (method == Methods::Cancelled) return NotificationKind::Cancelled;
    return NotificationKind::Unknown;
}

} // namespace mcpstdio

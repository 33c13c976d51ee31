//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.cpp
// Purpose: Registry builder and template matching
//==========================================================================================================

#include "mcpstdio/Registry.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace mcpstdio {

const ResourceTemplateEntry* CapabilityRegistries::MatchTemplate(const std::string& uri) const {
    for (const auto& entry : resourceTemplates.Entries()) {
        if (entry.Matches(uri)) {
            return &entry;
        }
    }
    return nullptr;
}

ServerCapabilities CapabilityRegistries::Advertised() const {
    ServerCapabilities caps;
    if (!tools.Empty()) {
        caps.tools = ToolsCapability{};
    }
    if (!resources.Empty() || !resourceTemplates.Empty()) {
        caps.resources = ResourcesCapability{};
    }
    if (!prompts.Empty()) {
        caps.prompts = PromptsCapability{};
    }
    return caps;
}

RegistryBuilder::RegistryBuilder() : pending(std::make_unique<CapabilityRegistries>()) {}

RegistryBuilder& RegistryBuilder::RegisterTool(const Tool& tool, ToolHandler handler) {
    if (tool.name.empty()) {
        throw std::invalid_argument("tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("tool '" + tool.name + "' has no handler");
    }
    if (!pending->tools.Insert(tool.name, ToolEntry{tool, std::move(handler)})) {
        throw std::invalid_argument("duplicate tool: " + tool.name);
    }
    LOG_DEBUG("Registered tool: {}", tool.name);
    return *this;
}

RegistryBuilder& RegistryBuilder::RegisterResource(const Resource& resource, ResourceHandler handler) {
    if (resource.uri.empty()) {
        throw std::invalid_argument("resource uri must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("resource '" + resource.uri + "' has no handler");
    }
    if (!pending->resources.Insert(resource.uri, ResourceEntry{resource, std::move(handler)})) {
        throw std::invalid_argument("duplicate resource: " + resource.uri);
    }
    LOG_DEBUG("Registered resource: {}", resource.uri);
    return *this;
}

RegistryBuilder& RegistryBuilder::RegisterResourceTemplate(const ResourceTemplate& resourceTemplate,
                                                           ResourceHandler handler) {
    const std::string& pattern = resourceTemplate.uriTemplate;
    auto open = pattern.find('{');
    auto close = pattern.find('}');
    if (open == std::string::npos || close == std::string::npos || close < open + 2 ||
        pattern.find('{', open + 1) != std::string::npos) {
        throw std::invalid_argument("resource template must contain exactly one {variable}: " + pattern);
    }
    if (!handler) {
        throw std::invalid_argument("resource template '" + pattern + "' has no handler");
    }
    ResourceTemplateEntry entry{resourceTemplate, std::move(handler),
                                pattern.substr(0, open), pattern.substr(close + 1)};
    if (!pending->resourceTemplates.Insert(pattern, std::move(entry))) {
        throw std::invalid_argument("duplicate resource template: " + pattern);
    }
    LOG_DEBUG("Registered resource template: {}", pattern);
    return *this;
}

RegistryBuilder& RegistryBuilder::RegisterPrompt(const Prompt& prompt, PromptHandler handler) {
    if (prompt.name.empty()) {
        throw std::invalid_argument("prompt name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("prompt '" + prompt.name + "' has no handler");
    }
    if (!pending->prompts.Insert(prompt.name, PromptEntry{prompt, std::move(handler)})) {
        throw std::invalid_argument("duplicate prompt: " + prompt.name);
    }
    LOG_DEBUG("Registered prompt: {}", prompt.name);
    return *this;
}

std::shared_ptr<const CapabilityRegistries> RegistryBuilder::Build() {
    std::shared_ptr<const CapabilityRegistries> snapshot(std::move(pending));
    pending = std::make_unique<CapabilityRegistries>();
    LOG_INFO("Capability registries built: {} tools, {} resources, {} templates, {} prompts",
             snapshot->tools.Size(), snapshot->resources.Size(),
             snapshot->resourceTemplates.Size(), snapshot->prompts.Size());
    return snapshot;
}

} // namespace mcpstdio

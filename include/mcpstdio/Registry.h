//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Immutable capability tables (tools, resources, resource templates, prompts) and their builder
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpstdio/Protocol.h"

namespace mcpstdio {

class RegistryBuilder;

//==========================================================================================================
// Handler contract
// Purpose: Handlers receive schema-checked arguments and a stop token, return their payload, and report
//          business failures by throwing errors::DomainError. They never touch the transport.
//==========================================================================================================
using ToolHandler = std::function<CallToolResult(const JSONValue& arguments, std::stop_token st)>;
using ResourceHandler = std::function<ReadResourceResult(const std::string& uri, std::stop_token st)>;
using PromptHandler = std::function<GetPromptResult(const JSONValue& arguments, std::stop_token st)>;

struct ToolEntry {
    Tool descriptor;
    ToolHandler handler;
};

struct ResourceEntry {
    Resource descriptor;
    ResourceHandler handler;
};

struct ResourceTemplateEntry {
    ResourceTemplate descriptor;
    ResourceHandler handler;
    // Literal text around the single {variable} of the template, used for matching.
    std::string prefix;
    std::string suffix;

    bool Matches(const std::string& uri) const {
        return uri.size() > prefix.size() + suffix.size() &&
               uri.compare(0, prefix.size(), prefix) == 0 &&
               uri.compare(uri.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    // Text bound to the template variable; only meaningful when Matches(uri).
    std::string ExtractVariable(const std::string& uri) const {
        return uri.substr(prefix.size(), uri.size() - prefix.size() - suffix.size());
    }
};

struct PromptEntry {
    Prompt descriptor;
    PromptHandler handler;
};

//==========================================================================================================
// Registry
// Purpose: Key -> entry table that remembers registration order.
// Notes:
//   Filled only by RegistryBuilder; read-only afterwards, so concurrent readers need no locking.
//==========================================================================================================
template <typename Entry>
class Registry {
public:
    const Entry* Find(const std::string& key) const {
        auto it = index.find(key);
        if (it == index.end()) {
            return nullptr;
        }
        return &entries[it->second];
    }

    const std::vector<Entry>& Entries() const { return entries; }
    std::size_t Size() const { return entries.size(); }
    bool Empty() const { return entries.empty(); }

private:
    friend class RegistryBuilder;

    bool Insert(const std::string& key, Entry entry) {
        if (index.count(key) != 0) {
            return false;
        }
        index.emplace(key, entries.size());
        entries.push_back(std::move(entry));
        return true;
    }

    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

//==========================================================================================================
// CapabilityRegistries
// Purpose: The full capability surface handed to the dispatcher.
//==========================================================================================================
struct CapabilityRegistries {
    Registry<ToolEntry> tools;
    Registry<ResourceEntry> resources;
    Registry<ResourceTemplateEntry> resourceTemplates;
    Registry<PromptEntry> prompts;

    // First template (in registration order) whose pattern matches uri, or nullptr.
    const ResourceTemplateEntry* MatchTemplate(const std::string& uri) const;

    // Capabilities to advertise: a section per non-empty registry.
    ServerCapabilities Advertised() const;
};

//==========================================================================================================
// RegistryBuilder
// Purpose: Collects entries at startup, then freezes them into a shared immutable snapshot.
// Throws:
//   std::invalid_argument from Register* on an empty key, a missing handler, a duplicate key, or a
//   template without exactly one {variable}.
//==========================================================================================================
class RegistryBuilder {
public:
    RegistryBuilder();

    RegistryBuilder& RegisterTool(const Tool& tool, ToolHandler handler);
    RegistryBuilder& RegisterResource(const Resource& resource, ResourceHandler handler);
    RegistryBuilder& RegisterResourceTemplate(const ResourceTemplate& resourceTemplate, ResourceHandler handler);
    RegistryBuilder& RegisterPrompt(const Prompt& prompt, PromptHandler handler);

    // Hands out the snapshot; the builder starts over empty afterwards.
    std::shared_ptr<const CapabilityRegistries> Build();

private:
    std::unique_ptr<CapabilityRegistries> pending;
};

} // namespace mcpstdio

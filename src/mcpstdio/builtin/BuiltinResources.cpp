//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinResources.cpp
// Purpose: config://app and file:///data/{filename}
//==========================================================================================================

#include "mcpstdio/builtin/BuiltinCapabilities.h"
#include "mcpstdio/typed/Content.h"
#include "mcpstdio/errors/Errors.h"
#include "logging/Logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace mcpstdio {
namespace builtin {

namespace fs = std::filesystem;

namespace {

constexpr const char* kConfigUri = "config://app";
constexpr const char* kDataTemplate = "file:///data/{filename}";
constexpr const char* kDataPrefix = "file:///data/";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ReadResourceResult readConfig(const std::string& uri, const BuiltinOptions& options) {
    LOG_DEBUG("Reading config resource {}", uri);
    JSONValue::Object features;
    features["tools"] = std::make_shared<JSONValue>(true);
    features["resources"] = std::make_shared<JSONValue>(true);
    features["prompts"] = std::make_shared<JSONValue>(true);

    JSONValue::Object cfg;
    cfg["appName"] = std::make_shared<JSONValue>(options.appName);
    cfg["version"] = std::make_shared<JSONValue>(options.appVersion);
    cfg["environment"] = std::make_shared<JSONValue>(std::string("development"));
    cfg["features"] = std::make_shared<JSONValue>(std::move(features));

    ReadResourceResult r;
    r.contents.push_back(typed::makeTextResourceContents(uri, std::string("application/json"),
                                                         serializeJSONValue(JSONValue{cfg})));
    return r;
}

ReadResourceResult readDataFile(const std::string& uri, const std::string& dataDir) {
    if (uri.rfind(kDataPrefix, 0) != 0) {
        throw errors::DomainError("Invalid URI: " + uri);
    }
    std::string filename = uri.substr(std::string(kDataPrefix).size());
    LOG_DEBUG("Reading file resource {}", filename);

    std::string path = ResolveDataFile(dataDir, filename);
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        LOG_ERROR("File read error: cannot open {}", path);
        throw errors::DomainError("Failed to read file: cannot open " + filename);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        LOG_ERROR("File read error: I/O failure on {}", path);
        throw errors::DomainError("Failed to read file: I/O error on " + filename);
    }

    ReadResourceResult r;
    r.contents.push_back(typed::makeTextResourceContents(uri, MimeTypeForFile(filename), ss.str()));
    return r;
}

} // namespace

std::string ResolveDataFile(const std::string& dataDir, const std::string& filename) {
    std::error_code ec;
    fs::path base = fs::absolute(fs::path(dataDir), ec);
    if (ec) {
        LOG_ERROR("Cannot resolve data directory {}: {}", dataDir, ec.message());
        throw errors::DomainError("Failed to read file: data directory unavailable");
    }
    fs::path canonicalBase = fs::weakly_canonical(base, ec);
    base = ec ? base.lexically_normal() : canonicalBase;
    fs::path requested = fs::weakly_canonical(base / fs::path(filename), ec);
    if (ec) {
        requested = (base / fs::path(filename)).lexically_normal();
    }

    // Every component of base must prefix requested, and requested must name something below it.
    auto baseIt = base.begin();
    auto reqIt = requested.begin();
    for (; baseIt != base.end(); ++baseIt, ++reqIt) {
        if (baseIt->empty() && std::next(baseIt) == base.end()) {
            break;  // trailing separator
        }
        if (reqIt == requested.end() || *reqIt != *baseIt) {
            LOG_WARN("Rejected data path outside {}: {}", base.string(), filename);
            throw errors::DomainError("Access denied: Path traversal attempt");
        }
    }
    if (reqIt == requested.end()) {
        throw errors::DomainError("Access denied: Path traversal attempt");
    }
    return requested.string();
}

std::string MimeTypeForFile(const std::string& filename) {
    if (endsWith(filename, ".txt")) {
        return "text/plain";
    }
    if (endsWith(filename, ".json")) {
        return "application/json";
    }
    return "application/octet-stream";
}

void RegisterBuiltinResources(RegistryBuilder& builder, const BuiltinOptions& options) {
    builder.RegisterResource(
        Resource(kConfigUri, "Application Configuration", std::string("Current application configuration"),
                 std::string("application/json")),
        [options](const std::string& uri, std::stop_token) { return readConfig(uri, options); });

    std::string dataDir = options.dataDir;
    builder.RegisterResourceTemplate(
        ResourceTemplate(kDataTemplate, "Data Files", std::string("Files under the configured data directory")),
        [dataDir](const std::string& uri, std::stop_token) { return readDataFile(uri, dataDir); });
}

} // namespace builtin
} // namespace mcpstdio

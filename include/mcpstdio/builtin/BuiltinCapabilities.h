//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BuiltinCapabilities.h
// Purpose: The stock tools, resources and prompt shipped with mcpstdio_server
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>

#include "mcpstdio/Registry.h"

namespace mcpstdio {
namespace builtin {

//==========================================================================================================
// BuiltinOptions
// Fields:
//   dataDir: Base directory served by the file:///data/{filename} template.
//   weatherLatency: Simulated upstream delay for fetch-weather (honors cancellation).
//   appName/appVersion: Reported by the config://app resource.
//==========================================================================================================
struct BuiltinOptions {
    std::string dataDir{"./data"};
    std::chrono::milliseconds weatherLatency{0};
    std::string appName{"McpStdioServer"};
    std::string appVersion{"1.0.0"};
};

// Tools: greet, calculate-bmi, fetch-weather
void RegisterBuiltinTools(RegistryBuilder& builder, const BuiltinOptions& options);

// Resources: config://app and the file:///data/{filename} template
void RegisterBuiltinResources(RegistryBuilder& builder, const BuiltinOptions& options);

// Prompts: review-code
void RegisterBuiltinPrompts(RegistryBuilder& builder);

// All of the above.
void RegisterBuiltinCapabilities(RegistryBuilder& builder, const BuiltinOptions& options);

//==========================================================================================================
// ResolveDataFile
// Purpose: Maps a file name below dataDir to a path, refusing anything that escapes dataDir.
// Throws:
//   errors::DomainError("Access denied: Path traversal attempt") when the resolved path leaves dataDir.
//==========================================================================================================
std::string ResolveDataFile(const std::string& dataDir, const std::string& filename);

// text/plain for .txt, application/json for .json, application/octet-stream otherwise.
std::string MimeTypeForFile(const std::string& filename);

} // namespace builtin
} // namespace mcpstdio

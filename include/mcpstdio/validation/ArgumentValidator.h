//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ArgumentValidator.h
// Purpose: Checks call arguments against tool input schemas and prompt argument lists before dispatch
//==========================================================================================================

#pragma once

#include <optional>
#include <vector>

#include "mcpstdio/Protocol.h"
#include "mcpstdio/errors/Errors.h"

namespace mcpstdio {
namespace validation {

//==========================================================================================================
// ValidateToolArguments
// Purpose: Apply the JSON Schema subset tool descriptors use.
// Supported keywords:
//   type (string or array of: object, array, string, number, integer, boolean, null), properties,
//   required, additionalProperties (false only), items, enum, minimum, maximum, exclusiveMinimum,
//   exclusiveMaximum, minLength, maxLength.
// Args:
//   schema: Descriptor inputSchema. A null or non-object schema accepts any arguments object.
//   arguments: The "arguments" member of tools/call; absent arguments are treated as {}.
// Returns:
//   std::nullopt when valid; otherwise an InvalidParams error naming the offending field.
//==========================================================================================================
std::optional<errors::McpError> ValidateToolArguments(const JSONValue& schema,
                                                      const std::optional<JSONValue>& arguments);

//==========================================================================================================
// ValidatePromptArguments
// Purpose: Prompt arguments form a flat string map; required ones must be present.
//==========================================================================================================
std::optional<errors::McpError> ValidatePromptArguments(const std::vector<PromptArgument>& declared,
                                                        const std::optional<JSONValue>& arguments);

} // namespace validation
} // namespace mcpstdio

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvelopeValidator.h
// Purpose: Decodes one inbound frame into a request or notification, or the error reply it deserves
//==========================================================================================================

#pragma once

#include <string>
#include <variant>

#include "mcpstdio/JSONRPCTypes.h"
#include "mcpstdio/errors/Errors.h"

namespace mcpstdio {

//==========================================================================================================
// EnvelopeRejection
// Purpose: A frame that must be answered with an error before any routing happens.
// Fields:
//   id: The frame's own id when it was a valid id, otherwise null.
//   error: ParseError or InvalidRequest.
//==========================================================================================================
struct EnvelopeRejection {
    JSONRPCId id{nullptr};
    errors::McpError error;
};

using Envelope = std::variant<JSONRPCRequest, JSONRPCNotification, EnvelopeRejection>;

//==========================================================================================================
// ValidateEnvelope
// Purpose: Parse and shape-check one frame.
// Args:
//   frame: One line of text from the transport.
// Returns:
//   JSONRPCRequest when an id member is present (string, integer or null),
//   JSONRPCNotification when it is absent, EnvelopeRejection otherwise:
//     - not valid JSON                          -> ParseError, id null
//     - not an object (batches included)        -> InvalidRequest
//     - jsonrpc missing or not exactly "2.0"    -> InvalidRequest
//     - method missing or not a string          -> InvalidRequest
//     - id of any other type                    -> InvalidRequest, id null
//     - params present but not object/array     -> InvalidRequest
//==========================================================================================================
Envelope ValidateEnvelope(const std::string& frame);

} // namespace mcpstdio

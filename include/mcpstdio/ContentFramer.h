//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing (newline-delimited JSON over stdio)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcpstdio {

//========================================================================================================
// IContentFramer
// Purpose: Splits an inbound byte buffer into frames and encodes outbound payloads.
// Notes:
//   Implementations may keep state across calls (e.g. while discarding the tail of an oversized line),
//   so one framer instance serves exactly one input stream.
// DecodeStatus:
//   Ok:         payload holds one frame; drop bytesConsumed from the buffer.
//   Incomplete: no full frame yet; drop bytesConsumed (may be non-zero while discarding) and read more.
//   Skip:       bytesConsumed bytes carried nothing to process (blank line, tail of an oversized line).
//   TooLarge:   a line exceeded the limit; reported once per line, the rest of it is discarded.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        Skip,
        TooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};
    };
    // Throws std::invalid_argument when the payload cannot be carried as one frame.
    virtual std::string encode(const std::string& payload) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
    // True while the tail of an oversized line is being dropped.
    virtual bool discarding() const = 0;
};

constexpr std::size_t DefaultMaxFrameBytes = 1024 * 1024;

std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxFrameBytes = DefaultMaxFrameBytes);

} // namespace mcpstdio

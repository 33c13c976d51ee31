//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport interface for the single-connection, pull-driven server loop
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

namespace mcpstdio {

//==========================================================================================================
// ReadStatus / ReadResult
// Purpose: Outcome of pulling one inbound frame.
//   Frame:       frame holds one line of text (terminator removed).
//   TooLarge:    a line exceeded the frame limit and was discarded; the stream is still usable.
//   EndOfStream: peer closed its side; no more frames will arrive.
//   Interrupted: Interrupt() woke the reader; no data consumed.
//   Error:       unrecoverable read failure.
//==========================================================================================================
enum class ReadStatus {
    Frame,
    TooLarge,
    EndOfStream,
    Interrupted,
    Error
};

struct ReadResult {
    ReadStatus status{ReadStatus::Error};
    std::string frame;
};

//==========================================================================================================
// ITransport
// Purpose: One bidirectional, ordered byte stream carrying newline-delimited frames.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    //==========================================================================================================
    // Blocks until one frame, end-of-stream, an interrupt or an error is observed.
    // Args:
    //   (none)
    // Returns:
    //   ReadResult describing what happened.
    //==========================================================================================================
    virtual ReadResult ReadFrame() = 0;

    //==========================================================================================================
    // Writes one serialized message followed by the frame terminator and pushes it to the peer.
    // Args:
    //   payload: One JSON document without a line terminator.
    // Returns:
    //   true when every byte was written; false on an I/O failure (the stream must be treated as dead).
    //==========================================================================================================
    virtual bool WriteFrame(const std::string& payload) = 0;

    //==========================================================================================================
    // Wakes a blocked ReadFrame(). Safe to call from any thread.
    //==========================================================================================================
    virtual void Interrupt() = 0;

    //==========================================================================================================
    // Indicates whether the transport can still carry traffic.
    //==========================================================================================================
    virtual bool IsOpen() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;
};

} // namespace mcpstdio

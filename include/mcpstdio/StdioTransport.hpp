//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Newline-delimited JSON transport over a pair of file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include "mcpstdio/Transport.h"
#include "mcpstdio/ContentFramer.h"
#include <memory>
#include <cstdint>

namespace mcpstdio {

//==========================================================================================================
// StdioTransport
// Purpose: Frames inbound bytes with the line framer and writes each outbound frame straight to the fd.
// Ctors:
//   StdioTransport(inFd, outFd, maxFrameBytes): Descriptors are borrowed, never closed.
// Notes:
//   Reads wait on poll() over the input fd plus an internal wake pipe so Interrupt() can unblock them.
//   Writes are unbuffered and retried on partial writes, EINTR and EAGAIN.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    StdioTransport(int inFd, int outFd, std::size_t maxFrameBytes = DefaultMaxFrameBytes);
    virtual ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    ReadResult ReadFrame() override;
    bool WriteFrame(const std::string& payload) override;
    void Interrupt() override;
    bool IsOpen() const override;
    std::string GetSessionId() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpstdio

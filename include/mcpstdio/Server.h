//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: The read -> validate -> dispatch -> write loop over a single transport
//==========================================================================================================

#pragma once

#include "mcpstdio/Dispatcher.h"
#include "mcpstdio/Protocol.h"
#include "mcpstdio/Registry.h"
#include "mcpstdio/Session.h"
#include "mcpstdio/Transport.h"
#include <memory>
#include <optional>
#include <string>

namespace mcpstdio {

//==========================================================================================================
// ServerOptions
// Fields:
//   serverInfo: Name/version advertised in the initialize result.
//   instructions: Optional usage hint included in the initialize result.
//   dispatcher: Handler timeout and cancellation memory.
//==========================================================================================================
struct ServerOptions {
    Implementation serverInfo{"McpStdioServer", "0.0.0"};
    std::optional<std::string> instructions;
    DispatcherOptions dispatcher;
};

//==========================================================================================================
// ServeResult
// Purpose: Why Serve() returned.
//==========================================================================================================
enum class ServeResult {
    EndOfStream,   // peer closed input
    Stopped,       // Stop() was called
    WriteFailed,   // output stream failed; fatal
    ReadFailed     // input stream failed
};

const char* toString(ServeResult result);

//==========================================================================================================
// Server
// Purpose: Owns the session and dispatcher for one connection and drives them from a transport.
// Notes:
//   Frames are handled strictly one at a time in arrival order; a frame's response is written before the
//   next frame is read. Only Stop() and Cancel() may be called from other threads.
//==========================================================================================================
class Server {
public:
    Server(std::shared_ptr<const CapabilityRegistries> registries, ServerOptions options = {});
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Serve
    // Purpose: Run the loop until end of input, Stop(), or an I/O failure. Closes the session on return.
    // Args:
    //   transport: Borrowed for the duration of the call.
    // Returns:
    //   ServeResult describing why the loop ended.
    //==========================================================================================================
    ServeResult Serve(ITransport& transport);

    //==========================================================================================================
    // HandleFrame
    // Purpose: Process one raw frame without a transport.
    // Returns:
    //   The response to write, or nullptr when the frame was a notification.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleFrame(const std::string& frame);

    // Thread-safe: ends Serve() after the current frame and cancels the in-flight handler.
    void Stop();

    // Thread-safe: forwards to Dispatcher::Cancel.
    void Cancel(const JSONRPCId& id);

    // Only meaningful when Serve() is not running on another thread.
    const Session& GetSession() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpstdio

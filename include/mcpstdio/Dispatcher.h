//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Routes validated requests and notifications to the session and the capability registries
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>

#include "mcpstdio/JSONRPCTypes.h"
#include "mcpstdio/Registry.h"
#include "mcpstdio/Session.h"

namespace mcpstdio {

//==========================================================================================================
// DispatcherOptions
// Fields:
//   handlerTimeout: Deadline for one handler invocation; zero waits indefinitely. Values outside
//                   [0, 24h] are clamped to 24h.
//   cancellationMemory: How many cancelled-but-not-yet-seen and recently answered ids are remembered.
//==========================================================================================================
struct DispatcherOptions {
    std::chrono::milliseconds handlerTimeout{30000};
    std::size_t cancellationMemory{1024};
};

//==========================================================================================================
// Dispatcher
// Purpose: Turns one validated message into at most one response.
// Methods:
//   Dispatch(request):       Always returns exactly one response carrying request.id.
//   Dispatch(notification):  Side effects only (initialized acknowledgement, cancellation).
//   Cancel(id):              Thread-safe. Cancels the in-flight handler for id, or arranges for a request
//                            with that id to be answered "Request cancelled" without running its handler.
//   CancelInFlight():        Thread-safe. Cancels whatever handler is running now.
// Notes:
//   Dispatch() must only be called from one thread at a time; the Session is not synchronized.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const CapabilityRegistries> registries, Session& session,
               DispatcherOptions options = {});
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONRPCRequest& request);
    void Dispatch(const JSONRPCNotification& notification);

    void Cancel(const JSONRPCId& id);
    void CancelInFlight();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpstdio

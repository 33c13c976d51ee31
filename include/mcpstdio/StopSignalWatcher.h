//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StopSignalWatcher.h
// Purpose: Turns SIGINT/SIGTERM into a callback on a dedicated, joinable thread
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <thread>

#include <signal.h>

namespace mcpstdio {

//==========================================================================================================
// StopSignalWatcher
// Purpose: Blocks SIGINT/SIGTERM and waits for them with sigwait() on a watcher thread.
// Notes:
//   Start() blocks the signals for the calling thread and everything it creates afterwards, so call it
//   before spawning other threads. onSignal runs at most once, on the watcher thread.
//   The destructor wakes the watcher with a directed SIGTERM and joins it; the callback is not invoked
//   for that wake-up, so nothing it captures is touched after destruction.
//==========================================================================================================
class StopSignalWatcher {
public:
    explicit StopSignalWatcher(std::function<void(int)> onSignal);
    ~StopSignalWatcher();

    StopSignalWatcher(const StopSignalWatcher&) = delete;
    StopSignalWatcher& operator=(const StopSignalWatcher&) = delete;

    // Returns false when the signal mask could not be changed; no thread is started then.
    bool Start();

private:
    std::function<void(int)> callback;
    sigset_t set;
    std::atomic<bool> finished{false};
    std::thread watcher;
};

} // namespace mcpstdio

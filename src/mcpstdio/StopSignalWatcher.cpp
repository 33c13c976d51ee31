//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StopSignalWatcher.cpp
// Purpose: sigwait-based stop signal handling
//==========================================================================================================

#include "mcpstdio/StopSignalWatcher.h"
#include "logging/Logger.h"

#include <cerrno>
#include <cstring>

#include <pthread.h>

namespace mcpstdio {

StopSignalWatcher::StopSignalWatcher(std::function<void(int)> onSignal) : callback(std::move(onSignal)) {
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
}

StopSignalWatcher::~StopSignalWatcher() {
    if (!watcher.joinable()) {
        return;
    }
    finished.store(true);
    // ESRCH only means the watcher already returned after a real signal.
    int rc = pthread_kill(watcher.native_handle(), SIGTERM);
    if (rc != 0 && rc != ESRCH) {
        LOG_WARN("StopSignalWatcher: wake-up failed ({})", ::strerror(rc));
    }
    watcher.join();
}

bool StopSignalWatcher::Start() {
    if (watcher.joinable()) {
        return true;
    }
    int rc = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        LOG_WARN("Could not block SIGINT/SIGTERM ({}); signals will terminate without cleanup", ::strerror(rc));
        return false;
    }
    watcher = std::thread([this]() {
        int sig = 0;
        if (sigwait(&set, &sig) != 0 || finished.load()) {
            return;
        }
        LOG_INFO("Received signal {}; stopping", sig);
        if (callback) {
            callback(sig);
        }
    });
    return true;
}

} // namespace mcpstdio

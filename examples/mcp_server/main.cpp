//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpstdio_server entry point: newline-delimited JSON-RPC over stdin/stdout
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "mcpstdio/Server.h"
#include "mcpstdio/ServerConfig.h"
#include "mcpstdio/StdioTransport.hpp"
#include "mcpstdio/StopSignalWatcher.h"
#include "mcpstdio/auth/SessionToken.hpp"
#include "mcpstdio/builtin/BuiltinCapabilities.h"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

#include <unistd.h>

using namespace mcpstdio;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitServeFailed = 1;
constexpr int kExitStartupFailed = 2;

int runServer(int argc, char** argv) {
    ServerConfig cfg = LoadServerConfig(argc, argv);
    Logger::setLogLevelFromString(cfg.logLevel);
    if (cfg.logFile.has_value() && !Logger::setLogFile(cfg.logFile.value())) {
        LOG_WARN("Could not open log file {}; logging to stderr only", cfg.logFile.value());
    }

    if (cfg.requiredToken.has_value()) {
        auth::StaticTokenVerifier verifier(cfg.requiredToken.value());
        auto check = auth::CheckSessionToken(GetEnv("MCPSTDIO_SESSION_TOKEN"), verifier);
        if (!check.ok) {
            LOG_ERROR("Session token check failed: {}", check.errorMessage);
            return kExitStartupFailed;
        }
        LOG_INFO("Session token accepted");
    }

    std::shared_ptr<const CapabilityRegistries> registries;
    try {
        builtin::BuiltinOptions builtinOptions;
        builtinOptions.dataDir = cfg.dataDir;
        builtinOptions.weatherLatency = cfg.weatherLatency;
        builtinOptions.appName = cfg.name;
        builtinOptions.appVersion = cfg.version;
        RegistryBuilder builder;
        builtin::RegisterBuiltinCapabilities(builder, builtinOptions);
        registries = builder.Build();
    } catch (const std::exception& e) {
        LOG_ERROR("Capability registration failed: {}", e.what());
        return kExitStartupFailed;
    }

    ServerOptions options;
    options.serverInfo = Implementation{cfg.name, cfg.version};
    options.dispatcher.handlerTimeout = cfg.handlerTimeout;
    Server server(registries, options);
    // Declared after the server so it is joined before the server goes away.
    StopSignalWatcher signals([&server](int) { server.Stop(); });
    signals.Start();

    StdioTransport transport(STDIN_FILENO, STDOUT_FILENO, cfg.maxFrameBytes);
    LOG_INFO("{} {} serving on stdio (maxFrameBytes={} handlerTimeoutMs={} dataDir={})",
             cfg.name, cfg.version, cfg.maxFrameBytes, cfg.handlerTimeout.count(), cfg.dataDir);

    ServeResult result = server.Serve(transport);
    LOG_INFO("Server stopped: {}", toString(result));
    switch (result) {
        case ServeResult::EndOfStream:
        case ServeResult::Stopped:
            return kExitOk;
        default:
            return kExitServeFailed;
    }
}

} // namespace

int main(int argc, char** argv) {
    // A closed stdout must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    int status = kExitStartupFailed;
    {
        FUNC_SCOPE();
        status = runServer(argc, argv);
    }
    // Timed-out or cancelled handlers may still be running on detached workers and logging; leave
    // without running static destructors underneath them.
    Logger::closeLogFile();
    std::cerr.flush();
    std::_Exit(status);
}

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Configuration loading
//==========================================================================================================

#include "mcpstdio/ServerConfig.h"
#include "mcpstdio/version.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

#include <charconv>
#include <limits>

namespace mcpstdio {

namespace {

// Upper bound for millisecond settings; larger values overflow the clock arithmetic of timed waits.
constexpr unsigned long long kMaxDurationMs = 24ULL * 60 * 60 * 1000;

std::optional<unsigned long long> parseUnsigned(const std::string& text) {
    unsigned long long v = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return v;
}

// Picks the argument over the environment variable; either may be absent.
std::optional<std::string> lookup(int argc, char** argv, const char* envName, const std::string& argKey) {
    if (auto a = GetArgValue(argc, argv, argKey)) {
        return a;
    }
    return GetEnv(envName);
}

void applyUnsigned(int argc, char** argv, const char* envName, const std::string& argKey,
                   bool allowZero, unsigned long long maxValue, unsigned long long& target) {
    auto raw = lookup(argc, argv, envName, argKey);
    if (!raw.has_value()) {
        return;
    }
    auto v = parseUnsigned(raw.value());
    if (!v.has_value() || (!allowZero && v.value() == 0) || v.value() > maxValue) {
        LOG_WARN("Ignoring invalid value '{}' for {} / {}; keeping {}", raw.value(), envName, argKey, target);
        return;
    }
    target = v.value();
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    std::optional<std::string> found;
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.compare(0, eq, key) == 0 && eq == key.size()) {
            found = a.substr(eq + 1);
        }
    }
    return found;
}

ServerConfig LoadServerConfig(int argc, char** argv) {
    ServerConfig cfg;
    cfg.version = getVersionString();

    if (auto v = lookup(argc, argv, "MCPSTDIO_SERVER_NAME", "--name")) cfg.name = *v;
    if (auto v = lookup(argc, argv, "MCPSTDIO_SERVER_VERSION", "--version")) cfg.version = *v;
    if (auto v = lookup(argc, argv, "MCPSTDIO_LOG_LEVEL", "--log-level")) cfg.logLevel = *v;
    if (auto v = lookup(argc, argv, "MCPSTDIO_LOG_FILE", "--log-file")) cfg.logFile = *v;
    if (auto v = lookup(argc, argv, "MCPSTDIO_DATA_DIR", "--data-dir")) cfg.dataDir = *v;
    if (auto v = lookup(argc, argv, "MCPSTDIO_REQUIRED_TOKEN", "--require-token")) cfg.requiredToken = *v;

    unsigned long long maxFrame = cfg.maxFrameBytes;
    applyUnsigned(argc, argv, "MCPSTDIO_MAX_FRAME_BYTES", "--max-frame-bytes", false,
                  std::numeric_limits<std::size_t>::max(), maxFrame);
    cfg.maxFrameBytes = static_cast<std::size_t>(maxFrame);

    unsigned long long timeoutMs = static_cast<unsigned long long>(cfg.handlerTimeout.count());
    applyUnsigned(argc, argv, "MCPSTDIO_HANDLER_TIMEOUT_MS", "--handler-timeout-ms", true, kMaxDurationMs, timeoutMs);
    cfg.handlerTimeout = std::chrono::milliseconds(static_cast<int64_t>(timeoutMs));

    unsigned long long latencyMs = static_cast<unsigned long long>(cfg.weatherLatency.count());
    applyUnsigned(argc, argv, "MCPSTDIO_WEATHER_LATENCY_MS", "--weather-latency-ms", true, kMaxDurationMs, latencyMs);
    cfg.weatherLatency = std::chrono::milliseconds(static_cast<int64_t>(latencyMs));

    return cfg;
}

} // namespace mcpstdio

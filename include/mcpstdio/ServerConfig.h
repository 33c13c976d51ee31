//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Startup configuration from defaults, MCPSTDIO_* environment variables and --key=value args
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace mcpstdio {

//==========================================================================================================
// ServerConfig
// Fields (env / arg):
//   name               MCPSTDIO_SERVER_NAME          --name
//   version            MCPSTDIO_SERVER_VERSION       --version
//   maxFrameBytes      MCPSTDIO_MAX_FRAME_BYTES      --max-frame-bytes
//   handlerTimeout     MCPSTDIO_HANDLER_TIMEOUT_MS   --handler-timeout-ms   (0 disables, at most 24h)
//   logLevel           MCPSTDIO_LOG_LEVEL            --log-level
//   logFile            MCPSTDIO_LOG_FILE             --log-file
//   dataDir            MCPSTDIO_DATA_DIR             --data-dir
//   weatherLatency     MCPSTDIO_WEATHER_LATENCY_MS   --weather-latency-ms   (at most 24h)
//   requiredToken      MCPSTDIO_REQUIRED_TOKEN       --require-token
//==========================================================================================================
struct ServerConfig {
    std::string name{"McpStdioServer"};
    std::string version;
    std::size_t maxFrameBytes{1024 * 1024};
    std::chrono::milliseconds handlerTimeout{30000};
    std::string logLevel{"INFO"};
    std::optional<std::string> logFile;
    std::string dataDir{"./data"};
    std::chrono::milliseconds weatherLatency{0};
    std::optional<std::string> requiredToken;
};

//==========================================================================================================
// GetArgValue
// Purpose: Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--log-level")
// Returns:
//   Optional value string when present (last occurrence wins); empty optional otherwise
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

//==========================================================================================================
// LoadServerConfig
// Purpose: Defaults, then environment, then arguments. Malformed numeric values are logged and ignored.
//==========================================================================================================
ServerConfig LoadServerConfig(int argc, char** argv);

} // namespace mcpstdio

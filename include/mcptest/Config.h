//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration gathered from the environment
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>

#include "logging/Logger.h"
#include "mcptest/ContentFramer.h"

namespace mcptest {

//==========================================================================================================
// ServerConfig
// Fields:
//   logLevel: From LOG_LEVEL (default INFO; unknown values fall back to INFO).
//   logFile: From MCPTEST_LOG_FILE; when non-empty every log line is mirrored there.
//   framing: From MCPTEST_STDIO_FRAMING (auto|newline|content-length; default auto).
//   maxFrameBytes: From MCPTEST_MAX_FRAME_BYTES (default 1 MiB).
//==========================================================================================================
struct ServerConfig {
    LogLevel logLevel{LogLevel::LOG_INFO_LEVEL};
    std::string logFile;
    FramingMode framing{FramingMode::Auto};
    std::size_t maxFrameBytes{DEFAULT_MAX_FRAME_BYTES};
};

ServerConfig LoadServerConfigFromEnv();

// Renders the transport settings in StdioTransportFactory config-string form.
std::string ToTransportConfig(const ServerConfig& config);

} // namespace mcptest

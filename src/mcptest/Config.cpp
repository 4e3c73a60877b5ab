//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment-driven server configuration
//==========================================================================================================

#include "mcptest/Config.h"
#include "env/EnvVars.h"

#include <fmt/format.h>

namespace mcptest {

ServerConfig LoadServerConfigFromEnv() {
    ServerConfig config;
    config.logLevel = Logger::levelFromString(GetEnvOrDefault("LOG_LEVEL", "INFO"));
    config.logFile = GetEnvOrDefault("MCPTEST_LOG_FILE", "");

    const std::string framing = GetEnvOrDefault("MCPTEST_STDIO_FRAMING", "auto");
    if (auto mode = framingModeFromString(framing)) {
        config.framing = mode.value();
    } else {
        LOG_WARN("Unknown MCPTEST_STDIO_FRAMING '{}'; using auto", framing);
    }
    config.maxFrameBytes = GetEnvSizeOrDefault("MCPTEST_MAX_FRAME_BYTES", DEFAULT_MAX_FRAME_BYTES);
    return config;
}

std::string ToTransportConfig(const ServerConfig& config) {
    return fmt::format("framing={}; max_frame_bytes={}", framingModeName(config.framing), config.maxFrameBytes);
}

} // namespace mcptest

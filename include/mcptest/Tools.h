//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tools.h
// Purpose: The fixed tool set served by the MCP stdio test server
//==========================================================================================================

#pragma once

#include <memory>

#include "mcptest/RandomData.h"
#include "mcptest/ToolRegistry.h"

namespace mcptest {

namespace ToolNames {
    constexpr const char* GetRandomData = "get-random-data";
    constexpr const char* Echo = "echo";
    constexpr const char* ServerStatus = "server-status";
}

//==========================================================================================================
// MakeDefaultToolRegistry
// Purpose: Builds the registry with get-random-data, echo and server-status, in that order.
// Args:
//   generator: Source of random records; a fresh randomly seeded generator is used when null.
//==========================================================================================================
ToolRegistry MakeDefaultToolRegistry(std::shared_ptr<RandomDataGenerator> generator = nullptr);

// Number of Unicode code points in a UTF-8 string.
std::size_t utf8Length(const std::string& s);

} // namespace mcptest

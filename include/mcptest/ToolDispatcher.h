//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDispatcher.h
// Purpose: Executes a single tools/call with timing and structured diagnostic events
//==========================================================================================================

#pragma once

#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mcptest/Protocol.h"
#include "mcptest/ToolRegistry.h"

namespace mcptest {

// Logger name attached to tool lifecycle events.
constexpr const char* SERVER_LOGGER_NAME = "mcptest.server";

//==========================================================================================================
// ToolDispatcher
// Purpose: Runs one tool call end to end:
//   1. logs "MCP tool called" {tool_name, arguments}
//   2. resolves the tool and normalizes its arguments
//   3. runs the handler and serializes the result as indented JSON text
//   4. logs "MCP tool completed" {tool_name, duration_ms, response_length} and
//      "OUTBOUND JSON-RPC RESPONSE" {tool_name, response_length, response_payload, duration_ms,
//      debug_outbound_message}
//   Any failure (unknown tool, bad arguments, handler exception) is logged as "MCP tool failed"
//   {tool_name, error, duration_ms} and returned as a single "Error: <message>" text block.
// Notes:
//   - Dispatch never throws for tool faults; the result is always a well-formed CallToolResult.
//==========================================================================================================
class ToolDispatcher {
public:
    explicit ToolDispatcher(const ToolRegistry& registry);

    net::awaitable<CallToolResult> Dispatch(const std::string& name, const JSONValue& arguments);

private:
    const ToolRegistry& registry;
};

// Rounds a millisecond duration to two decimals.
double roundDurationMs(double ms);

} // namespace mcptest

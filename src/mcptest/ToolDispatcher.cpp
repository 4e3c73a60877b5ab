//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolDispatcher.cpp
// Purpose: tools/call execution, timing and called/completed/failed/outbound events
//==========================================================================================================

#include "mcptest/ToolDispatcher.h"
#include "logging/Logger.h"

#include <chrono>
#include <cmath>

namespace mcptest {

namespace {
double elapsedMs(std::chrono::steady_clock::time_point start) {
    const auto elapsed = std::chrono::steady_clock::now() - start;
    return roundDurationMs(std::chrono::duration<double, std::milli>(elapsed).count());
}
} // namespace

double roundDurationMs(double ms) {
    return std::round(ms * 100.0) / 100.0;
}

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry) : registry(registry) {}

net::awaitable<CallToolResult> ToolDispatcher::Dispatch(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    const auto start = std::chrono::steady_clock::now();
    {
        JSONValue::Object extras;
        extras["tool_name"] = std::make_shared<JSONValue>(name);
        extras["arguments"] = std::make_shared<JSONValue>(
            std::holds_alternative<std::nullptr_t>(arguments.value) ? JSONValue{JSONValue::Object{}} : arguments);
        Logger::event(LogLevel::LOG_INFO_LEVEL, SERVER_LOGGER_NAME, "MCP tool called", extras);
    }

    std::string error;
    try {
        const ToolDescriptor* tool = registry.find(name);
        if (tool == nullptr) {
            error = "Unknown tool: " + name;
        } else {
            const JSONValue::Object normalized = NormalizeArguments(tool->inputSchema, arguments);
            const JSONValue result = co_await tool->handler(normalized);
            const std::string text = serializeJSONValuePretty(result, 2);
            const double durationMs = elapsedMs(start);
            const auto responseLength = static_cast<int64_t>(text.size());

            JSONValue::Object completed;
            completed["tool_name"] = std::make_shared<JSONValue>(name);
            completed["duration_ms"] = std::make_shared<JSONValue>(durationMs);
            completed["response_length"] = std::make_shared<JSONValue>(responseLength);
            Logger::event(LogLevel::LOG_INFO_LEVEL, SERVER_LOGGER_NAME, "MCP tool completed", completed);

            JSONValue::Object outbound = completed;
            outbound["response_payload"] = std::make_shared<JSONValue>(text);
            outbound["debug_outbound_message"] = std::make_shared<JSONValue>(true);
            Logger::event(LogLevel::LOG_INFO_LEVEL, SERVER_LOGGER_NAME, "OUTBOUND JSON-RPC RESPONSE", outbound);

            co_return makeTextResult(text);
        }
    } catch (const std::exception& e) {
        error = e.what();
    }

    JSONValue::Object failed;
    failed["tool_name"] = std::make_shared<JSONValue>(name);
    failed["error"] = std::make_shared<JSONValue>(error);
    failed["duration_ms"] = std::make_shared<JSONValue>(elapsedMs(start));
    Logger::event(LogLevel::LOG_ERROR_LEVEL, SERVER_LOGGER_NAME, "MCP tool failed", failed);
    co_return makeTextResult("Error: " + error);
}

} // namespace mcptest

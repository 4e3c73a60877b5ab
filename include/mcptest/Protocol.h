//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants
//==========================================================================================================

#pragma once

#include "mcptest/JSONRPCTypes.h"
#include <array>
#include <string>
#include <vector>

namespace mcptest {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Latest MCP protocol revision; answered when the client asks for one we do not know.
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Revisions echoed back verbatim during initialize negotiation.
constexpr std::array<const char*, 3> SUPPORTED_PROTOCOL_VERSIONS = {
    "2024-11-05",
    "2025-03-26",
    "2025-06-18"
};

// Name reported in serverInfo, server-status and used by the log viewer for container discovery.
constexpr const char* SERVER_NAME = "mcp-stdio-docker-test";

//==========================================================================================================
// negotiateProtocolVersion
// Purpose: Echo a supported requested revision, otherwise fall back to PROTOCOL_VERSION.
//==========================================================================================================
inline std::string negotiateProtocolVersion(const std::string& requested) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (requested == v) {
            return requested;
        }
    }
    return PROTOCOL_VERSION;
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Capabilities structures
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct ServerCapabilities {
    ToolsCapability tools;
    ResourcesCapability resources;
    PromptsCapability prompts;
    JSONValue::Object experimental;
};

// Serializes capabilities in the initialize result shape.
JSONValue serializeServerCapabilities(const ServerCapabilities& caps);

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool metadata as advertised by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

// Result of tools/call. The server always produces exactly one text block.
struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

// Wraps text into a CallToolResult with a single {type:"text"} block.
CallToolResult makeTextResult(const std::string& text);

// Serializes a CallToolResult into the tools/call result shape.
JSONValue serializeCallToolResult(const CallToolResult& result);

///////////////////////////////////////// Method names ///////////////////////////////////////////
// MCP method names
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace mcptest

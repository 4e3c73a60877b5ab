//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Immutable tool catalog (name, description, input schema, handler) and argument normalization
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mcptest/JSONRPCTypes.h"
#include "mcptest/Protocol.h"

namespace mcptest {

namespace net = boost::asio;

//==========================================================================================================
// ToolArgumentError
// Purpose: Raised when call arguments do not satisfy a tool's input schema. The message is reported to
//          the client verbatim after an "Error: " prefix.
//==========================================================================================================
class ToolArgumentError : public std::invalid_argument {
public:
    explicit ToolArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// Tool handler: receives normalized arguments, returns the structured result to serialize.
using ToolHandler = std::function<net::awaitable<JSONValue>(const JSONValue::Object& arguments)>;

//==========================================================================================================
// ToolDescriptor
// Purpose: One catalog entry.
// Fields:
//   name: Unique tool name.
//   description: Human readable description advertised in tools/list.
//   inputSchema: JSON schema object {type, properties, required}.
//   handler: Implementation invoked by the dispatcher.
//==========================================================================================================
struct ToolDescriptor {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    ToolHandler handler;

    Tool toTool() const { return Tool{name, description, inputSchema}; }
};

//==========================================================================================================
// ToolRegistry
// Purpose: Fixed set of tools built once at startup and shared by const reference. Preserves
//          registration order for tools/list.
//==========================================================================================================
class ToolRegistry {
public:
    // Throws std::invalid_argument on an empty or duplicate tool name.
    explicit ToolRegistry(std::vector<ToolDescriptor> tools);

    // Returns the descriptor for name, or nullptr when no such tool exists.
    const ToolDescriptor* find(const std::string& name) const;

    std::vector<Tool> ListTools() const;

private:
    std::vector<ToolDescriptor> entries;
    std::map<std::string, std::size_t> index;
};

//==========================================================================================================
// NormalizeArguments
// Purpose: Validates call arguments against an input schema and fills in defaults.
// Args:
//   inputSchema: Tool schema ({properties: {name: {type, minimum, maximum, default}}, required: [...]}).
//   arguments: Raw arguments from tools/call; null or absent means {}.
// Returns:
//   Normalized argument object: defaults applied for missing optional properties, integers clamped to
//   [minimum, maximum], integral doubles converted to integers. Unknown properties pass through.
// Throws:
//   ToolArgumentError("Missing required argument: <name>") or
//   ToolArgumentError("Invalid type for argument '<name>': expected <type>").
//==========================================================================================================
JSONValue::Object NormalizeArguments(const JSONValue& inputSchema, const JSONValue& arguments);

} // namespace mcptest

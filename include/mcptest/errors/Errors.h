//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC error objects and error response construction
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcptest/JSONRPCTypes.h"

namespace mcptest {
namespace errors {

// Typed error representation used when building error responses.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

inline McpError makeError(int code, std::string message) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    return e;
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace mcptest

//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

#include "mcptest/Transport.h"
#include "mcptest/JSONRPCTypes.h"

namespace mcptest {

struct RouterHandlers {
    ITransport::RequestHandler requestHandler;
    ITransport::NotificationHandler notificationHandler;
    ITransport::ErrorHandler errorHandler;
};

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a parsed JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const JSONValue& message) = 0;

    //====================================================================================================
    // route
    // Purpose: Parses and routes one frame payload.
    // Returns:
    //   The serialized response to write back: the handler's response for requests, a -32700 error for
    //   malformed JSON, or a -32600 error for JSON that is not a JSON-RPC message. std::nullopt for
    //   notifications and inbound responses.
    //====================================================================================================
    virtual net::awaitable<std::optional<std::string>> route(const std::string& json, RouterHandlers& handlers) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcptest

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: MCP protocol session: lifecycle handshake, capability negotiation and method routing
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mcptest/JSONRPCTypes.h"
#include "mcptest/Protocol.h"
#include "mcptest/ToolRegistry.h"
#include "mcptest/Transport.h"

namespace mcptest {

//==========================================================================================================
// SessionState
// Purpose: Lifecycle of the single client session.
//   Uninitialized --initialize--> Initializing --notifications/initialized--> Initialized
//==========================================================================================================
enum class SessionState {
    Uninitialized,
    Initializing,
    Initialized
};

const char* sessionStateName(SessionState state);

//==========================================================================================================
// Server
// Purpose: Serves one MCP session over a transport using a fixed tool registry.
// Notes:
//   - ping is answered in every state; other requests before the handshake completes are rejected with
//     -32600 and the session stays usable.
//   - The registry is borrowed and must outlive the server.
//==========================================================================================================
class Server {
public:
    //==========================================================================================================
    // Constructs the session.
    // Args:
    //   serverInfo: Name and version reported in the initialize result.
    //   registry: Tools served by tools/list and tools/call.
    //==========================================================================================================
    Server(Implementation serverInfo, const ToolRegistry& registry);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Wires the transport handlers to this session and runs the transport loop to completion.
    // Returns:
    //   Awaitable completing at end of input or Close(). TransportError propagates to the caller.
    //==========================================================================================================
    net::awaitable<void> Run(ITransport& transport);

    //==========================================================================================================
    // Handles one JSON-RPC request and produces its response (result or error). Never returns null.
    //==========================================================================================================
    net::awaitable<std::unique_ptr<JSONRPCResponse>> HandleJSONRPC(const JSONRPCRequest& req);

    //==========================================================================================================
    // Handles one inbound notification (notifications/initialized advances the lifecycle).
    //==========================================================================================================
    void HandleNotification(const JSONRPCNotification& notification);

    SessionState GetSessionState() const;

    // Client implementation reported in initialize (empty before the handshake).
    Implementation GetClientInfo() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcptest

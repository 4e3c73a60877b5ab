//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces for the server side of an MCP session
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/system/system_error.hpp>

namespace mcptest {

namespace net = boost::asio;

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;

//==========================================================================================================
// TransportError
// Purpose: Unrecoverable I/O failure on the transport (anything other than end of input). Propagates out
//          of ITransport::Run so the process can report a crash.
//==========================================================================================================
class TransportError : public boost::system::system_error {
public:
    using boost::system::system_error::system_error;
};

//==========================================================================================================
// MCP Transport interface
// Purpose: Single-session, server-side transport. The transport owns framing and I/O; it hands every
//          decoded request to the request handler and writes back whatever response that handler returns.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Runs the read/dispatch/write loop until end of input or Close().
    // Returns:
    //   Awaitable that completes when the loop stops. Throws TransportError on I/O failure.
    //==========================================================================================================
    virtual net::awaitable<void> Run() = 0;

    //==========================================================================================================
    // Stops the loop and cancels pending I/O. Safe to call from a signal handler completion.
    //==========================================================================================================
    virtual void Close() = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    //==========================================================================================================
    // Registers a callback for incoming notifications.
    //==========================================================================================================
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    //==========================================================================================================
    // Registers the request handler. The handler may suspend (e.g. on a timer); the transport does not read
    // the next frame until the returned awaitable completes and its response has been written.
    //==========================================================================================================
    using RequestHandler = std::function<net::awaitable<std::unique_ptr<JSONRPCResponse>>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler for recoverable protocol errors (bad frames, unrecognized messages).
    //==========================================================================================================
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific "key=value; key=value" settings.
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

} // namespace mcptest

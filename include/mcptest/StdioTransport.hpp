//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based transport
//==========================================================================================================
#pragma once

#include "mcptest/ContentFramer.h"
#include "mcptest/Transport.h"
#include <memory>
#include <cstdint>
#include <unistd.h>

#include <utility>

#include <boost/asio/any_io_executor.hpp>

namespace mcptest {

//==========================================================================================================
// StdioTransport
// Purpose: JSON-RPC transport over a pair of file descriptors (stdin/stdout by default), driven by
//          Boost.Asio on the caller's executor. Frames are processed strictly one at a time.
// Notes:
//   - The descriptors are borrowed: they are released, never closed, when the transport is destroyed.
//   - Outbound frames use the same framing as the inbound stream.
//==========================================================================================================
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(net::any_io_executor executor,
                            int inputFd = STDIN_FILENO,
                            int outputFd = STDOUT_FILENO);
    virtual ~StdioTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Runs the read/dispatch/write loop. Completes on EOF or Close(); throws TransportError on I/O failure.
    //==========================================================================================================
    net::awaitable<void> Run() override;

    //==========================================================================================================
    // Stops the loop after the current frame and cancels a pending read.
    //==========================================================================================================
    void Close() override;

    //==========================================================================================================
    // Registers handlers for incoming notifications, requests, and errors.
    //==========================================================================================================
    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetFramingMode
    // Purpose: Select inbound framing. Auto (default) detects it from the first frame.
    //==========================================================================================================
    void SetFramingMode(FramingMode mode);

    //==========================================================================================================
    // SetMaxFrameBytes
    // Purpose: Frames larger than this are dropped with a warning.
    //==========================================================================================================
    void SetMaxFrameBytes(std::size_t maxBytes);

    // Number of response frames written so far.
    std::uint64_t FramesWritten() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Factory for creating stdio transports.
// Config keys (separated by ';' or whitespace):
//   framing=auto|newline|content-length
//   max_frame_bytes=<n>
//   input_fd=<fd>, output_fd=<fd>
//==========================================================================================================
class StdioTransportFactory : public ITransportFactory {
public:
    explicit StdioTransportFactory(net::any_io_executor executor);
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;

private:
    net::any_io_executor executor;
};

} // namespace mcptest

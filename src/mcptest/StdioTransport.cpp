//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: Stdio transport: cooperative read-decode-dispatch-encode-write loop on Boost.Asio
//==========================================================================================================

#include "mcptest/StdioTransport.hpp"
#include "mcptest/JsonRpcMessageRouter.h"
#include "mcptest/JSONRPCTypes.h"
#include "logging/Logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>

#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

namespace mcptest {

namespace {
bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c) != 0; });
}
} // namespace

class StdioTransport::Impl {
public:
    net::posix::stream_descriptor input;
    net::posix::stream_descriptor output;
    FramingMode framingMode{FramingMode::Auto};
    std::size_t maxFrameBytes{DEFAULT_MAX_FRAME_BYTES};
    std::unique_ptr<IContentFramer> framer;
    std::unique_ptr<IJsonRpcMessageRouter> router;
    RouterHandlers handlers;
    bool connected{false};
    std::uint64_t framesWritten{0};

    Impl(net::any_io_executor executor, int inputFd, int outputFd)
        : input(executor, inputFd),
          output(executor, outputFd),
          router(MakeDefaultJsonRpcMessageRouter()) {}

    ~Impl() {
        // Borrowed descriptors: hand them back without closing
        input.release();
        output.release();
    }

    void reportError(const std::string& msg) {
        if (handlers.errorHandler) {
            handlers.errorHandler(msg);
        }
    }

    net::awaitable<void> writeFrame(const std::string& payload) {
        const std::string frame = framer->encode(payload);
        boost::system::error_code ec;
        co_await net::async_write(output, net::buffer(frame), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            connected = false;
            LOG_ERROR("StdioTransport: write error ({})", ec.message());
            throw TransportError(ec, "StdioTransport: write failed");
        }
        ++framesWritten;
        LOG_DEBUG("Sent framed response ({} bytes)", frame.size());
    }

    net::awaitable<void> handleFrame(const std::string& payload) {
        if (isBlank(payload)) {
            co_return;
        }
        LOG_DEBUG("Received message: {}", payload);
        std::optional<std::string> out = co_await router->route(payload, handlers);
        if (out.has_value()) {
            co_await writeFrame(out.value());
        }
    }

    // Processes every complete frame currently buffered, one at a time.
    net::awaitable<void> drainFrames(std::string& buffer) {
        while (connected && !buffer.empty()) {
            IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
            if (r.bytesConsumed > 0) {
                buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            }
            switch (r.status) {
                case IContentFramer::DecodeStatus::Ok:
                    co_await handleFrame(r.payload.value_or(std::string{}));
                    break;
                case IContentFramer::DecodeStatus::Incomplete:
                    if (r.bytesConsumed == 0) {
                        co_return;
                    }
                    break;
                case IContentFramer::DecodeStatus::InvalidHeader:
                    LOG_WARN("StdioTransport: dropped frame with invalid header ({} bytes)", r.bytesConsumed);
                    reportError("StdioTransport: invalid frame header");
                    break;
                case IContentFramer::DecodeStatus::BodyTooLarge:
                    LOG_WARN("StdioTransport: dropped oversized frame (max={})", maxFrameBytes);
                    reportError("StdioTransport: frame too large");
                    break;
            }
            if (r.status != IContentFramer::DecodeStatus::Ok && r.bytesConsumed == 0) {
                co_return;
            }
        }
    }
};

StdioTransport::StdioTransport(net::any_io_executor executor, int inputFd, int outputFd)
    : pImpl(std::make_unique<Impl>(std::move(executor), inputFd, outputFd)) { FUNC_SCOPE(); }
StdioTransport::~StdioTransport() { FUNC_SCOPE(); }

net::awaitable<void> StdioTransport::Run() {
    FUNC_SCOPE();
    LOG_INFO("Starting StdioTransport (framing={}, max_frame_bytes={})",
             framingModeName(pImpl->framingMode), pImpl->maxFrameBytes);
    pImpl->framer = MakeFramer(pImpl->framingMode, pImpl->maxFrameBytes);
    pImpl->connected = true;

    std::string buffer;
    std::array<char, 8192> chunk{};
    while (pImpl->connected) {
        co_await pImpl->drainFrames(buffer);
        if (!pImpl->connected) {
            break;
        }
        boost::system::error_code ec;
        std::size_t n = co_await pImpl->input.async_read_some(
            net::buffer(chunk), net::redirect_error(net::use_awaitable, ec));
        if (ec == net::error::eof) {
            LOG_INFO("StdioTransport: EOF on input");
            // A last newline-delimited message may arrive without its terminator
            if (pImpl->framingMode != FramingMode::ContentLength && !isBlank(buffer)) {
                buffer.push_back('\n');
                co_await pImpl->drainFrames(buffer);
            }
            if (!isBlank(buffer)) {
                LOG_WARN("StdioTransport: discarding {} bytes of incomplete frame at EOF", buffer.size());
            }
            break;
        }
        if (ec == net::error::operation_aborted && !pImpl->connected) {
            break;
        }
        if (ec) {
            pImpl->connected = false;
            LOG_ERROR("StdioTransport: read error ({})", ec.message());
            throw TransportError(ec, "StdioTransport: read failed");
        }
        buffer.append(chunk.data(), n);
    }
    pImpl->connected = false;
    LOG_DEBUG("StdioTransport loop finished ({} frames written)", pImpl->framesWritten);
}

void StdioTransport::Close() {
    FUNC_SCOPE();
    LOG_INFO("Closing StdioTransport");
    pImpl->connected = false;
    boost::system::error_code ec;
    pImpl->input.cancel(ec);
    if (ec) {
        LOG_DEBUG("StdioTransport: cancel on input failed ({})", ec.message());
    }
}

void StdioTransport::SetNotificationHandler(NotificationHandler handler) {
    pImpl->handlers.notificationHandler = std::move(handler);
}

void StdioTransport::SetRequestHandler(RequestHandler handler) {
    pImpl->handlers.requestHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    pImpl->handlers.errorHandler = std::move(handler);
}

void StdioTransport::SetFramingMode(FramingMode mode) {
    pImpl->framingMode = mode;
}

void StdioTransport::SetMaxFrameBytes(std::size_t maxBytes) {
    pImpl->maxFrameBytes = maxBytes == 0 ? DEFAULT_MAX_FRAME_BYTES : maxBytes;
}

std::uint64_t StdioTransport::FramesWritten() const {
    return pImpl->framesWritten;
}

StdioTransportFactory::StdioTransportFactory(net::any_io_executor executor)
    : executor(std::move(executor)) {}

std::unique_ptr<ITransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    // Parse key=value pairs separated by ';' or whitespace
    auto parseSize = [](const std::string& s, std::size_t& out) -> bool {
        std::size_t v = 0;
        auto res = std::from_chars(s.data(), s.data() + s.size(), v);
        if (s.empty() || res.ec != std::errc() || res.ptr != s.data() + s.size()) return false;
        out = v;
        return true;
    };
    int inputFd = STDIN_FILENO;
    int outputFd = STDOUT_FILENO;
    std::optional<FramingMode> framing;
    std::optional<std::size_t> maxFrameBytes;
    std::string token;
    for (std::size_t i = 0; i < config.size();) {
        // Skip separators and spaces
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        token = config.substr(start, i - start);
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            LOG_WARN("StdioTransportFactory: ignoring malformed config token '{}'", token);
            continue;
        }
        auto key = token.substr(0, eq);
        auto val = token.substr(eq + 1);
        std::size_t v = 0;
        if (key == "framing") {
            framing = framingModeFromString(val);
            if (!framing.has_value()) LOG_WARN("StdioTransportFactory: unknown framing '{}'", val);
        } else if (key == "max_frame_bytes") {
            if (parseSize(val, v)) maxFrameBytes = v;
        } else if (key == "input_fd") {
            if (parseSize(val, v)) inputFd = static_cast<int>(v);
        } else if (key == "output_fd") {
            if (parseSize(val, v)) outputFd = static_cast<int>(v);
        } else {
            LOG_WARN("StdioTransportFactory: unknown config key '{}'", key);
        }
    }
    auto t = std::make_unique<StdioTransport>(executor, inputFd, outputFd);
    if (framing.has_value()) t->SetFramingMode(framing.value());
    if (maxFrameBytes.has_value()) t->SetMaxFrameBytes(maxFrameBytes.value());
    return t;
}

} // namespace mcptest

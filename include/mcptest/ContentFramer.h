//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on the stdio stream (newline-delimited and Content-Length)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcptest {

//========================================================================================================
// IContentFramer
// Purpose: Splits a byte stream into JSON-RPC payloads and wraps outbound payloads into frames.
// Notes:
//   - Framers may keep state between calls (e.g. to discard the tail of an oversized frame), so every
//     DecodeResult::bytesConsumed must be dropped from the front of the buffer by the caller regardless
//     of the status.
//   - Incomplete means "read more bytes"; bytesConsumed may still be non-zero in that case.
//========================================================================================================
class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// Wire framing selection
enum class FramingMode {
    Auto,
    Newline,
    ContentLength
};

// Parses "auto", "newline"/"ndjson", "content-length" (case-insensitive). Unknown values yield nullopt.
std::optional<FramingMode> framingModeFromString(const std::string& s);
const char* framingModeName(FramingMode mode);

constexpr std::size_t DEFAULT_MAX_FRAME_BYTES = 1024 * 1024;

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = DEFAULT_MAX_FRAME_BYTES);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = DEFAULT_MAX_FRAME_BYTES);

//========================================================================================================
// MakeAutoDetectFramer
// Purpose: Framer that picks newline or Content-Length framing from the first inbound bytes and then
//          encodes outbound frames the same way. Until detection happens, encode() uses newline framing.
//========================================================================================================
std::unique_ptr<IContentFramer> MakeAutoDetectFramer(std::size_t maxFrameBytes = DEFAULT_MAX_FRAME_BYTES);

// Factory by mode
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes = DEFAULT_MAX_FRAME_BYTES);

} // namespace mcptest

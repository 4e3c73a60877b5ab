//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NewlineFramer.cpp
// Purpose: Newline-delimited JSON framer (MCP stdio default) and the auto-detecting framer
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcptest/ContentFramer.h"

namespace mcptest {

namespace {
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t eol = buffer.find('\n');
        if (discarding) {
            // Still inside an oversized line: drop everything up to and including its newline
            if (eol == std::string::npos) {
                return { DecodeStatus::Incomplete, std::nullopt, buffer.size() };
            }
            discarding = false;
            return { DecodeStatus::Incomplete, std::nullopt, eol + 1 };
        }
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineLength) {
                LOG_WARN("Newline frame exceeds limits (buffered={} max={}); discarding until next newline",
                         buffer.size(), maxLineLength);
                discarding = true;
                return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        std::size_t len = eol;
        if (len > 0 && buffer[len - 1] == '\r') {
            --len;
        }
        if (len > maxLineLength) {
            LOG_WARN("Newline frame of {} bytes exceeds max {}", len, maxLineLength);
            return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
        }
        return { DecodeStatus::Ok, std::make_optional(buffer.substr(0, len)), eol + 1 };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
        }
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
    bool discarding{false};
};

class AutoDetectFramer : public IContentFramer {
public:
    explicit AutoDetectFramer(std::size_t maxBytes) : maxFrameBytes(maxBytes) {}

    std::string encode(const std::string& payload) override {
        if (!inner) {
            return MakeNewlineFramer(maxFrameBytes)->encode(payload);
        }
        return inner->encode(payload);
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        if (!inner) {
            auto mode = detect(buffer);
            if (!mode.has_value()) {
                return { DecodeStatus::Incomplete, std::nullopt, 0 };
            }
            LOG_DEBUG("Detected stdio framing: {}", framingModeName(mode.value()));
            inner = MakeFramer(mode.value(), maxFrameBytes);
        }
        return inner->tryDecodeEx(buffer);
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0) {
            buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
        }
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    // A stream that opens with a Content-Length header uses header framing; anything else is
    // treated as newline-delimited JSON (malformed lines then surface as parse errors).
    static std::optional<FramingMode> detect(const std::string& buffer) {
        static const std::string header = "content-length";
        std::size_t start = 0;
        while (start < buffer.size() && std::isspace(static_cast<unsigned char>(buffer[start]))) {
            ++start;
        }
        if (start >= buffer.size()) {
            return std::nullopt;
        }
        const std::size_t avail = std::min(buffer.size() - start, header.size());
        for (std::size_t k = 0; k < avail; ++k) {
            if (std::tolower(static_cast<unsigned char>(buffer[start + k])) != header[k]) {
                return FramingMode::Newline;
            }
        }
        if (avail < header.size()) {
            return std::nullopt;
        }
        return FramingMode::ContentLength;
    }

    std::size_t maxFrameBytes;
    std::unique_ptr<IContentFramer> inner;
};
} // namespace

std::optional<FramingMode> framingModeFromString(const std::string& s) {
    std::string v; v.reserve(s.size());
    for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "auto") return FramingMode::Auto;
    if (v == "newline" || v == "ndjson") return FramingMode::Newline;
    if (v == "content-length" || v == "content_length") return FramingMode::ContentLength;
    return std::nullopt;
}

const char* framingModeName(FramingMode mode) {
    switch (mode) {
        case FramingMode::Auto: return "auto";
        case FramingMode::Newline: return "newline";
        case FramingMode::ContentLength: return "content-length";
    }
    return "auto";
}

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeAutoDetectFramer(std::size_t maxFrameBytes) {
    return std::make_unique<AutoDetectFramer>(maxFrameBytes);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes) {
    switch (mode) {
        case FramingMode::Newline: return MakeNewlineFramer(maxFrameBytes);
        case FramingMode::ContentLength: return MakeContentLengthFramer(maxFrameBytes);
        case FramingMode::Auto: break;
    }
    return MakeAutoDetectFramer(maxFrameBytes);
}

} // namespace mcptest

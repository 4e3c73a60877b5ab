//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length based framer (LSP-style headers) for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcptest/ContentFramer.h"

namespace mcptest {

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        // Drop the body of a previously rejected frame before looking for the next header
        std::size_t skipped = 0;
        if (pendingSkip > 0) {
            skipped = std::min(pendingSkip, buffer.size());
            pendingSkip -= skipped;
            if (pendingSkip > 0 || skipped == buffer.size()) {
                return { DecodeStatus::Incomplete, std::nullopt, skipped };
            }
        }
        DecodeResult r = decodeAt(buffer, skipped);
        r.bytesConsumed += skipped;
        return r;
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
    // Decodes one frame starting at offset; bytesConsumed is relative to offset.
    DecodeResult decodeAt(const std::string& buffer, std::size_t offset) {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep, offset);
        if (headerEnd == std::string::npos) {
            if (buffer.size() - offset > MaxHeaderBytes) {
                LOG_WARN("Content-Length header block exceeds {} bytes; dropping", MaxHeaderBytes);
                return { DecodeStatus::InvalidHeader, std::nullopt, buffer.size() - offset };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size() - offset;

        std::size_t pos = offset;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                // Stray blank lines between frames end up in front of the first header name
                name.erase(name.begin(), std::find_if(name.begin(), name.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
                if (name == "content-length") {
                    unsigned long long v64 = 0;
                    auto res = std::from_chars(value.data(), value.data() + value.size(), v64);
                    if (value.empty() || res.ec != std::errc() || res.ptr != value.data() + value.size()) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max()) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        pendingSkip = static_cast<std::size_t>(std::min<unsigned long long>(v64, std::numeric_limits<std::size_t>::max()));
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() - offset < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }

        std::string payload = buffer.substr(offset + headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal };
    }

    static constexpr std::size_t MaxHeaderBytes = 8192;
    std::size_t maxContentLength;
    std::size_t pendingSkip{0};
};
} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

} // namespace mcptest

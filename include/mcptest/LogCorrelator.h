//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogCorrelator.h
// Purpose: Rebuilds request/response pairs from the server's structured log stream and renders them as
//          a compact, periodically re-headed table
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "mcptest/JSONRPCTypes.h"

namespace mcptest {

//==========================================================================================================
// Palette
// Purpose: ANSI escape sequences used by the viewer; all empty when color is disabled.
//==========================================================================================================
struct Palette {
    std::string reset;
    std::string bold;
    std::string dim;
    std::string cyan;
    std::string green;
    std::string yellow;
    std::string red;
    std::string gray;

    static Palette ansi();
    static Palette plain();
};

//==========================================================================================================
// PendingRequestState
// Purpose: The single in-flight call remembered between "MCP tool called" and its completion event.
//==========================================================================================================
struct PendingRequestState {
    std::string timestamp;  // HH:MM:SS
    std::string tool;
    JSONValue::Object arguments;
};

// ISO-8601 timestamp to HH:MM:SS; unparsable input yields its first 8 characters.
std::string formatLogTimestamp(const std::string& ts);

// Space separated k=v summary. Strings appear unquoted, other values as compact JSON.
std::string formatArguments(const JSONValue::Object& args);

// Pads with spaces to width code points (never truncates).
std::string padRight(const std::string& s, std::size_t width);

// First maxChars code points of s.
std::string truncateCodePoints(const std::string& s, std::size_t maxChars);

//==========================================================================================================
// RequestTracker
// Purpose: Single-slot state machine over parsed log records.
//   "MCP tool called"     -> remember {timestamp, tool, arguments} (silently replaces an older entry)
//   "MCP tool completed"  -> success line, slot cleared
//   "MCP tool failed"     -> failure line, slot cleared
//   "MCP server starting" -> version banner
//   "MCP server stopped"  -> stopped line
// Returns:
//   processLog yields the rendered text for records that produce output, std::nullopt otherwise.
//==========================================================================================================
class RequestTracker {
public:
    explicit RequestTracker(Palette palette = Palette::ansi());

    std::optional<std::string> processLog(const JSONValue& record);

    const std::optional<PendingRequestState>& pending() const { return current; }

private:
    std::string successLine(const std::string& ts, const std::string& tool, const JSONValue::Object& args,
                            const JSONValue& record) const;
    std::string failureLine(const std::string& ts, const std::string& tool, const JSONValue& record) const;

    Palette palette;
    std::optional<PendingRequestState> current;
};

//==========================================================================================================
// LogViewer
// Purpose: Feeds raw log lines through a RequestTracker and writes the table to an output stream,
//          reprinting the column header after every 20 rendered lines.
//==========================================================================================================
class LogViewer {
public:
    static constexpr std::size_t HEADER_INTERVAL = 20;

    //======================================================================================================
    // Args:
    //   out: Destination stream (flushed after every rendered line).
    //   sourceLabel: Header label, e.g. "Container".
    //   sourceName: Header value, e.g. the container name.
    //   color: Enables ANSI colors.
    //======================================================================================================
    LogViewer(std::ostream& out, std::string sourceLabel, std::string sourceName, bool color);

    void printHeader();

    // Processes one raw line; returns true when it produced output. Blank lines, protocol frames and
    // anything that is not a JSON object are dropped silently.
    bool processLine(const std::string& line);

    std::size_t renderedLines() const { return rendered; }

private:
    std::ostream& out;
    std::string sourceLabel;
    std::string sourceName;
    Palette palette;
    RequestTracker tracker;
    std::size_t rendered{0};
};

} // namespace mcptest

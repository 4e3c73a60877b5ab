//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogCorrelator.cpp
// Purpose: Log record correlation and table rendering for the log viewer
//==========================================================================================================

#include "mcptest/LogCorrelator.h"

#include <cctype>

#include <fmt/format.h>

namespace mcptest {

namespace {
constexpr const char* HeavyRule = "═";  // ═
constexpr const char* LightRule = "─";  // ─
constexpr std::size_t RuleWidth = 80;

std::string repeat(const char* unit, std::size_t n) {
    std::string out;
    for (std::size_t i = 0; i < n; ++i) out += unit;
    return out;
}

std::string stringField(const JSONValue& record, const char* key) {
    const JSONValue* v = record.find(key);
    if (v == nullptr || !v->isString()) return std::string();
    return std::get<std::string>(v->value);
}

// Strings verbatim, everything else as compact JSON.
std::string display(const JSONValue& v) {
    if (v.isString()) return std::get<std::string>(v.value);
    return serializeJSONValue(v);
}

double numberField(const JSONValue& record, const char* key) {
    const JSONValue* v = record.find(key);
    if (v == nullptr) return 0.0;
    if (std::holds_alternative<double>(v->value)) return std::get<double>(v->value);
    if (std::holds_alternative<int64_t>(v->value)) return static_cast<double>(std::get<int64_t>(v->value));
    return 0.0;
}

int64_t integerField(const JSONValue& record, const char* key) {
    const JSONValue* v = record.find(key);
    if (v == nullptr) return 0;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) return static_cast<int64_t>(std::get<double>(v->value));
    return 0;
}

bool digitsAt(const std::string& s, std::size_t pos, std::size_t count) {
    if (pos + count > s.size()) return false;
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}
} // namespace

Palette Palette::ansi() {
    return Palette{"\033[0m", "\033[1m", "\033[2m", "\033[36m", "\033[32m", "\033[33m", "\033[31m", "\033[90m"};
}

Palette Palette::plain() {
    return Palette{};
}

std::string formatLogTimestamp(const std::string& ts) {
    const bool hasDate = digitsAt(ts, 0, 4) && ts.size() >= 10 && ts[4] == '-' && digitsAt(ts, 5, 2) &&
                         ts[7] == '-' && digitsAt(ts, 8, 2);
    if (hasDate) {
        if (ts.size() == 10) {
            return "00:00:00";
        }
        if ((ts[10] == 'T' || ts[10] == ' ') && digitsAt(ts, 11, 2) && ts.size() > 13 && ts[13] == ':' &&
            digitsAt(ts, 14, 2)) {
            if (ts.size() > 16 && ts[16] == ':' && digitsAt(ts, 17, 2)) {
                return ts.substr(11, 8);
            }
            return ts.substr(11, 5) + ":00";
        }
    }
    return ts.substr(0, 8);
}

std::string formatArguments(const JSONValue::Object& args) {
    std::string out;
    for (const auto& [key, value] : args) {
        if (!out.empty()) out.push_back(' ');
        out += key;
        out.push_back('=');
        out += value ? display(*value) : std::string("null");
    }
    return out;
}

std::string padRight(const std::string& s, std::size_t width) {
    std::size_t len = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++len;
    }
    if (len >= width) return s;
    return s + std::string(width - len, ' ');
}

std::string truncateCodePoints(const std::string& s, std::size_t maxChars) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
            if (count == maxChars) return s.substr(0, i);
            ++count;
        }
    }
    return s;
}

RequestTracker::RequestTracker(Palette palette) : palette(std::move(palette)) {}

std::string RequestTracker::successLine(const std::string& ts, const std::string& tool,
                                        const JSONValue::Object& args, const JSONValue& record) const {
    const Palette& p = palette;
    return fmt::format("{}{}{} {}✓{} {}{}{} {}{}{} {}{:>6.2f}ms{} {}{:>4d}b{}",
                       p.gray, ts, p.reset,
                       p.green, p.reset,
                       p.bold, padRight(tool, 20), p.reset,
                       p.cyan, padRight(formatArguments(args), 25), p.reset,
                       p.yellow, numberField(record, "duration_ms"), p.reset,
                       p.dim, integerField(record, "response_length"), p.reset);
}

std::string RequestTracker::failureLine(const std::string& ts, const std::string& tool, const JSONValue& record) const {
    const Palette& p = palette;
    return fmt::format("{}{}{} {}✗{} {}{}{} {}{}{}",
                       p.gray, ts, p.reset,
                       p.red, p.reset,
                       p.bold, padRight(tool, 20), p.reset,
                       p.red, truncateCodePoints(stringField(record, "error"), 50), p.reset);
}

std::optional<std::string> RequestTracker::processLog(const JSONValue& record) {
    const std::string message = stringField(record, "message");
    std::string rawTs = stringField(record, "timestamp");
    if (rawTs.empty()) {
        rawTs = stringField(record, "asctime");
    }
    const std::string ts = formatLogTimestamp(rawTs);
    std::string eventTool = stringField(record, "tool_name");
    if (eventTool.empty()) {
        eventTool = "?";
    }

    if (contains(message, "MCP tool called")) {
        PendingRequestState state;
        state.timestamp = ts;
        state.tool = eventTool;
        if (const JSONValue* args = record.find("arguments"); args != nullptr && args->isObject()) {
            state.arguments = std::get<JSONValue::Object>(args->value);
        }
        current = std::move(state);
        return std::nullopt;
    }

    if (contains(message, "MCP tool completed")) {
        std::string line;
        if (current.has_value()) {
            line = successLine(current->timestamp, current->tool, current->arguments, record);
        } else {
            // Start context lost (e.g. overwritten); fall back to the event's own fields
            line = successLine(ts, eventTool, JSONValue::Object{}, record);
        }
        current.reset();
        return line;
    }

    if (contains(message, "MCP tool failed")) {
        std::string line = current.has_value()
            ? failureLine(current->timestamp, current->tool, record)
            : failureLine(ts, eventTool, record);
        current.reset();
        return line;
    }

    if (contains(message, "Server Starting") || contains(message, "MCP server starting")) {
        const JSONValue* v = record.find("version");
        const std::string version = v != nullptr ? display(*v) : std::string("?");
        return fmt::format("\n{}{}\n\U0001F680 MCP Server v{}\n{}{}\n",
                           palette.green, repeat(HeavyRule, RuleWidth), version,
                           repeat(HeavyRule, RuleWidth), palette.reset);
    }

    if (contains(message, "MCP server stopped")) {
        return fmt::format("{}⏹  Stopped{}", palette.yellow, palette.reset);
    }

    return std::nullopt;
}

LogViewer::LogViewer(std::ostream& out, std::string sourceLabel, std::string sourceName, bool color)
    : out(out),
      sourceLabel(std::move(sourceLabel)),
      sourceName(std::move(sourceName)),
      palette(color ? Palette::ansi() : Palette::plain()),
      tracker(palette) {}

void LogViewer::printHeader() {
    const std::string rule = repeat(LightRule, RuleWidth);
    out << '\n' << palette.dim << rule << palette.reset << '\n';
    out << palette.bold << "MCP Server Log Viewer" << palette.reset << " - " << sourceLabel << ": "
        << palette.cyan << sourceName << palette.reset << '\n';
    out << palette.dim << "Time     St Tool                 Arguments                  Duration Size"
        << palette.reset << '\n';
    out << palette.dim << rule << palette.reset << '\n';
    out.flush();
}

bool LogViewer::processLine(const std::string& line) {
    std::size_t begin = 0;
    std::size_t end = line.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(line[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
    if (begin == end) {
        return false;
    }
    const std::string trimmed = line.substr(begin, end - begin);
    if (trimmed.rfind("{\"jsonrpc\":", 0) == 0) {
        return false;
    }

    JSONValue record;
    try {
        record = parseJSONValue(trimmed);
    } catch (const JSONParseError&) {
        return false;
    }
    if (!record.isObject()) {
        return false;
    }

    std::optional<std::string> rendered = tracker.processLog(record);
    if (!rendered.has_value()) {
        return false;
    }
    out << rendered.value() << '\n';
    out.flush();
    ++this->rendered;
    if (this->rendered % HEADER_INTERVAL == 0) {
        printHeader();
    }
    return true;
}

} // namespace mcptest

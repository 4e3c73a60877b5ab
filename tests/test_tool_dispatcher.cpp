//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_dispatcher.cpp
// Purpose: GoogleTests for tool dispatch: lifecycle log events and failure reporting
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <vector>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "logging/Logger.h"
#include "mcptest/ToolDispatcher.h"
#include "mcptest/Tools.h"

using namespace mcptest;

namespace {

class ToolDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::setOutputStream(&sink);
        Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    }
    void TearDown() override { Logger::setOutputStream(nullptr); }

    CallToolResult dispatch(const ToolRegistry& registry, const std::string& name, const JSONValue& args) {
        net::io_context ioc;
        ToolDispatcher dispatcher(registry);
        auto fut = net::co_spawn(ioc, dispatcher.Dispatch(name, args), net::use_future);
        ioc.run();
        return fut.get();
    }

    static std::string textOf(const CallToolResult& result) {
        if (result.content.size() != 1) return std::string();
        const JSONValue* text = result.content.front().find("text");
        return (text != nullptr && text->isString()) ? std::get<std::string>(text->value) : std::string();
    }

    // Tool lifecycle records only (messages starting with "MCP tool" or "OUTBOUND").
    std::vector<JSONValue> events() const {
        std::vector<JSONValue> out;
        std::istringstream in(sink.str());
        std::string line;
        while (std::getline(in, line)) {
            JSONValue rec = parseJSONValue(line);
            const JSONValue* logger = rec.find("logger_name");
            if (logger != nullptr && std::get<std::string>(logger->value) == SERVER_LOGGER_NAME) {
                out.push_back(rec);
            }
        }
        return out;
    }

    static std::string str(const JSONValue& rec, const char* key) {
        const JSONValue* v = rec.find(key);
        return (v != nullptr && v->isString()) ? std::get<std::string>(v->value) : std::string();
    }

    std::ostringstream sink;
};

ToolDescriptor throwingTool() {
    ToolDescriptor d;
    d.name = "explode";
    d.description = "always fails";
    d.inputSchema = parseJSONValue(R"({"type":"object","properties":{},"required":[]})");
    d.handler = [](const JSONValue::Object&) -> net::awaitable<JSONValue> {
        throw std::runtime_error("boom");
        co_return JSONValue{};
    };
    return d;
}

} // namespace

TEST_F(ToolDispatcherTest, SuccessfulCallLogsCalledCompletedAndOutbound) {
    ToolRegistry registry = MakeDefaultToolRegistry();
    CallToolResult result = dispatch(registry, ToolNames::Echo, parseJSONValue(R"({"message":"hi"})"));
    const std::string text = textOf(result);
    ASSERT_FALSE(text.empty());
    EXPECT_FALSE(result.isError);

    auto evs = events();
    ASSERT_EQ(evs.size(), 3u);
    EXPECT_EQ(str(evs[0], "message"), "MCP tool called");
    EXPECT_EQ(str(evs[0], "tool_name"), "echo");
    ASSERT_NE(evs[0].find("arguments"), nullptr);
    EXPECT_EQ(str(*evs[0].find("arguments"), "message"), "hi");

    EXPECT_EQ(str(evs[1], "message"), "MCP tool completed");
    EXPECT_EQ(std::get<int64_t>(evs[1].find("response_length")->value), static_cast<int64_t>(text.size()));
    EXPECT_TRUE(std::holds_alternative<double>(evs[1].find("duration_ms")->value));

    EXPECT_EQ(str(evs[2], "message"), "OUTBOUND JSON-RPC RESPONSE");
    EXPECT_EQ(str(evs[2], "response_payload"), text);
    EXPECT_TRUE(std::get<bool>(evs[2].find("debug_outbound_message")->value));
}

TEST_F(ToolDispatcherTest, ResultTextIsIndentedJson) {
    ToolRegistry registry = MakeDefaultToolRegistry();
    const std::string text = textOf(dispatch(registry, ToolNames::ServerStatus, JSONValue{}));
    EXPECT_EQ(text.rfind("{\n  \"", 0), 0u);
    EXPECT_NO_THROW(parseJSONValue(text));
}

TEST_F(ToolDispatcherTest, NonAsciiResultTextIsEscapedAndMeasured) {
    ToolRegistry registry = MakeDefaultToolRegistry();
    const std::string text =
        textOf(dispatch(registry, ToolNames::Echo, parseJSONValue("{\"message\":\"caf\xC3\xA9\"}")));
    EXPECT_NE(text.find("\"echoed_message\": \"caf\\u00e9\""), std::string::npos);
    for (char c : text) {
        EXPECT_LT(static_cast<unsigned char>(c), 0x80);
    }
    auto evs = events();
    ASSERT_EQ(evs.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(evs[1].find("response_length")->value), static_cast<int64_t>(text.size()));
}

TEST_F(ToolDispatcherTest, UnknownToolIsReportedAsText) {
    ToolRegistry registry = MakeDefaultToolRegistry();
    CallToolResult result = dispatch(registry, "nope", JSONValue{});
    EXPECT_EQ(textOf(result), "Error: Unknown tool: nope");

    auto evs = events();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(str(evs[0], "message"), "MCP tool called");
    EXPECT_TRUE(evs[0].find("arguments")->isObject());
    EXPECT_EQ(str(evs[1], "message"), "MCP tool failed");
    EXPECT_EQ(str(evs[1], "level"), "ERROR");
    EXPECT_EQ(str(evs[1], "tool_name"), "nope");
    EXPECT_EQ(str(evs[1], "error"), "Unknown tool: nope");
    EXPECT_NE(evs[1].find("duration_ms"), nullptr);
}

TEST_F(ToolDispatcherTest, ArgumentErrorsBecomeErrorText) {
    ToolRegistry registry = MakeDefaultToolRegistry();
    CallToolResult result = dispatch(registry, ToolNames::Echo, parseJSONValue("{}"));
    EXPECT_EQ(textOf(result), "Error: Missing required argument: message");
    auto evs = events();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(str(evs[1], "message"), "MCP tool failed");
}

TEST_F(ToolDispatcherTest, HandlerExceptionBecomesErrorText) {
    std::vector<ToolDescriptor> tools;
    tools.push_back(throwingTool());
    ToolRegistry registry(std::move(tools));
    CallToolResult result = dispatch(registry, "explode", JSONValue{});
    EXPECT_EQ(textOf(result), "Error: boom");
    auto evs = events();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(str(evs[1], "error"), "boom");
}

TEST(RoundDuration, RoundsToTwoDecimals) {
    EXPECT_DOUBLE_EQ(roundDurationMs(12.3456), 12.35);
    EXPECT_DOUBLE_EQ(roundDurationMs(0.004), 0.0);
}

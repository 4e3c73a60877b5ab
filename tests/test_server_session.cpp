//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_session.cpp
// Purpose: GoogleTests for the MCP session: handshake, pre-initialization rejection and method routing
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include "logging/Logger.h"
#include "mcptest/Protocol.h"
#include "mcptest/Server.h"
#include "mcptest/Tools.h"

using namespace mcptest;

namespace {

class ServerSessionTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setOutputStream(&sink); }
    void TearDown() override { Logger::setOutputStream(nullptr); }

    std::unique_ptr<JSONRPCResponse> request(const std::string& method, std::optional<JSONValue> params = std::nullopt) {
        JSONRPCRequest req(static_cast<int64_t>(++nextId), method, std::move(params));
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, server.HandleJSONRPC(req), net::use_future);
        ioc.run();
        return fut.get();
    }

    void notify(const std::string& method) {
        server.HandleNotification(JSONRPCNotification(method));
    }

    void handshake() {
        auto resp = request(Methods::Initialize, parseJSONValue(
            R"({"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"gtest","version":"0.1"}})"));
        ASSERT_FALSE(resp->IsError());
        notify(Methods::Initialized);
        ASSERT_EQ(server.GetSessionState(), SessionState::Initialized);
    }

    static int errorCode(const JSONRPCResponse& resp) {
        return static_cast<int>(std::get<int64_t>(resp.error->find("code")->value));
    }
    static std::string errorMessage(const JSONRPCResponse& resp) {
        return std::get<std::string>(resp.error->find("message")->value);
    }

    std::ostringstream sink;
    ToolRegistry registry = MakeDefaultToolRegistry();
    Server server{Implementation{SERVER_NAME, "1.0.0"}, registry};
    int64_t nextId{0};
};

} // namespace

TEST_F(ServerSessionTest, InitializeReturnsServerInfoAndCapabilities) {
    auto resp = request(Methods::Initialize, parseJSONValue(
        R"({"protocolVersion":"2025-06-18","capabilities":{},"clientInfo":{"name":"gtest","version":"0.1"}})"));
    ASSERT_FALSE(resp->IsError());
    ASSERT_TRUE(resp->result.has_value());
    const JSONValue& result = resp->result.value();
    EXPECT_EQ(std::get<std::string>(result.find("protocolVersion")->value), "2025-06-18");
    EXPECT_EQ(std::get<std::string>(result.find("serverInfo")->find("name")->value), SERVER_NAME);
    EXPECT_EQ(std::get<std::string>(result.find("serverInfo")->find("version")->value), "1.0.0");
    ASSERT_NE(result.find("capabilities"), nullptr);
    EXPECT_NE(result.find("capabilities")->find("tools"), nullptr);
    EXPECT_EQ(server.GetSessionState(), SessionState::Initializing);
    EXPECT_EQ(server.GetClientInfo().name, "gtest");
}

TEST_F(ServerSessionTest, UnsupportedProtocolVersionGetsLatest) {
    auto resp = request(Methods::Initialize, parseJSONValue(R"({"protocolVersion":"1999-01-01"})"));
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(std::get<std::string>(resp->result->find("protocolVersion")->value), PROTOCOL_VERSION);
}

TEST_F(ServerSessionTest, RequestsBeforeHandshakeAreRejected) {
    auto resp = request(Methods::ListTools);
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(errorMessage(*resp), "Received request before initialization was complete");

    // Still rejected between initialize and notifications/initialized
    request(Methods::Initialize, parseJSONValue("{}"));
    resp = request(Methods::CallTool, parseJSONValue(R"({"name":"echo","arguments":{"message":"x"}})"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidRequest);

    notify(Methods::Initialized);
    resp = request(Methods::ListTools);
    EXPECT_FALSE(resp->IsError());
}

TEST_F(ServerSessionTest, PingWorksInEveryState) {
    auto resp = request(Methods::Ping);
    ASSERT_FALSE(resp->IsError());
    EXPECT_TRUE(resp->result->isObject());
    handshake();
    resp = request(Methods::Ping);
    EXPECT_FALSE(resp->IsError());
}

TEST_F(ServerSessionTest, InitializedBeforeInitializeIsIgnored) {
    notify(Methods::Initialized);
    EXPECT_EQ(server.GetSessionState(), SessionState::Uninitialized);
}

TEST_F(ServerSessionTest, RepeatedInitializeKeepsSessionUsable) {
    handshake();
    auto resp = request(Methods::Initialize, parseJSONValue("{}"));
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(server.GetSessionState(), SessionState::Initialized);
}

TEST_F(ServerSessionTest, ToolsListAdvertisesCatalog) {
    handshake();
    auto resp = request(Methods::ListTools);
    ASSERT_FALSE(resp->IsError());
    const auto& tools = std::get<JSONValue::Array>(resp->result->find("tools")->value);
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(std::get<std::string>(tools[0]->find("name")->value), "get-random-data");
    EXPECT_NE(tools[0]->find("inputSchema"), nullptr);
    EXPECT_NE(tools[0]->find("description"), nullptr);
}

TEST_F(ServerSessionTest, ToolsCallReturnsTextContent) {
    handshake();
    auto resp = request(Methods::CallTool, parseJSONValue(R"({"name":"echo","arguments":{"message":"hi"}})"));
    ASSERT_FALSE(resp->IsError());
    const auto& content = std::get<JSONValue::Array>(resp->result->find("content")->value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(std::get<std::string>(content[0]->find("type")->value), "text");
    JSONValue payload = parseJSONValue(std::get<std::string>(content[0]->find("text")->value));
    EXPECT_EQ(std::get<std::string>(payload.find("echoed_message")->value), "hi");
}

TEST_F(ServerSessionTest, UnknownToolIsNotAProtocolError) {
    handshake();
    auto resp = request(Methods::CallTool, parseJSONValue(R"({"name":"missing-tool"})"));
    ASSERT_FALSE(resp->IsError());
    const auto& content = std::get<JSONValue::Array>(resp->result->find("content")->value);
    const std::string text = std::get<std::string>(content[0]->find("text")->value);
    EXPECT_EQ(text.rfind("Error: Unknown tool:", 0), 0u);

    // Session keeps working
    resp = request(Methods::Ping);
    EXPECT_FALSE(resp->IsError());
}

TEST_F(ServerSessionTest, ToolsCallWithoutNameIsInvalidParams) {
    handshake();
    auto resp = request(Methods::CallTool, parseJSONValue("{}"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);
    resp = request(Methods::CallTool);
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(ServerSessionTest, EmptyResourceAndPromptLists) {
    handshake();
    auto resources = request(Methods::ListResources);
    EXPECT_TRUE(std::get<JSONValue::Array>(resources->result->find("resources")->value).empty());
    auto templates = request(Methods::ListResourceTemplates);
    EXPECT_TRUE(std::get<JSONValue::Array>(templates->result->find("resourceTemplates")->value).empty());
    auto prompts = request(Methods::ListPrompts);
    EXPECT_TRUE(std::get<JSONValue::Array>(prompts->result->find("prompts")->value).empty());
}

TEST_F(ServerSessionTest, ReadResourceAndGetPromptAreNotFound) {
    handshake();
    auto resp = request(Methods::ReadResource, parseJSONValue(R"({"uri":"file:///nope"})"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::ResourceNotFound);
    EXPECT_EQ(errorMessage(*resp), "Resource not found: file:///nope");

    resp = request(Methods::GetPrompt, parseJSONValue(R"({"name":"greeting"})"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::PromptNotFound);
    EXPECT_EQ(errorMessage(*resp), "Unknown prompt: greeting");
}

TEST_F(ServerSessionTest, UnknownMethodIsMethodNotFound) {
    handshake();
    auto resp = request("sampling/createMessage");
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::MethodNotFound);
}

TEST_F(ServerSessionTest, ResponseIdMatchesRequest) {
    auto resp = request(Methods::Ping);
    EXPECT_EQ(std::get<int64_t>(resp->id), nextId);
}

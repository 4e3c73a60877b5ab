//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Tools.cpp
// Purpose: Schemas and handlers for get-random-data, echo and server-status
//==========================================================================================================

#include "mcptest/Tools.h"
#include "mcptest/Protocol.h"
#include "mcptest/version.h"
#include "logging/Logger.h"

#include <algorithm>
#include <chrono>

#include <utility>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcptest {

namespace {
std::shared_ptr<JSONValue> str(const std::string& s) { return std::make_shared<JSONValue>(s); }

// {"type": type, "description": description}
JSONValue::Object property(const std::string& type, const std::string& description) {
    JSONValue::Object p;
    p["type"] = str(type);
    p["description"] = str(description);
    return p;
}

JSONValue objectSchema(JSONValue::Object properties, const std::vector<std::string>& required) {
    JSONValue::Array req;
    for (const auto& r : required) {
        req.push_back(str(r));
    }
    JSONValue::Object schema;
    schema["type"] = str("object");
    schema["properties"] = std::make_shared<JSONValue>(std::move(properties));
    schema["required"] = std::make_shared<JSONValue>(std::move(req));
    return JSONValue{std::move(schema)};
}

int64_t intArg(const JSONValue::Object& args, const char* name, int64_t fallback) {
    auto it = args.find(name);
    if (it == args.end() || !it->second || !std::holds_alternative<int64_t>(it->second->value)) {
        return fallback;
    }
    return std::get<int64_t>(it->second->value);
}

bool boolArg(const JSONValue::Object& args, const char* name, bool fallback) {
    auto it = args.find(name);
    if (it == args.end() || !it->second || !std::holds_alternative<bool>(it->second->value)) {
        return fallback;
    }
    return std::get<bool>(it->second->value);
}

ToolDescriptor makeGetRandomData(std::shared_ptr<RandomDataGenerator> generator) {
    JSONValue::Object count = property("integer", "Number of data records to generate (1-10, default: 1)");
    count["minimum"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
    count["maximum"] = std::make_shared<JSONValue>(static_cast<int64_t>(10));
    count["default"] = std::make_shared<JSONValue>(static_cast<int64_t>(1));
    JSONValue::Object includeDelay = property("boolean", "Add a small random delay (0-500ms) to simulate real API latency");
    includeDelay["default"] = std::make_shared<JSONValue>(false);

    JSONValue::Object props;
    props["count"] = std::make_shared<JSONValue>(std::move(count));
    props["include_delay"] = std::make_shared<JSONValue>(std::move(includeDelay));

    ToolDescriptor d;
    d.name = ToolNames::GetRandomData;
    d.description = "Returns random structured technical data for testing Docker stdio communications. "
                    "Generates ~10-15 fields of technical metrics.";
    d.inputSchema = objectSchema(std::move(props), {});
    d.handler = [generator](const JSONValue::Object& args) -> net::awaitable<JSONValue> {
        const int64_t count = std::clamp<int64_t>(intArg(args, "count", 1), 1, 10);
        if (boolArg(args, "include_delay", false)) {
            const int delay = generator->delayMs();
            LOG_DEBUG("get-random-data: simulating {} ms latency", delay);
            net::steady_timer timer(co_await net::this_coro::executor);
            timer.expires_after(std::chrono::milliseconds(delay));
            co_await timer.async_wait(net::use_awaitable);
        }
        if (count == 1) {
            co_return generator->generateRecord();
        }
        JSONValue::Array records;
        for (int64_t i = 0; i < count; ++i) {
            records.push_back(std::make_shared<JSONValue>(generator->generateRecord()));
        }
        JSONValue::Object result;
        result["records"] = std::make_shared<JSONValue>(std::move(records));
        result["count"] = std::make_shared<JSONValue>(count);
        co_return JSONValue{std::move(result)};
    };
    return d;
}

ToolDescriptor makeEcho() {
    JSONValue::Object props;
    props["message"] = std::make_shared<JSONValue>(property("string", "Message to echo back"));

    ToolDescriptor d;
    d.name = ToolNames::Echo;
    d.description = "Echoes back the provided message. Useful for testing basic stdio communication.";
    d.inputSchema = objectSchema(std::move(props), {"message"});
    d.handler = [](const JSONValue::Object& args) -> net::awaitable<JSONValue> {
        std::string message;
        auto it = args.find("message");
        if (it != args.end() && it->second && it->second->isString()) {
            message = std::get<std::string>(it->second->value);
        }
        JSONValue::Object result;
        result["echoed_message"] = str(message);
        result["timestamp"] = str(Logger::isoTimestamp());
        result["message_length"] = std::make_shared<JSONValue>(static_cast<int64_t>(utf8Length(message)));
        co_return JSONValue{std::move(result)};
    };
    return d;
}

ToolDescriptor makeServerStatus() {
    ToolDescriptor d;
    d.name = ToolNames::ServerStatus;
    d.description = "Returns the current server status and version information.";
    d.inputSchema = objectSchema(JSONValue::Object{}, {});
    d.handler = [](const JSONValue::Object&) -> net::awaitable<JSONValue> {
        JSONValue::Object result;
        result["server_name"] = str(SERVER_NAME);
        result["version"] = str(getVersionString());
        result["status"] = str("running");
        result["timestamp"] = str(Logger::isoTimestamp());
        result["uptime_info"] = str("Server is operational");
        co_return JSONValue{std::move(result)};
    };
    return d;
}
} // namespace

std::size_t utf8Length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

ToolRegistry MakeDefaultToolRegistry(std::shared_ptr<RandomDataGenerator> generator) {
    if (!generator) {
        generator = std::make_shared<RandomDataGenerator>();
    }
    std::vector<ToolDescriptor> tools;
    tools.push_back(makeGetRandomData(std::move(generator)));
    tools.push_back(makeEcho());
    tools.push_back(makeServerStatus());
    return ToolRegistry(std::move(tools));
}

} // namespace mcptest

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Serializers for protocol structures shared by the server and its tests
//==========================================================================================================

#include "mcptest/Protocol.h"

namespace mcptest {

JSONValue serializeServerCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object capsObj;

    JSONValue::Object toolsObj;
    toolsObj["listChanged"] = std::make_shared<JSONValue>(caps.tools.listChanged);
    capsObj["tools"] = std::make_shared<JSONValue>(toolsObj);

    JSONValue::Object resourcesObj;
    resourcesObj["subscribe"] = std::make_shared<JSONValue>(caps.resources.subscribe);
    resourcesObj["listChanged"] = std::make_shared<JSONValue>(caps.resources.listChanged);
    capsObj["resources"] = std::make_shared<JSONValue>(resourcesObj);

    JSONValue::Object promptsObj;
    promptsObj["listChanged"] = std::make_shared<JSONValue>(caps.prompts.listChanged);
    capsObj["prompts"] = std::make_shared<JSONValue>(promptsObj);

    capsObj["experimental"] = std::make_shared<JSONValue>(caps.experimental);
    return JSONValue{capsObj};
}

CallToolResult makeTextResult(const std::string& text) {
    JSONValue::Object block;
    block["type"] = std::make_shared<JSONValue>("text");
    block["text"] = std::make_shared<JSONValue>(text);
    CallToolResult result;
    result.content.push_back(JSONValue{block});
    result.isError = false;
    return result;
}

JSONValue serializeCallToolResult(const CallToolResult& result) {
    JSONValue::Array content;
    for (const auto& item : result.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(content);
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue{obj};
}

} // namespace mcptest

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: GoogleTests for the tool catalog and schema-driven argument normalization
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcptest/ToolRegistry.h"
#include "mcptest/Tools.h"

using namespace mcptest;

namespace {

ToolDescriptor makeTool(const std::string& name) {
    ToolDescriptor d;
    d.name = name;
    d.description = "test tool " + name;
    d.inputSchema = parseJSONValue(R"({"type":"object","properties":{},"required":[]})");
    d.handler = [](const JSONValue::Object&) -> net::awaitable<JSONValue> {
        co_return JSONValue{JSONValue::Object{}};
    };
    return d;
}

const JSONValue countSchema = parseJSONValue(R"({
    "type": "object",
    "properties": {
        "count": {"type": "integer", "minimum": 1, "maximum": 10, "default": 1},
        "include_delay": {"type": "boolean", "default": false},
        "label": {"type": "string"}
    },
    "required": []
})");

const JSONValue echoSchema = parseJSONValue(R"({
    "type": "object",
    "properties": {"message": {"type": "string"}},
    "required": ["message"]
})");

int64_t intMember(const JSONValue::Object& obj, const char* key) {
    return std::get<int64_t>(obj.at(key)->value);
}

} // namespace

TEST(ToolRegistry, PreservesRegistrationOrder) {
    std::vector<ToolDescriptor> tools;
    tools.push_back(makeTool("zeta"));
    tools.push_back(makeTool("alpha"));
    ToolRegistry registry(std::move(tools));

    auto listed = registry.ListTools();
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].name, "zeta");
    EXPECT_EQ(listed[1].name, "alpha");
    EXPECT_EQ(listed[1].description, "test tool alpha");
    ASSERT_NE(registry.find("alpha"), nullptr);
    EXPECT_EQ(registry.find("missing"), nullptr);
}

TEST(ToolRegistry, RejectsDuplicateAndEmptyNames) {
    std::vector<ToolDescriptor> dup;
    dup.push_back(makeTool("echo"));
    dup.push_back(makeTool("echo"));
    EXPECT_THROW(ToolRegistry{std::move(dup)}, std::invalid_argument);

    std::vector<ToolDescriptor> empty;
    empty.push_back(makeTool(""));
    EXPECT_THROW(ToolRegistry{std::move(empty)}, std::invalid_argument);
}

TEST(ToolRegistry, DefaultCatalogHasThreeToolsInOrder) {
    ToolRegistry registry = MakeDefaultToolRegistry();
    auto listed = registry.ListTools();
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0].name, ToolNames::GetRandomData);
    EXPECT_EQ(listed[1].name, ToolNames::Echo);
    EXPECT_EQ(listed[2].name, ToolNames::ServerStatus);

    const JSONValue& echo = listed[1].inputSchema;
    ASSERT_NE(echo.find("required"), nullptr);
    const auto& required = std::get<JSONValue::Array>(echo.find("required")->value);
    ASSERT_EQ(required.size(), 1u);
    EXPECT_EQ(std::get<std::string>(required[0]->value), "message");

    const JSONValue* count = listed[0].inputSchema.find("properties")->find("count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(std::get<int64_t>(count->find("maximum")->value), 10);
}

TEST(NormalizeArguments, AppliesDefaultsForMissingProperties) {
    auto args = NormalizeArguments(countSchema, JSONValue{});
    EXPECT_EQ(intMember(args, "count"), 1);
    EXPECT_FALSE(std::get<bool>(args.at("include_delay")->value));
    EXPECT_EQ(args.count("label"), 0u);
}

TEST(NormalizeArguments, ClampsIntegersIntoRange) {
    EXPECT_EQ(intMember(NormalizeArguments(countSchema, parseJSONValue(R"({"count":15})")), "count"), 10);
    EXPECT_EQ(intMember(NormalizeArguments(countSchema, parseJSONValue(R"({"count":0})")), "count"), 1);
    EXPECT_EQ(intMember(NormalizeArguments(countSchema, parseJSONValue(R"({"count":-4})")), "count"), 1);
    EXPECT_EQ(intMember(NormalizeArguments(countSchema, parseJSONValue(R"({"count":5})")), "count"), 5);
}

TEST(NormalizeArguments, AcceptsIntegralDoubles) {
    auto args = NormalizeArguments(countSchema, parseJSONValue(R"({"count":3.0})"));
    EXPECT_EQ(intMember(args, "count"), 3);
    EXPECT_THROW(NormalizeArguments(countSchema, parseJSONValue(R"({"count":2.5})")), ToolArgumentError);
}

TEST(NormalizeArguments, RejectsWrongTypes) {
    try {
        NormalizeArguments(countSchema, parseJSONValue(R"({"count":"five"})"));
        FAIL() << "expected ToolArgumentError";
    } catch (const ToolArgumentError& e) {
        EXPECT_STREQ(e.what(), "Invalid type for argument 'count': expected integer");
    }
    EXPECT_THROW(NormalizeArguments(countSchema, parseJSONValue(R"({"include_delay":"yes"})")), ToolArgumentError);
    EXPECT_THROW(NormalizeArguments(countSchema, parseJSONValue(R"({"label":7})")), ToolArgumentError);
}

TEST(NormalizeArguments, ReportsMissingRequiredArgument) {
    try {
        NormalizeArguments(echoSchema, parseJSONValue("{}"));
        FAIL() << "expected ToolArgumentError";
    } catch (const ToolArgumentError& e) {
        EXPECT_STREQ(e.what(), "Missing required argument: message");
    }
}

TEST(NormalizeArguments, RejectsNonObjectArguments) {
    EXPECT_THROW(NormalizeArguments(echoSchema, parseJSONValue("[\"hi\"]")), ToolArgumentError);
    EXPECT_THROW(NormalizeArguments(echoSchema, parseJSONValue("\"hi\"")), ToolArgumentError);
}

TEST(NormalizeArguments, UnknownPropertiesPassThrough) {
    auto args = NormalizeArguments(echoSchema, parseJSONValue(R"({"message":"hi","extra":[1]})"));
    EXPECT_EQ(std::get<std::string>(args.at("message")->value), "hi");
    ASSERT_EQ(args.count("extra"), 1u);
    EXPECT_TRUE(args.at("extra")->isArray());
}

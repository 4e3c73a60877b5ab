//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool catalog lookup and schema-driven argument normalization
//==========================================================================================================

#include "mcptest/ToolRegistry.h"
#include "logging/Logger.h"

#include <cmath>
#include <limits>

namespace mcptest {

namespace {
std::optional<int64_t> integerMember(const JSONValue& schema, const char* key) {
    const JSONValue* v = schema.find(key);
    if (v == nullptr) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) return static_cast<int64_t>(std::get<double>(v->value));
    return std::nullopt;
}

// Converts an integral double to int64, saturating outside the representable range.
std::optional<int64_t> integralValue(double d) {
    if (!std::isfinite(d) || std::trunc(d) != d) {
        return std::nullopt;
    }
    if (d >= 9.2e18) return std::numeric_limits<int64_t>::max();
    if (d <= -9.2e18) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(d);
}

[[noreturn]] void throwTypeError(const std::string& name, const std::string& type) {
    throw ToolArgumentError("Invalid type for argument '" + name + "': expected " + type);
}

JSONValue normalizeValue(const std::string& name, const JSONValue& propSchema, const JSONValue& value) {
    const JSONValue* typeVal = propSchema.find("type");
    if (typeVal == nullptr || !typeVal->isString()) {
        return value;
    }
    const std::string& type = std::get<std::string>(typeVal->value);
    if (type == "integer") {
        int64_t n = 0;
        if (std::holds_alternative<int64_t>(value.value)) {
            n = std::get<int64_t>(value.value);
        } else if (std::holds_alternative<double>(value.value)) {
            auto i = integralValue(std::get<double>(value.value));
            if (!i.has_value()) throwTypeError(name, type);
            n = i.value();
        } else {
            throwTypeError(name, type);
        }
        if (auto lo = integerMember(propSchema, "minimum"); lo.has_value() && n < lo.value()) n = lo.value();
        if (auto hi = integerMember(propSchema, "maximum"); hi.has_value() && n > hi.value()) n = hi.value();
        return JSONValue(n);
    }
    if (type == "number") {
        if (!std::holds_alternative<int64_t>(value.value) && !std::holds_alternative<double>(value.value)) {
            throwTypeError(name, type);
        }
        return value;
    }
    if (type == "boolean") {
        if (!std::holds_alternative<bool>(value.value)) throwTypeError(name, type);
        return value;
    }
    if (type == "string") {
        if (!value.isString()) throwTypeError(name, type);
        return value;
    }
    if (type == "object") {
        if (!value.isObject()) throwTypeError(name, type);
        return value;
    }
    if (type == "array") {
        if (!value.isArray()) throwTypeError(name, type);
        return value;
    }
    return value;
}
} // namespace

ToolRegistry::ToolRegistry(std::vector<ToolDescriptor> tools) : entries(std::move(tools)) {
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const std::string& name = entries[i].name;
        if (name.empty()) {
            throw std::invalid_argument("Tool name must not be empty");
        }
        if (!index.emplace(name, i).second) {
            throw std::invalid_argument("Duplicate tool name: " + name);
        }
    }
    LOG_DEBUG("ToolRegistry: {} tools registered", entries.size());
}

const ToolDescriptor* ToolRegistry::find(const std::string& name) const {
    auto it = index.find(name);
    if (it == index.end()) {
        return nullptr;
    }
    return &entries[it->second];
}

std::vector<Tool> ToolRegistry::ListTools() const {
    std::vector<Tool> out;
    out.reserve(entries.size());
    for (const auto& d : entries) {
        out.push_back(d.toTool());
    }
    return out;
}

JSONValue::Object NormalizeArguments(const JSONValue& inputSchema, const JSONValue& arguments) {
    JSONValue::Object args;
    if (arguments.isObject()) {
        args = std::get<JSONValue::Object>(arguments.value);
    } else if (!std::holds_alternative<std::nullptr_t>(arguments.value)) {
        throw ToolArgumentError("Invalid arguments: expected an object");
    }

    if (const JSONValue* props = inputSchema.find("properties"); props != nullptr && props->isObject()) {
        for (const auto& [name, propSchema] : std::get<JSONValue::Object>(props->value)) {
            if (!propSchema) continue;
            auto it = args.find(name);
            if (it == args.end() || !it->second) {
                if (const JSONValue* def = propSchema->find("default")) {
                    args[name] = std::make_shared<JSONValue>(*def);
                }
                continue;
            }
            it->second = std::make_shared<JSONValue>(normalizeValue(name, *propSchema, *it->second));
        }
    }

    if (const JSONValue* required = inputSchema.find("required"); required != nullptr && required->isArray()) {
        for (const auto& req : std::get<JSONValue::Array>(required->value)) {
            if (!req || !req->isString()) continue;
            const std::string& name = std::get<std::string>(req->value);
            auto it = args.find(name);
            if (it == args.end() || !it->second) {
                throw ToolArgumentError("Missing required argument: " + name);
            }
        }
    }
    return args;
}

} // namespace mcptest

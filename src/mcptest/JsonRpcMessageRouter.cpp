//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcptest/JsonRpcMessageRouter.h"
#include "mcptest/JSONRPCTypes.h"

namespace mcptest {

namespace {
// Echo the id of an invalid message only when it has a type JSON-RPC allows.
JSONRPCId recoverId(const JSONValue& message) {
    const JSONValue* id = message.find("id");
    if (id == nullptr) {
        return JSONRPCId{nullptr};
    }
    if (std::holds_alternative<std::string>(id->value)) {
        return JSONRPCId{std::get<std::string>(id->value)};
    }
    if (std::holds_alternative<int64_t>(id->value)) {
        return JSONRPCId{std::get<int64_t>(id->value)};
    }
    return JSONRPCId{nullptr};
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) override {
        if (!message.isObject()) {
            return MessageKind::Unknown;
        }
        const JSONValue* version = message.find("jsonrpc");
        if (version == nullptr || !version->isString() || std::get<std::string>(version->value) != "2.0") {
            return MessageKind::Unknown;
        }
        const JSONValue* method = message.find("method");
        const bool hasId = message.find("id") != nullptr;
        if (method != nullptr) {
            if (!method->isString()) {
                return MessageKind::Unknown;
            }
            return hasId ? MessageKind::Request : MessageKind::Notification;
        }
        if (hasId && (message.find("result") != nullptr || message.find("error") != nullptr)) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    net::awaitable<std::optional<std::string>> route(const std::string& json, RouterHandlers& handlers) override {
        JSONValue message;
        try {
            message = parseJSONValue(json);
        } catch (const JSONParseError& e) {
            LOG_WARN("Router: malformed JSON frame ({} bytes): {}", json.size(), e.what());
            reportError(handlers, std::string("Parse error: ") + e.what());
            co_return CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
        }

        switch (classify(message)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromJSON(message)) {
                    break;
                }
                LOG_DEBUG("Router: request method={} id={}", request.method, idToString(request.id));
                std::unique_ptr<JSONRPCResponse> resp;
                if (!handlers.requestHandler) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No request handler registered");
                } else {
                    try {
                        resp = co_await handlers.requestHandler(request);
                    } catch (const TransportError&) {
                        throw;
                    } catch (const std::exception& e) {
                        LOG_ERROR("Request handler exception: {}", e.what());
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                    }
                }
                if (!resp) {
                    resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Null response from handler");
                } else {
                    resp->id = request.id;
                }
                co_return resp->Serialize();
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (!notification.FromJSON(message)) {
                    break;
                }
                if (handlers.notificationHandler) {
                    try {
                        handlers.notificationHandler(std::make_unique<JSONRPCNotification>(std::move(notification)));
                    } catch (const std::exception& e) {
                        LOG_ERROR("Notification handler exception: {}", e.what());
                    }
                }
                co_return std::nullopt;
            }
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (response.FromJSON(message)) {
                    LOG_DEBUG("Router: ignoring inbound response id={}", idToString(response.id));
                }
                co_return std::nullopt;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", json);
        reportError(handlers, "Router: unrecognized JSON-RPC message");
        co_return CreateErrorResponse(recoverId(message), JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
    }

private:
    static void reportError(RouterHandlers& handlers, const std::string& msg) {
        if (handlers.errorHandler) {
            handlers.errorHandler(msg);
        }
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcptest

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: MCP session implementation (handshake, routing, tool dispatch)
//==========================================================================================================

#include "mcptest/Server.h"
#include "mcptest/ToolDispatcher.h"
#include "mcptest/errors/Errors.h"
#include "mcptest/version.h"
#include "logging/Logger.h"

namespace mcptest {

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing: return "initializing";
        case SessionState::Initialized: return "initialized";
    }
    return "unknown";
}

class Server::Impl {
public:
    Implementation serverInfo;
    const ToolRegistry& registry;
    ToolDispatcher dispatcher;
    ServerCapabilities capabilities;
    SessionState state{SessionState::Uninitialized};
    Implementation clientInfo;

    Impl(Implementation info, const ToolRegistry& reg)
        : serverInfo(std::move(info)), registry(reg), dispatcher(reg) {}

    static std::optional<std::string> stringParam(const JSONRPCRequest& req, const char* key) {
        if (!req.params.has_value()) return std::nullopt;
        const JSONValue* v = req.params->find(key);
        if (v == nullptr || !v->isString()) return std::nullopt;
        return std::get<std::string>(v->value);
    }

    static std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCRequest& req, JSONValue result) {
        auto response = std::make_unique<JSONRPCResponse>();
        response->id = req.id;
        response->result = std::move(result);
        return response;
    }

    static std::unique_ptr<JSONRPCResponse> makeError(const JSONRPCRequest& req, int code, std::string message) {
        return errors::makeErrorResponse(req.id, errors::makeError(code, std::move(message)));
    }

    static JSONValue emptyListResult(const char* key) {
        JSONValue::Object obj;
        obj[key] = std::make_shared<JSONValue>(JSONValue::Array{});
        return JSONValue{obj};
    }

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) {
        std::string requested;
        if (request.params.has_value()) {
            if (auto v = stringParam(request, "protocolVersion")) {
                requested = v.value();
            }
            if (const JSONValue* ci = request.params->find("clientInfo")) {
                const JSONValue* n = ci->find("name");
                const JSONValue* ver = ci->find("version");
                clientInfo.name = (n && n->isString()) ? std::get<std::string>(n->value) : std::string();
                clientInfo.version = (ver && ver->isString()) ? std::get<std::string>(ver->value) : std::string();
            }
        }
        const std::string negotiated = negotiateProtocolVersion(requested);
        LOG_INFO("Handling initialize request (client={} {}, requested protocol={}, negotiated={})",
                 clientInfo.name, clientInfo.version, requested, negotiated);

        // Build initialize response
        JSONValue::Object resultObj;
        resultObj["protocolVersion"] = std::make_shared<JSONValue>(negotiated);
        resultObj["capabilities"] = std::make_shared<JSONValue>(serializeServerCapabilities(capabilities));
        JSONValue::Object serverInfoObj;
        serverInfoObj["name"] = std::make_shared<JSONValue>(serverInfo.name);
        serverInfoObj["version"] = std::make_shared<JSONValue>(serverInfo.version);
        resultObj["serverInfo"] = std::make_shared<JSONValue>(serverInfoObj);

        if (state == SessionState::Uninitialized) {
            state = SessionState::Initializing;
        }
        return makeResult(request, JSONValue{resultObj});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        JSONValue::Array arr;
        for (const auto& t : registry.ListTools()) {
            JSONValue::Object toolObj;
            toolObj["name"] = std::make_shared<JSONValue>(t.name);
            toolObj["description"] = std::make_shared<JSONValue>(t.description);
            toolObj["inputSchema"] = std::make_shared<JSONValue>(t.inputSchema);
            arr.push_back(std::make_shared<JSONValue>(toolObj));
        }
        JSONValue::Object resultObj;
        resultObj["tools"] = std::make_shared<JSONValue>(arr);
        return makeResult(req, JSONValue{resultObj});
    }

    net::awaitable<std::unique_ptr<JSONRPCResponse>> handleToolsCall(const JSONRPCRequest& req) {
        auto name = stringParam(req, "name");
        if (!name.has_value()) {
            co_return makeError(req, JSONRPCErrorCodes::InvalidParams, "Invalid params");
        }
        JSONValue arguments;
        if (const JSONValue* a = req.params->find("arguments")) {
            arguments = *a;
        }
        CallToolResult result = co_await dispatcher.Dispatch(name.value(), arguments);
        co_return makeResult(req, serializeCallToolResult(result));
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req) {
        auto uri = stringParam(req, "uri");
        if (!uri.has_value()) {
            return makeError(req, JSONRPCErrorCodes::InvalidParams, "Invalid params");
        }
        LOG_DEBUG("resources/read for unknown resource {}", uri.value());
        return makeError(req, JSONRPCErrorCodes::ResourceNotFound, "Resource not found: " + uri.value());
    }

    std::unique_ptr<JSONRPCResponse> handlePromptsGet(const JSONRPCRequest& req) {
        auto name = stringParam(req, "name");
        if (!name.has_value()) {
            return makeError(req, JSONRPCErrorCodes::InvalidParams, "Invalid params");
        }
        LOG_DEBUG("prompts/get for unknown prompt {}", name.value());
        return makeError(req, JSONRPCErrorCodes::PromptNotFound, "Unknown prompt: " + name.value());
    }

    net::awaitable<std::unique_ptr<JSONRPCResponse>> dispatchRequest(const JSONRPCRequest& req) {
        if (req.method == Methods::Ping) {
            co_return makeResult(req, JSONValue{JSONValue::Object{}});
        }
        if (req.method == Methods::Initialize) {
            co_return handleInitialize(req);
        }
        if (state != SessionState::Initialized) {
            LOG_WARN("Rejecting {} received while session is {}", req.method, sessionStateName(state));
            co_return makeError(req, JSONRPCErrorCodes::InvalidRequest,
                                "Received request before initialization was complete");
        }
        if (req.method == Methods::ListTools) {
            co_return handleToolsList(req);
        } else if (req.method == Methods::CallTool) {
            co_return co_await handleToolsCall(req);
        } else if (req.method == Methods::ListResources) {
            co_return makeResult(req, emptyListResult("resources"));
        } else if (req.method == Methods::ListResourceTemplates) {
            co_return makeResult(req, emptyListResult("resourceTemplates"));
        } else if (req.method == Methods::ListPrompts) {
            co_return makeResult(req, emptyListResult("prompts"));
        } else if (req.method == Methods::ReadResource) {
            co_return handleResourcesRead(req);
        } else if (req.method == Methods::GetPrompt) {
            co_return handlePromptsGet(req);
        }
        LOG_DEBUG("Method not found: {}", req.method);
        co_return makeError(req, JSONRPCErrorCodes::MethodNotFound, "Method not found");
    }

    void handleNotification(const JSONRPCNotification& note) {
        if (note.method == Methods::Initialized) {
            if (state == SessionState::Initializing) {
                state = SessionState::Initialized;
                LOG_INFO("Client initialization complete");
            } else if (state == SessionState::Uninitialized) {
                LOG_WARN("Ignoring {} received before initialize", note.method);
            }
            return;
        }
        if (note.method == Methods::Cancelled) {
            std::string requestId = "?";
            if (note.params.has_value()) {
                if (const JSONValue* id = note.params->find("requestId")) {
                    if (id->isString()) requestId = std::get<std::string>(id->value);
                    else if (std::holds_alternative<int64_t>(id->value)) requestId = std::to_string(std::get<int64_t>(id->value));
                }
            }
            LOG_INFO("Cancellation requested for request {} (requests run to completion)", requestId);
            return;
        }
        LOG_DEBUG("Ignoring notification {}", note.method);
    }
};

Server::Server(Implementation serverInfo, const ToolRegistry& registry)
    : pImpl(std::make_unique<Impl>(std::move(serverInfo), registry)) { FUNC_SCOPE(); }

Server::~Server() { FUNC_SCOPE(); }

net::awaitable<void> Server::Run(ITransport& transport) {
    FUNC_SCOPE();
    transport.SetRequestHandler([this](const JSONRPCRequest& req) -> net::awaitable<std::unique_ptr<JSONRPCResponse>> {
        return this->HandleJSONRPC(req);
    });
    transport.SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
        if (!n) return;
        this->HandleNotification(*n);
    });
    transport.SetErrorHandler([](const std::string& err) {
        LOG_WARN("Transport error: {}", err);
    });

    JSONValue::Object startExtras;
    startExtras["version"] = std::make_shared<JSONValue>(pImpl->serverInfo.version);
    Logger::event(LogLevel::LOG_INFO_LEVEL, SERVER_LOGGER_NAME, "MCP server starting", startExtras);
    try {
        co_await transport.Run();
    } catch (const std::exception& e) {
        JSONValue::Object crashExtras;
        crashExtras["error"] = std::make_shared<JSONValue>(std::string(e.what()));
        Logger::event(LogLevel::LOG_ERROR_LEVEL, SERVER_LOGGER_NAME, "MCP server crashed", crashExtras);
        Logger::event(LogLevel::LOG_INFO_LEVEL, SERVER_LOGGER_NAME, "MCP server stopped");
        throw;
    }
    Logger::event(LogLevel::LOG_INFO_LEVEL, SERVER_LOGGER_NAME, "MCP server stopped");
}

net::awaitable<std::unique_ptr<JSONRPCResponse>> Server::HandleJSONRPC(const JSONRPCRequest& req) {
    std::unique_ptr<JSONRPCResponse> resp = co_await pImpl->dispatchRequest(req);
    if (!resp) {
        resp = pImpl->makeError(req, JSONRPCErrorCodes::InternalError, "Null response from handler");
    }
    co_return resp;
}

void Server::HandleNotification(const JSONRPCNotification& notification) {
    pImpl->handleNotification(notification);
}

SessionState Server::GetSessionState() const {
    return pImpl->state;
}

Implementation Server::GetClientInfo() const {
    return pImpl->clientInfo;
}

} // namespace mcptest

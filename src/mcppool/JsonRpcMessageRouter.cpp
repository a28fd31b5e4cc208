//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcppool/JsonRpcMessageRouter.h"

namespace mcppool {

namespace {
class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) override {
        if (!message.IsObject()) {
            return MessageKind::Unknown;
        }
        const bool hasMethod = message.Find("method") != nullptr;
        const bool hasId = message.Find("id") != nullptr;
        if (hasMethod) {
            return hasId ? MessageKind::Request : MessageKind::Notification;
        }
        if (hasId) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    std::optional<std::string> route(
        const JSONValue& message,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) override {
        switch (classify(message)) {
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (!response.FromValue(message)) {
                    // Still resolve the waiter; the caller reports the unusable shape
                    JSONRPCResponse shapeless;
                    const JSONValue* id = message.Find("id");
                    if (id != nullptr && id->IsString()) {
                        shapeless.id = std::get<std::string>(id->value);
                    } else if (id != nullptr && std::holds_alternative<int64_t>(id->value)) {
                        shapeless.id = std::get<int64_t>(id->value);
                    } else {
                        LOG_WARN("Router: response with unusable id: {}", SerializeJSON(message));
                        if (handlers.errorHandler) {
                            handlers.errorHandler("Router: response with unusable id");
                        }
                        return std::nullopt;
                    }
                    LOG_WARN("Router: response without result or error: {}", SerializeJSON(message));
                    resolve(std::move(shapeless));
                    return std::nullopt;
                }
                resolve(std::move(response));
                return std::nullopt;
            }
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromValue(message)) {
                    break;
                }
                if (!handlers.requestHandler) {
                    auto resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                                    "Method not found: " + request.method);
                    return resp->Serialize();
                }
                try {
                    auto resp = handlers.requestHandler(request);
                    if (!resp) {
                        resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                                   "Null response from handler");
                    } else {
                        resp->id = request.id;
                    }
                    return resp->Serialize();
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    auto resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                    return resp->Serialize();
                }
            }
            case MessageKind::Notification: {
                auto notification = std::make_unique<JSONRPCNotification>();
                if (!notification->FromValue(message)) {
                    break;
                }
                if (handlers.notificationHandler) {
                    handlers.notificationHandler(std::move(notification));
                }
                return std::nullopt;
            }
            case MessageKind::Unknown:
                break;
        }

        LOG_WARN("Router: unrecognized JSON-RPC message: {}", SerializeJSON(message));
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: unrecognized JSON-RPC message");
        }
        return std::nullopt;
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcppool

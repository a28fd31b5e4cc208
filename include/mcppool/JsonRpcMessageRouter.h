//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch)
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcppool/JSONRPCTypes.h"

namespace mcppool {

struct RouterHandlers {
    // Answers a request initiated by the server; the returned response is written back to it.
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)> requestHandler;
    std::function<void(std::unique_ptr<JSONRPCNotification>)> notificationHandler;
    std::function<void(const std::string&)> errorHandler;
};

using ResponseResolver = std::function<void(JSONRPCResponse&&)>;

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a decoded JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const JSONValue& message) = 0;

    // Routes a decoded JSON-RPC message. For requests, returns the serialized response to send back;
    // for responses and notifications, returns std::nullopt.
    // The resolver receives every message carrying an id and no method, so the pending request it names
    // is always resolved, even when the message has neither result nor error.
    virtual std::optional<std::string> route(
        const JSONValue& message,
        RouterHandlers& handlers,
        const ResponseResolver& resolve) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcppool

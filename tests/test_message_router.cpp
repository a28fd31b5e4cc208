//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_router.cpp
// Purpose: Tests for JsonRpcMessageRouter
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <string>

#include <stdexcept>
#include "mcppool/JsonRpcMessageRouter.h"
#include "mcppool/JSONRPCTypes.h"

namespace mcppool {

TEST(Router, ClassifyBasic) {
    auto router = MakeDefaultJsonRpcMessageRouter();

    JSONRPCRequest req; req.id = std::string("id-1"); req.method = std::string("ping");
    EXPECT_EQ(router->classify(ParseJSON(req.Serialize())), IJsonRpcMessageRouter::MessageKind::Request);

    JSONRPCResponse resp; resp.id = std::string("id-1"); resp.result = JSONValue(static_cast<int64_t>(123));
    EXPECT_EQ(router->classify(ParseJSON(resp.Serialize())), IJsonRpcMessageRouter::MessageKind::Response);

    JSONRPCNotification note{"notify", std::nullopt};
    EXPECT_EQ(router->classify(ParseJSON(note.Serialize())), IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, ClassifyNonObjectIsUnknown) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(ParseJSON("[1,2]")), IJsonRpcMessageRouter::MessageKind::Unknown);
    EXPECT_EQ(router->classify(ParseJSON("\"text\"")), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, ClassifyIdOnlyIsResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    auto msg = ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":\"x\"}");
    EXPECT_EQ(router->classify(msg), IJsonRpcMessageRouter::MessageKind::Response);
}

TEST(Router, ClassifyNullIdIsRequest) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    auto msg = ParseJSON("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"id\":null}");
    EXPECT_EQ(router->classify(msg), IJsonRpcMessageRouter::MessageKind::Request);
}

TEST(Router, ClassifyNestedIdIsNotification) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    auto msg = ParseJSON("{\"jsonrpc\":\"2.0\",\"method\":\"ping\",\"params\":{\"id\":\"x\"}}");
    EXPECT_EQ(router->classify(msg), IJsonRpcMessageRouter::MessageKind::Notification);
}

TEST(Router, ClassifyUnknownWhenNoKeys) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    EXPECT_EQ(router->classify(ParseJSON("{\"jsonrpc\":\"2.0\"}")), IJsonRpcMessageRouter::MessageKind::Unknown);
}

TEST(Router, RouteUnknownCallsErrorHandler) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    bool errored = false;
    RouterHandlers handlers{};
    handlers.errorHandler = [&](const std::string&){ errored = true; };
    bool resolved = false;
    auto resolve = [&](JSONRPCResponse&&){ resolved = true; };
    auto out = router->route(ParseJSON("{\"jsonrpc\":\"2.0\"}"), handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_TRUE(errored);
    EXPECT_FALSE(resolved);
}

TEST(Router, RouteResponseResolves) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCResponse resp; resp.id = std::string("abc"); resp.result = JSONValue(static_cast<int64_t>(42));

    std::string resolvedId;
    auto resolve = [&](JSONRPCResponse&& r) { resolvedId = IdToString(r.id); };

    RouterHandlers handlers{};
    auto out = router->route(ParseJSON(resp.Serialize()), handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(resolvedId, "abc");
}

TEST(Router, RouteIntegerIdResponseResolves) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    std::string resolvedId;
    auto resolve = [&](JSONRPCResponse&& r) { resolvedId = IdToString(r.id); };
    RouterHandlers handlers{};
    auto out = router->route(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":17,\"result\":{}}"), handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(resolvedId, "17");
}

TEST(Router, RouteShapelessResponseStillResolves) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    bool resolved = false;
    bool hasPayload = true;
    auto resolve = [&](JSONRPCResponse&& r) {
        resolved = IdToString(r.id) == "req-5";
        hasPayload = r.result.has_value() || r.error.has_value();
    };
    RouterHandlers handlers{};
    auto out = router->route(ParseJSON("{\"jsonrpc\":\"2.0\",\"id\":\"req-5\"}"), handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_TRUE(resolved);
    EXPECT_FALSE(hasPayload);
}

TEST(Router, RouteRequestReturnsSerialized) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req; req.id = std::string("r-1"); req.method = std::string("ping");

    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest& r) -> std::unique_ptr<JSONRPCResponse> {
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = r.id;
        resp->result = JSONValue(static_cast<int64_t>(7));
        return resp;
    };

    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(ParseJSON(req.Serialize()), handlers, resolve);
    ASSERT_TRUE(out.has_value());

    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_FALSE(parsed.IsError());
    ASSERT_TRUE(parsed.result.has_value());
    EXPECT_EQ(IdToString(parsed.id), "r-1");
}

TEST(Router, RouteRequestWithoutHandlerIsMethodNotFound) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req(std::string("s-1"), "sampling/createMessage");
    RouterHandlers handlers{};
    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(ParseJSON(req.Serialize()), handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    ASSERT_TRUE(parsed.IsError());
    const JSONValue* code = parsed.error->Find("code");
    ASSERT_NE(code, nullptr);
    EXPECT_EQ(std::get<int64_t>(code->value), JSONRPCErrorCodes::MethodNotFound);
}

TEST(Router, RouteRequestHandlerThrowsReturnsErrorResponse) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCRequest req; req.id = std::string("t-1"); req.method = std::string("boom");
    RouterHandlers handlers{};
    handlers.requestHandler = [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> {
        throw std::runtime_error("handler threw");
    };
    auto resolve = [](JSONRPCResponse&&){};
    auto out = router->route(ParseJSON(req.Serialize()), handlers, resolve);
    ASSERT_TRUE(out.has_value());
    JSONRPCResponse parsed;
    ASSERT_TRUE(parsed.Deserialize(out.value()));
    EXPECT_TRUE(parsed.IsError());
    EXPECT_EQ(IdToString(parsed.id), std::string("t-1"));
}

TEST(Router, RouteNotificationDispatches) {
    auto router = MakeDefaultJsonRpcMessageRouter();
    JSONRPCNotification note{"notifications/tools/list_changed", std::nullopt};

    std::string method;
    RouterHandlers handlers{};
    handlers.notificationHandler = [&](std::unique_ptr<JSONRPCNotification> n) {
        method = n->method;
    };

    auto resolve = [](JSONRPCResponse&&) {};
    auto out = router->route(ParseJSON(note.Serialize()), handlers, resolve);
    EXPECT_FALSE(out.has_value());
    EXPECT_EQ(method, "notifications/tools/list_changed");
}

} // namespace mcppool

#include <gtest/gtest.h>
#include "zmcp/error.hpp"
#include "zmcp/metrics.hpp"
#include "zmcp/router.hpp"
#include "zmcp/session.hpp"
#include <memory>
#include <stdexcept>
#include <string>

using namespace zmcp;

namespace {

JsonRpcRequest make_request(int64_t id, const std::string& method,
                            std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = method;
    req.params = std::move(params);
    return req;
}

} // namespace

TEST(Router, DispatchKnownRequest) {
    Router router;
    Session session;
    bool called = false;
    router.on_request("initialize", [&called](const nlohmann::json&, const Context&) -> HandlerResult {
        called = true;
        return nlohmann::json{{"ok", true}};
    });

    auto response = router.dispatch(make_request(1, "initialize"), session, Context());
    ASSERT_TRUE(response.has_value());
    EXPECT_FALSE(response->error.has_value());
    EXPECT_EQ(response->result->at("ok"), true);
    EXPECT_EQ(std::get<int64_t>(*response->id), 1);
    EXPECT_TRUE(called);
}

TEST(Router, AbsentParamsArriveAsNull) {
    Router router;
    Session session;
    nlohmann::json seen = "unset";
    router.on_request("m", [&seen](const nlohmann::json& params, const Context&) -> HandlerResult {
        seen = params;
        return nlohmann::json::object();
    });

    (void)router.dispatch(make_request(1, "m"), session, Context());
    EXPECT_TRUE(seen.is_null());
}

TEST(Router, DispatchUnknownMethod) {
    Router router;
    Session session;

    auto response = router.dispatch(make_request(1, "resources/list"), session, Context());
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::MethodNotFound);
    EXPECT_EQ(response->error->message, "Method not found: resources/list");
}

TEST(Router, EmptyMethodIsNotFound) {
    Router router;
    Session session;
    auto response = router.dispatch(make_request(9, ""), session, Context());
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::MethodNotFound);
}

TEST(Router, GatedMethodRejectedBeforeInitialize) {
    Router router;
    Session session;
    bool called = false;
    router.on_request("tools/list", [&called](const nlohmann::json&, const Context&) -> HandlerResult {
        called = true;
        return nlohmann::json::object();
    });
    router.require_initialized("tools/list");

    auto response = router.dispatch(make_request(2, "tools/list"), session, Context());
    ASSERT_TRUE(response->error.has_value());
    EXPECT_EQ(response->error->code, error::InvalidRequest);
    EXPECT_EQ(response->error->message, "Server not initialized");
    EXPECT_FALSE(called);

    session.mark_initialized();
    response = router.dispatch(make_request(3, "tools/list"), session, Context());
    EXPECT_FALSE(response->error.has_value());
    EXPECT_TRUE(called);
}

TEST(Router, AliasResolvesToCanonicalMethodAndGate) {
    Router router;
    Session session;
    int calls = 0;
    router.on_request("tools/list", [&calls](const nlohmann::json&, const Context&) -> HandlerResult {
        ++calls;
        return nlohmann::json::object();
    });
    router.alias("list tools", "tools/list");
    router.require_initialized("tools/list");

    EXPECT_TRUE(router.has_handler("list tools"));
    EXPECT_EQ(router.resolve("list tools"), "tools/list");
    EXPECT_EQ(router.resolve("tools/list"), "tools/list");

    auto response = router.dispatch(make_request(1, "list tools"), session, Context());
    EXPECT_EQ(response->error->code, error::InvalidRequest);

    session.mark_initialized();
    response = router.dispatch(make_request(2, "list tools"), session, Context());
    EXPECT_FALSE(response->error.has_value());
    EXPECT_EQ(calls, 1);
}

TEST(Router, HandlerErrorResult) {
    Router router;
    Session session;
    router.on_request("m", [](const nlohmann::json&, const Context&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "Tool name required", std::nullopt};
    });

    auto response = router.dispatch(make_request(4, "m"), session, Context());
    EXPECT_EQ(response->error->code, error::InvalidParams);
    EXPECT_EQ(response->error->message, "Tool name required");
}

TEST(Router, HandlerExceptionsMapToCodes) {
    Router router;
    Session session;
    router.on_request("proto", [](const nlohmann::json&, const Context&) -> HandlerResult {
        throw McpProtocolError(error::InvalidParams, "bad shape");
    });
    router.on_request("json", [](const nlohmann::json& params, const Context&) -> HandlerResult {
        return params.at("missing");
    });
    router.on_request("boom", [](const nlohmann::json&, const Context&) -> HandlerResult {
        throw std::runtime_error("disk full");
    });

    auto r1 = router.dispatch(make_request(1, "proto"), session, Context());
    EXPECT_EQ(r1->error->code, error::InvalidParams);
    EXPECT_EQ(r1->error->message, "bad shape");

    auto r2 = router.dispatch(make_request(2, "json", nlohmann::json::object()), session, Context());
    EXPECT_EQ(r2->error->code, error::InvalidParams);

    auto r3 = router.dispatch(make_request(3, "boom"), session, Context());
    EXPECT_EQ(r3->error->code, error::InternalError);
    EXPECT_EQ(r3->error->message, "disk full");
}

TEST(Router, DispatchNotification) {
    Router router;
    Session session;
    bool called = false;
    router.on_notification("notifications/initialized", [&called](const nlohmann::json&) {
        called = true;
    });

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";

    auto response = router.dispatch(notif, session, Context());
    EXPECT_FALSE(response.has_value());
    EXPECT_TRUE(called);
}

TEST(Router, NotificationNeverReplies) {
    Router router;
    Session session;
    router.on_notification("fails", [](const nlohmann::json&) {
        throw std::runtime_error("ignored");
    });

    JsonRpcNotification unknown;
    unknown.method = "unknown/notification";
    EXPECT_FALSE(router.dispatch(unknown, session, Context()).has_value());

    JsonRpcNotification failing;
    failing.method = "fails";
    EXPECT_FALSE(router.dispatch(failing, session, Context()).has_value());
}

TEST(Router, RecordsRequestMetrics) {
    Router router;
    Session session;
    auto metrics = std::make_shared<Metrics>();
    router.set_metrics(metrics);
    router.on_request("initialize", [](const nlohmann::json&, const Context&) -> HandlerResult {
        return nlohmann::json::object();
    });

    (void)router.dispatch(make_request(1, "initialize"), session, Context());
    (void)router.dispatch(make_request(2, "no/such/method"), session, Context());
    (void)router.dispatch(make_request(3, "another/unknown"), session, Context());

    EXPECT_EQ(metrics->counter_value("requests_total",
                                     {{"method", "initialize"}, {"status", "success"}}), 1.0);
    EXPECT_EQ(metrics->counter_value("requests_total",
                                     {{"method", "unknown"}, {"status", "error"}}), 2.0);
    EXPECT_EQ(metrics->histogram_count("request_duration_seconds", {{"method", "initialize"}}), 1u);
}

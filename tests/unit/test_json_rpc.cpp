#include <gtest/gtest.h>
#include "zmcp/json_rpc.hpp"
#include "zmcp/version.hpp"
#include <nlohmann/json.hpp>

using namespace zmcp;

TEST(JsonRpcRequest, ConstructAndSerialize) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"}};

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/call");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["name"], "echo");
}

TEST(JsonRpcRequest, StringId) {
    JsonRpcRequest req;
    req.id = RequestId{std::string{"my-id"}};
    req.method = "tools/list";

    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["id"], "my-id");
    EXPECT_FALSE(j.contains("params"));
}

TEST(RequestIdJson, AcceptsNumbersAndStrings) {
    RequestId id;
    from_json(nlohmann::json(17), id);
    EXPECT_EQ(std::get<int64_t>(id), 17);
    from_json(nlohmann::json(1.25), id);
    EXPECT_DOUBLE_EQ(std::get<double>(id), 1.25);
    from_json(nlohmann::json("x"), id);
    EXPECT_EQ(std::get<std::string>(id), "x");

    nlohmann::json j;
    to_json(j, RequestId{1.25});
    EXPECT_EQ(j, 1.25);
}

TEST(RequestIdJson, HugeUnsignedKeepsMagnitude) {
    RequestId id;
    from_json(nlohmann::json(uint64_t{18446744073709551615ULL}), id);
    ASSERT_TRUE(std::holds_alternative<double>(id));
    EXPECT_GT(std::get<double>(id), 1e19);
}

TEST(RequestIdJson, RejectsOtherTypes) {
    RequestId id;
    EXPECT_THROW(from_json(nlohmann::json(true), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json(nullptr), id), std::invalid_argument);
    EXPECT_THROW(from_json(nlohmann::json::array(), id), std::invalid_argument);
}

TEST(JsonRpcResponse, Success) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{42}}, nlohmann::json{{"ok", true}});

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonRpcResponse, EmptyResultIsObject) {
    JsonRpcResponse resp;
    resp.id = RequestId{int64_t{3}};

    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_object());
}

TEST(JsonRpcResponse, Failure) {
    auto resp = JsonRpcResponse::failure(RequestId{int64_t{1}}, -32601, "Method not found: x");

    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found: x");
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonRpcResponse, FailureWithData) {
    auto resp = JsonRpcResponse::failure(RequestId{std::string("q")}, -32602, "Invalid params",
                                         nlohmann::json{{"field", "name"}});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["error"]["data"]["field"], "name");
}

TEST(JsonRpcResponse, FailureWithoutIdSerializesNull) {
    auto resp = JsonRpcResponse::failure(std::nullopt, -32700, "Invalid JSON");
    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("id"));
    EXPECT_TRUE(j["id"].is_null());
}

TEST(JsonRpcError, RoundTripsData) {
    JsonRpcError err{-32603, "boom", nlohmann::json{{"detail", 1}}};
    nlohmann::json j = err;
    EXPECT_EQ(j.get<JsonRpcError>(), err);
}

TEST(JsonRpcNotification, Serialize) {
    JsonRpcNotification notif;
    notif.method = "notifications/initialized";

    nlohmann::json j;
    to_json(j, notif);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "notifications/initialized");
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("params"));
}

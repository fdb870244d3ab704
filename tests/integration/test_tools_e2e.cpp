#include <gtest/gtest.h>
#include "pipe_client.hpp"
#include "zmcp/error.hpp"
#include "zmcp/metrics.hpp"
#include "zmcp/server.hpp"
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>

using namespace zmcp;
using zmcp::testing::make_request;
using zmcp::testing::PipeClient;

namespace {

/// In-memory key/value store exposed as two tools.
struct MemoryStore {
    std::mutex mutex;
    std::map<std::string, std::string> entries;
};

class StoreTool : public EnhancedTool {
public:
    explicit StoreTool(std::shared_ptr<MemoryStore> store) : store_(std::move(store)) {}

    std::string name() const override { return "store_memory"; }
    std::string description() const override { return "Store a memory under a key"; }
    nlohmann::json input_schema() const override {
        return {{"type", "object"},
                {"properties", {{"key", {{"type", "string"}}}, {"content", {{"type", "string"}}}}},
                {"required", {"key", "content"}}};
    }
    CallToolResult execute(const Context&, const nlohmann::json& args) override {
        std::string key = args.at("key").get<std::string>();
        std::string content = args.at("content").get<std::string>();
        if (content.empty()) {
            return CallToolResult::text("content must not be empty", true);
        }
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->entries[key] = content;
        auto result = CallToolResult::text("stored " + key);
        result.structured_content = nlohmann::json{{"key", key}, {"size", store_->entries.size()}};
        return result;
    }

    std::vector<std::string> usage_triggers() const override { return {"User shares a fact"}; }
    std::vector<std::string> best_practices() const override { return {"Use stable keys"}; }
    std::map<std::string, std::vector<std::string>> synergies() const override {
        return {{"precedes", {"retrieve_memory"}}};
    }
    std::vector<nlohmann::json> workflow_snippets() const override {
        return {{{"goal", "remember"}, {"steps", {"store_memory", "retrieve_memory"}}}};
    }

private:
    std::shared_ptr<MemoryStore> store_;
};

class RetrieveTool : public Tool {
public:
    explicit RetrieveTool(std::shared_ptr<MemoryStore> store) : store_(std::move(store)) {}

    std::string name() const override { return "retrieve_memory"; }
    std::string description() const override { return "Retrieve a memory by key"; }
    nlohmann::json input_schema() const override {
        return {{"type", "object"}, {"properties", {{"key", {{"type", "string"}}}}}};
    }
    CallToolResult execute(const Context&, const nlohmann::json& args) override {
        std::string key = args.at("key").get<std::string>();
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->entries.find(key);
        if (it == store_->entries.end()) {
            throw std::runtime_error("no memory stored under '" + key + "'");
        }
        return CallToolResult::text(it->second);
    }

private:
    std::shared_ptr<MemoryStore> store_;
};

class ToolsE2E : public ::testing::Test {
protected:
    void SetUp() override {
        auto store = std::make_shared<MemoryStore>();
        McpServer::Options opts;
        opts.strategy_guide_summary = "Store facts, then retrieve them by key";
        opts.metrics = metrics_;
        server_ = std::make_unique<McpServer>(opts);
        server_->register_tool(std::make_shared<StoreTool>(store));
        server_->register_tool(std::make_shared<RetrieveTool>(store));

        auto transport = client_.server_transport();
        served_ = std::async(std::launch::async, [this, t = std::move(transport)]() mutable {
            return server_->serve(std::move(t));
        });
        auto init = client_.request(make_request(1, "initialize", nlohmann::json::object()));
        ASSERT_TRUE(init.contains("result"));
    }

    void TearDown() override {
        client_.close_write();
        EXPECT_EQ(served_.get(), StopReason::Disconnected);
    }

    std::shared_ptr<Metrics> metrics_ = std::make_shared<Metrics>();
    std::unique_ptr<McpServer> server_;
    PipeClient client_;
    std::future<StopReason> served_;
};

} // namespace

TEST_F(ToolsE2E, ListIncludesStrategyMetadata) {
    auto r = client_.request(make_request(2, "tools/list"));
    const auto& tools = r["result"]["tools"];
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0]["name"], "retrieve_memory");
    EXPECT_FALSE(tools[0].contains("usageTriggers"));
    EXPECT_EQ(tools[1]["name"], "store_memory");
    EXPECT_EQ(tools[1]["usageTriggers"][0], "User shares a fact");
    EXPECT_EQ(tools[1]["synergies"]["precedes"][0], "retrieve_memory");
    EXPECT_EQ(r["result"]["strategyGuideSummary"], "Store facts, then retrieve them by key");
}

TEST_F(ToolsE2E, StoreThenRetrieve) {
    auto stored = client_.request(make_request(2, "tools/call",
        {{"name", "store_memory"}, {"arguments", {{"key", "lang"}, {"content", "C++17"}}}}));
    EXPECT_EQ(stored["result"]["content"][0]["text"], "stored lang");
    EXPECT_EQ(stored["result"]["structuredContent"]["size"], 1);

    auto retrieved = client_.request(make_request(3, "call tool",
        {{"name", "retrieve_memory"}, {"arguments", {{"key", "lang"}}}}));
    EXPECT_EQ(retrieved["result"]["content"][0]["text"], "C++17");
}

TEST_F(ToolsE2E, DomainErrorAndFailure) {
    auto empty = client_.request(make_request(2, "tools/call",
        {{"name", "store_memory"}, {"arguments", {{"key", "k"}, {"content", ""}}}}));
    EXPECT_EQ(empty["result"]["isError"], true);

    auto missing = client_.request(make_request(3, "tools/call",
        {{"name", "retrieve_memory"}, {"arguments", {{"key", "absent"}}}}));
    EXPECT_EQ(missing["error"]["code"], error::InternalError);
    EXPECT_EQ(missing["error"]["message"], "no memory stored under 'absent'");

    // Missing argument surfaces as a tool failure; the session continues.
    auto bad_args = client_.request(make_request(4, "tools/call", {{"name", "retrieve_memory"}}));
    EXPECT_EQ(bad_args["error"]["code"], error::InternalError);

    auto list = client_.request(make_request(5, "tools/list"));
    EXPECT_EQ(list["result"]["tools"].size(), 2u);

    EXPECT_EQ(metrics_->counter_value("tool_calls_total",
                                      {{"tool", "store_memory"}, {"status", "tool_error"}}), 1.0);
    EXPECT_EQ(metrics_->counter_value("tool_calls_total",
                                      {{"tool", "retrieve_memory"}, {"status", "error"}}), 2.0);
    EXPECT_EQ(metrics_->active_connections(), 1);
}

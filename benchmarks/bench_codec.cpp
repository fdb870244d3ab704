#include <benchmark/benchmark.h>
#include "zmcp/codec.hpp"
#include "zmcp/json_rpc.hpp"
#include <string>

using namespace zmcp;

static const std::string kInitializeRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"bench","version":"1"}}})";

static const std::string kToolCallRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"store_memory","arguments":{"content":"The build uses CMake presets","tags":["build","cmake"]}}})";

// tools/list reply body with n enhanced tools
static nlohmann::json make_tool_list(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"query", {{"type", "string"}, {"description", "What to look for"}}},
                    {"limit", {{"type", "integer"}, {"description", "Maximum results"}}}
                }},
                {"required", {"query"}}
            }},
            {"usageTriggers", {"When the user asks about earlier work"}},
            {"synergies", {{"follows", {"tool_0"}}}}
        });
    }
    return {{"tools", tools}};
}

// Request whose params carry a large argument payload
static std::string make_large_request(int n) {
    nlohmann::json req = {
        {"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
        {"params", {{"name", "bulk_store"}, {"arguments", make_tool_list(n)}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(100);

// ---- Parse benchmarks ----

static void BM_ParseInitialize(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kInitializeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kInitializeRequest.size());
}
BENCHMARK(BM_ParseInitialize)->MinTime(1.0);

static void BM_ParseToolCallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCallRequest.size());
}
BENCHMARK(BM_ParseToolCallRequest)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kLargeRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpParseError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeErrorReply(benchmark::State& state) {
    auto resp = JsonRpcResponse::failure(RequestId{int64_t{2}}, error::MethodNotFound,
                                         "Tool not found: nonexistent");
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeErrorReply)->MinTime(1.0);

static void BM_SerializeToolList(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, make_tool_list(100));
    size_t bytes = Codec::serialize(resp).size();

    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * bytes);
}
BENCHMARK(BM_SerializeToolList)->MinTime(1.0);

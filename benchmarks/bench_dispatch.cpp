#include <benchmark/benchmark.h>
#include "zmcp/router.hpp"
#include "zmcp/server.hpp"
#include "zmcp/session.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace zmcp;

// Router with n methods registered (unique_ptr: Router holds a mutex)
static std::unique_ptr<Router> make_router(int n_methods) {
    auto router = std::make_unique<Router>();
    for (int i = 0; i < n_methods; ++i) {
        router->on_request("method_" + std::to_string(i),
            [](const nlohmann::json&, const Context&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router->on_request("tools/list", [](const nlohmann::json&, const Context&) -> HandlerResult {
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });
    router->alias("list tools", "tools/list");
    router->require_initialized("tools/list");
    return router;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);
    Session session;
    session.mark_initialized();
    Context ctx;

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchAlias(benchmark::State& state) {
    auto router = make_router(1);
    Session session;
    session.mark_initialized();
    Context ctx;

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "list tools";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchAlias)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);
    Session session;
    Context ctx;

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchRejectedBeforeInitialize(benchmark::State& state) {
    auto router = make_router(1);
    Session session;
    Context ctx;

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = router->dispatch(req, session, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchRejectedBeforeInitialize)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);
    Session session;
    Context ctx;

    std::vector<JsonRpcRequest> requests;
    for (int i = 0; i < 100; ++i) {
        JsonRpcRequest req;
        req.id = RequestId{int64_t{i}};
        req.method = "method_" + std::to_string(i);
        requests.push_back(req);
    }

    int i = 0;
    for (auto _ : state) {
        auto resp = router->dispatch(requests[i % 100], session, ctx);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_HandleFrameToolsList(benchmark::State& state) {
    McpServer server;
    (void)server.handle_frame(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    const std::string frame = R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})";

    for (auto _ : state) {
        auto out = server.handle_frame(frame);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_HandleFrameToolsList)->MinTime(1.0);

static void BM_DispatchNotification(benchmark::State& state) {
    Router router;
    Session session;
    Context ctx;
    router.on_notification("notifications/initialized", [](const nlohmann::json&) {});

    JsonRpcNotification notif;
    notif.method = "notifications/initialized";

    for (auto _ : state) {
        auto resp = router.dispatch(notif, session, ctx);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchNotification)->MinTime(1.0);

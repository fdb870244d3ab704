#include <benchmark/benchmark.h>
#include "zmcp/codec.hpp"
#include "zmcp/server.hpp"
#include "zmcp/transport/stdio_transport.hpp"
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace zmcp;

static std::string make_list_request(int id) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"tools/list"})";
}

static void BM_StdioThroughput(benchmark::State& state) {
    const int N = static_cast<int>(state.range(0));

    int client_to_server[2];
    int server_to_client[2];
    if (pipe(client_to_server) < 0 || pipe(server_to_client) < 0) {
        state.SkipWithError("pipe failed");
        return;
    }

    std::atomic<int> responses_received{0};

    McpServer server;
    auto server_transport = std::make_unique<StdioTransport>(
        client_to_server[0], server_to_client[1]);
    std::thread server_thread([&server, t = std::move(server_transport)]() mutable {
        server.serve(std::move(t));
    });

    // Client side reads replies with its own transport over the return pipe.
    StdioTransport client_transport(server_to_client[0], client_to_server[1]);
    std::thread client_recv([&]() {
        client_transport.start([&](std::string) { ++responses_received; });
    });

    client_transport.send(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})");
    while (responses_received < 1) std::this_thread::sleep_for(std::chrono::microseconds(100));

    for (auto _ : state) {
        responses_received = 0;
        for (int i = 1; i <= N; ++i) {
            client_transport.send(make_list_request(i));
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (responses_received < N && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
    state.SetItemsProcessed(state.iterations() * N);

    server.shutdown();
    client_transport.shutdown();
    if (server_thread.joinable()) server_thread.join();
    if (client_recv.joinable()) client_recv.join();
}
BENCHMARK(BM_StdioThroughput)->Arg(100)->MinTime(2.0)->UseRealTime();

static void BM_HandleFrame1K(benchmark::State& state) {
    // Classify, dispatch and encode without a transport
    McpServer server;
    (void)server.handle_frame(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})");

    std::vector<std::string> frames;
    for (int i = 0; i < 1000; ++i) {
        frames.push_back(make_list_request(i));
    }

    for (auto _ : state) {
        for (const auto& raw : frames) {
            auto out = server.handle_frame(raw);
            benchmark::DoNotOptimize(out);
        }
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_HandleFrame1K)->MinTime(1.0);

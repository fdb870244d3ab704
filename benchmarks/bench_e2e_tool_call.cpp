#include <benchmark/benchmark.h>
#include "zmcp/server.hpp"
#include "zmcp/transport/stdio_transport.hpp"
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace zmcp;

namespace {

class EchoTool : public Tool {
public:
    explicit EchoTool(std::string name = "echo") : name_(std::move(name)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return "Echo the input text"; }
    nlohmann::json input_schema() const override { return {{"type", "object"}}; }
    CallToolResult execute(const Context&, const nlohmann::json& args) override {
        return CallToolResult::text(args.value("text", std::string()));
    }

private:
    std::string name_;
};

// Server over pipes plus a raw line client for round-trip benchmarking
struct E2EFixture {
    int c2s[2];  // client->server
    int s2c[2];  // server->client
    McpServer server;
    std::thread server_thread;
    std::string buffer;

    E2EFixture() {
        if (pipe(c2s) < 0 || pipe(s2c) < 0) throw std::runtime_error("pipe failed");
        server.register_tool(std::make_shared<EchoTool>());

        auto transport = std::make_unique<StdioTransport>(c2s[0], s2c[1]);
        server_thread = std::thread([this, t = std::move(transport)]() mutable {
            server.serve(std::move(t));
        });

        round_trip(R"({"jsonrpc":"2.0","id":0,"method":"initialize","params":{}})");
    }

    ~E2EFixture() {
        ::close(c2s[1]);  // EOF ends the session
        if (server_thread.joinable()) server_thread.join();
        ::close(s2c[0]);
    }

    std::string round_trip(const std::string& frame) {
        std::string out = frame + "\n";
        if (::write(c2s[1], out.data(), out.size()) != static_cast<ssize_t>(out.size())) {
            throw std::runtime_error("write failed");
        }
        while (true) {
            auto nl = buffer.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer.substr(0, nl);
                buffer.erase(0, nl + 1);
                return line;
            }
            char chunk[65536];
            ssize_t n = ::read(s2c[0], chunk, sizeof(chunk));
            if (n <= 0) throw std::runtime_error("server closed the stream");
            buffer.append(chunk, static_cast<size_t>(n));
        }
    }
};

} // namespace

static void BM_ToolCallStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string frame =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"text":"hello benchmark"}}})";

    for (auto _ : state) {
        auto reply = fixture.round_trip(frame);
        benchmark::DoNotOptimize(reply);
    }
    state.SetLabel("stdio tools/call roundtrip");
}
BENCHMARK(BM_ToolCallStdio)->MinTime(2.0)->UseRealTime();

static void BM_ListToolsStdio(benchmark::State& state) {
    E2EFixture fixture;
    for (int i = 0; i < 99; ++i) {
        fixture.server.register_tool(std::make_shared<EchoTool>("tool_" + std::to_string(i)));
    }
    const std::string frame = R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})";

    for (auto _ : state) {
        auto reply = fixture.round_trip(frame);
        benchmark::DoNotOptimize(reply);
    }
    state.SetLabel("tools/list roundtrip (100 tools)");
}
BENCHMARK(BM_ListToolsStdio)->MinTime(2.0)->UseRealTime();

static void BM_UnknownToolStdio(benchmark::State& state) {
    E2EFixture fixture;
    const std::string frame =
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"nonexistent"}})";

    for (auto _ : state) {
        auto reply = fixture.round_trip(frame);
        benchmark::DoNotOptimize(reply);
    }
    state.SetLabel("error reply roundtrip");
}
BENCHMARK(BM_UnknownToolStdio)->MinTime(2.0)->UseRealTime();

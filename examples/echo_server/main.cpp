/// Echo server: minimal zmcp server demonstrating tool registration.
/// Usage: ./echo_server [--config path.yaml] [--log-level debug|info|warn|error]
/// Communicates over stdio (newline-delimited JSON-RPC); logs go to stderr.

#include <zmcp/zmcp.hpp>
#include <csignal>
#include <fstream>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace {

class EchoTool : public zmcp::Tool {
public:
    std::string name() const override { return "echo"; }
    std::string description() const override {
        return "Echo the input text back to the caller";
    }
    nlohmann::json input_schema() const override {
        return {
            {"type", "object"},
            {"properties", {
                {"text", {{"type", "string"}, {"description", "The text to echo"}}}
            }},
            {"required", {"text"}}
        };
    }

    zmcp::CallToolResult execute(const zmcp::Context&, const nlohmann::json& args) override {
        auto it = args.find("text");
        if (it == args.end() || !it->is_string()) {
            return zmcp::CallToolResult::text("'text' must be a string", true);
        }
        return zmcp::CallToolResult::text(it->get<std::string>());
    }
};

/// Lists the registered tools; carries discovery hints for agents.
class DescribeToolsTool : public zmcp::EnhancedTool {
public:
    explicit DescribeToolsTool(const zmcp::ToolRegistry& registry) : registry_(registry) {}

    std::string name() const override { return "describe_tools"; }
    std::string description() const override {
        return "Summarize every tool this server offers";
    }
    nlohmann::json input_schema() const override {
        return {{"type", "object"}, {"properties", nlohmann::json::object()}};
    }

    std::vector<std::string> usage_triggers() const override {
        return {"At the start of a session", "When unsure which tool fits a task"};
    }
    std::vector<std::string> best_practices() const override {
        return {"Call once and cache the answer for the session"};
    }
    std::map<std::string, std::vector<std::string>> synergies() const override {
        return {{"precedes", {"echo"}}};
    }
    std::vector<nlohmann::json> workflow_snippets() const override {
        return {{{"goal", "Discover and try a tool"},
                 {"steps", {"describe_tools", "echo"}}}};
    }

    zmcp::CallToolResult execute(const zmcp::Context& ctx, const nlohmann::json&) override {
        ctx.throw_if_cancelled();
        nlohmann::json summary = nlohmann::json::array();
        std::string text;
        for (const auto& tool : registry_.tools()) {
            summary.push_back({{"name", tool->name()}, {"description", tool->description()}});
            text += tool->name() + ": " + tool->description() + "\n";
        }
        auto result = zmcp::CallToolResult::text(std::move(text));
        result.structured_content = nlohmann::json{{"tools", std::move(summary)}};
        return result;
    }

private:
    const zmcp::ToolRegistry& registry_;
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--config path.yaml] [--log-level debug|info|warn|error]\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_level;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    zmcp::Config config;
    try {
        config = zmcp::load_config(config_path);
        if (!log_level.empty()) config.logging.level = log_level;
        zmcp::logging::init(config.logging);
    } catch (const zmcp::McpConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    auto log = zmcp::logging::get("main");

    // Signals are consumed by a dedicated thread so that cancellation runs
    // outside of signal-handler context.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    zmcp::Context ctx;
    std::thread([signals, ctx, log]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            log->info("Received signal {}, shutting down", sig);
            ctx.cancel();
        }
    }).detach();

    std::shared_ptr<zmcp::Metrics> metrics;
    if (config.monitoring.metrics_enabled) metrics = std::make_shared<zmcp::Metrics>();

    zmcp::McpServer server{config.to_server_options(metrics)};
    server.register_tool(std::make_shared<EchoTool>());
    server.register_tool(std::make_shared<DescribeToolsTool>(server.registry()));

    int exit_code = 0;
    try {
        auto reason = server.serve_stdio(ctx);
        log->info("Server stopped ({})",
                  reason == zmcp::StopReason::Cancelled ? "cancelled" : "disconnected");
    } catch (const zmcp::McpError& e) {
        log->error("Server failed: {}", e.what());
        exit_code = 1;
    }

    if (metrics && !config.monitoring.metrics_file.empty()) {
        std::ofstream out(config.monitoring.metrics_file);
        if (out) {
            out << metrics->render_prometheus();
        } else {
            log->warn("Cannot write metrics to {}", config.monitoring.metrics_file);
        }
    }
    return exit_code;
}

#include "zmcp/server.hpp"
#include "zmcp/codec.hpp"
#include "zmcp/error.hpp"
#include "zmcp/logging.hpp"
#include "zmcp/router.hpp"
#include "zmcp/session.hpp"
#include "zmcp/transport/stdio_transport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace zmcp {

namespace {

using Clock = std::chrono::steady_clock;

std::string dump_for_log(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Session session;
    Router router;
    ToolRegistry registry;

    // Transport and serving context of the active serve() call
    std::mutex transport_mutex;
    ITransport* transport{nullptr};
    std::optional<Context> serve_ctx;

    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};

    std::shared_ptr<spdlog::logger> log = logging::get("server");

    explicit Impl(Options o) : opts(std::move(o)) {
        router.set_metrics(opts.metrics);
    }

    void record_error(const std::string& component, const std::string& type) {
        if (opts.metrics) opts.metrics->record_error(component, type);
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params,
                                               const Context&) -> HandlerResult {
            // Client declarations are informational; malformed ones are ignored.
            if (params.is_object()) {
                auto ci = params.find("clientInfo");
                if (ci != params.end() && ci->is_object()) {
                    auto name = ci->find("name");
                    auto version = ci->find("version");
                    if (name != ci->end() && name->is_string()) {
                        Implementation info;
                        info.name = name->get<std::string>();
                        if (version != ci->end() && version->is_string()) {
                            info.version = version->get<std::string>();
                        }
                        session.set_client_info(std::move(info));
                    }
                }
                auto pv = params.find("protocolVersion");
                if (pv != params.end() && pv->is_string()) {
                    session.set_client_protocol_version(pv->get<std::string>());
                }
            }

            session.mark_initialized();

            auto client = session.client_info();
            log->info("Session initialized (client: {} {}, protocol: {})",
                      client ? client->name : "unknown",
                      client ? client->version : "",
                      session.client_protocol_version().value_or("unspecified"));

            InitializeResult result;
            result.protocol_version = opts.protocol_version;
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;
            return nlohmann::json(result);
        });

        router.on_notification("notifications/initialized", [this](const nlohmann::json&) {
            log->debug("Client confirmed initialization");
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&,
                                               const Context&) -> HandlerResult {
            nlohmann::json tools = nlohmann::json::array();
            for (const auto& tool : registry.tools()) {
                tools.push_back(nlohmann::json(describe_tool(*tool)));
            }
            nlohmann::json result = {{"tools", std::move(tools)}};
            if (opts.strategy_guide_summary) {
                result["strategyGuideSummary"] = *opts.strategy_guide_summary;
            }
            return result;
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params,
                                               const Context& ctx) -> HandlerResult {
            if (!params.is_object()) {
                return JsonRpcError{error::InvalidParams, "Invalid params", std::nullopt};
            }
            auto name_it = params.find("name");
            if (name_it == params.end() || !name_it->is_string()) {
                return JsonRpcError{error::InvalidParams, "Tool name required", std::nullopt};
            }
            std::string name = name_it->get<std::string>();

            auto tool = registry.find(name);
            if (!tool) {
                return JsonRpcError{error::MethodNotFound, "Tool not found: " + name,
                                    std::nullopt};
            }

            nlohmann::json arguments = nlohmann::json::object();
            auto args_it = params.find("arguments");
            if (args_it != params.end() && args_it->is_object()) {
                arguments = *args_it;
            }

            Context call_ctx = opts.tool_timeout
                ? Context::with_timeout(ctx, *opts.tool_timeout)
                : Context::child_of(ctx);

            log->info("Executing tool {}", name);
            log->debug("Tool {} arguments: {}", name, dump_for_log(arguments));

            auto started = Clock::now();
            try {
                CallToolResult result = tool->execute(call_ctx, arguments);
                if (opts.metrics) {
                    opts.metrics->record_tool_call(name,
                                                   result.is_error ? "tool_error" : "success",
                                                   Clock::now() - started);
                }
                return nlohmann::json(result);
            } catch (const std::exception& e) {
                log->error("Tool {} failed: {}", name, e.what());
                if (opts.metrics) {
                    opts.metrics->record_tool_call(name, "error", Clock::now() - started);
                }
                record_error("tool", "execution_failed");
                return JsonRpcError{error::InternalError, e.what(), std::nullopt};
            }
        });

        router.alias("list tools", "tools/list");
        router.alias("call tool", "tools/call");
        router.require_initialized("tools/list");
        router.require_initialized("tools/call");
    }

    // Skipped once the session is shutting down. Runs on the reader thread
    // inside transport->start(), so the transport outlives the send. The
    // lock is not held across send() so that shutdown() can abort a write
    // blocked on a peer that stopped reading.
    void write_reply(const std::string& frame, const Context& ctx) {
        ITransport* t = nullptr;
        {
            std::lock_guard<std::mutex> lock(transport_mutex);
            if (!transport || stop_requested || ctx.cancelled()) {
                log->debug("Session stopping; reply not written");
                return;
            }
            t = transport;
        }
        t->send(frame);
    }

    void end_serve() {
        {
            std::lock_guard<std::mutex> lock(transport_mutex);
            transport = nullptr;
            serve_ctx.reset();
        }
        running = false;
        if (opts.metrics) opts.metrics->set_active_connections(0);
    }
};

// ----------- McpServer -----------

McpServer::McpServer() : McpServer(Options{}) {}

McpServer::McpServer(Options opts) : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

void McpServer::register_tool(std::shared_ptr<Tool> tool) {
    impl_->registry.register_tool(std::move(tool));
}

const ToolRegistry& McpServer::registry() const {
    return impl_->registry;
}

const Session& McpServer::session() const {
    return impl_->session;
}

std::optional<std::string> McpServer::handle_frame(std::string_view line, const Context& ctx) {
    auto& log = impl_->log;
    log->debug("Frame received ({} bytes)", line.size());

    std::optional<JsonRpcResponse> resp;
    try {
        JsonRpcMessage msg = Codec::parse(line);
        resp = impl_->router.dispatch(msg, impl_->session, ctx);
    } catch (const McpRequestError& e) {
        log->warn("Rejected request: {}", e.what());
        impl_->record_error("codec", "invalid_request");
        resp = JsonRpcResponse::failure(e.id, e.code, e.what());
    } catch (const McpProtocolError& e) {
        log->warn("Ignoring frame: {}", e.what());
        impl_->record_error("codec", "unexpected_frame");
        return std::nullopt;
    } catch (const McpParseError& e) {
        log->warn("Failed to parse frame: {}", e.what());
        impl_->record_error("codec", "parse_error");
        resp = JsonRpcResponse::failure(std::nullopt, error::ParseError, "Invalid JSON");
    }

    if (!resp) return std::nullopt;
    return Codec::serialize(*resp);
}

StopReason McpServer::serve(std::unique_ptr<ITransport> transport, const Context& ctx) {
    if (impl_->running.exchange(true)) {
        throw McpError("Server is already serving a session");
    }

    auto* t = transport.get();
    Context serve_ctx = Context::child_of(ctx);
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = t;
        impl_->serve_ctx = serve_ctx;
    }
    impl_->stop_requested = false;
    if (impl_->opts.metrics) impl_->opts.metrics->set_active_connections(1);

    // Cancelling the caller's context stops the read loop.
    std::size_t cancel_handle = ctx.on_cancel([this] { shutdown(); });

    auto& log = impl_->log;
    log->info("Serving MCP session");

    try {
        t->start(
            [this, &serve_ctx](std::string line) {
                if (impl_->stop_requested) return;
                if (serve_ctx.cancelled()) {
                    // Deadline on the caller's context
                    shutdown();
                    return;
                }
                auto reply = handle_frame(line, serve_ctx);
                if (reply) impl_->write_reply(*reply, serve_ctx);
            },
            [this, &serve_ctx](std::exception_ptr ep) {
                try {
                    std::rethrow_exception(ep);
                } catch (const McpFrameTooLargeError& e) {
                    impl_->log->warn("{}", e.what());
                    impl_->record_error("transport", "frame_too_large");
                    auto resp = JsonRpcResponse::failure(std::nullopt, error::ParseError,
                                                         "Request too large");
                    impl_->write_reply(Codec::serialize(resp), serve_ctx);
                } catch (const std::exception& e) {
                    impl_->log->error("Read error: {}", e.what());
                    impl_->record_error("transport", "read_error");
                }
            });
    } catch (const McpTransportError& e) {
        ctx.remove_on_cancel(cancel_handle);
        bool stopping = impl_->stop_requested;
        impl_->end_serve();
        if (stopping) {
            log->info("Session shut down");
            return StopReason::Cancelled;
        }
        log->error("Transport failure: {}", e.what());
        impl_->record_error("transport", "write_error");
        throw;
    } catch (const std::exception& e) {
        ctx.remove_on_cancel(cancel_handle);
        impl_->end_serve();
        log->error("Session aborted: {}", e.what());
        throw;
    }

    ctx.remove_on_cancel(cancel_handle);
    bool stopped = impl_->stop_requested;
    impl_->end_serve();

    if (stopped) {
        log->info("Session shut down");
        return StopReason::Cancelled;
    }
    log->info("Client disconnected");
    return StopReason::Disconnected;
}

StopReason McpServer::serve_stdio(const Context& ctx) {
    StdioTransport::Options topts;
    topts.max_frame_size = impl_->opts.max_frame_size;
    return serve(std::make_unique<StdioTransport>(topts), ctx);
}

void McpServer::shutdown() {
    impl_->stop_requested = true;
    std::optional<Context> serve_ctx;
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        serve_ctx = impl_->serve_ctx;
        if (impl_->transport) {
            impl_->transport->shutdown();
        }
    }
    // Running tools observe this through their call context.
    if (serve_ctx) serve_ctx->cancel();
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace zmcp

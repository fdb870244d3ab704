#pragma once
#include "context.hpp"
#include "metrics.hpp"
#include "session.hpp"
#include "tool.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include "version.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace zmcp {

/// Why serve() returned.
enum class StopReason {
    Disconnected,  // peer closed the stream
    Cancelled      // shutdown() or the serving Context was cancelled
};

/// JSON-RPC 2.0 / MCP server for a single client over a line transport.
///
/// Methods: initialize, tools/list ("list tools"), tools/call ("call tool"),
/// and the notifications/initialized notification. Frames are processed
/// strictly in order, one reply per request.
class McpServer {
public:
    struct Options {
        Implementation server_info{std::string(SERVER_NAME), std::string(LIBRARY_VERSION)};
        std::string protocol_version{PROTOCOL_VERSION};
        std::optional<std::string> instructions;
        /// Emitted as strategyGuideSummary in tools/list when set.
        std::optional<std::string> strategy_guide_summary;
        size_t max_frame_size = 10 * 1024 * 1024;
        /// Per tools/call deadline derived from the serving context.
        std::optional<std::chrono::milliseconds> tool_timeout;
        std::shared_ptr<MetricsSink> metrics;
    };

    McpServer();
    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----
    void register_tool(std::shared_ptr<Tool> tool);
    [[nodiscard]] const ToolRegistry& registry() const;

    [[nodiscard]] const Session& session() const;

    // ---- Serving ----

    /// Serve one session. Blocks until the stream ends or ctx is cancelled.
    /// Throws McpTransportError when a reply cannot be encoded or written.
    StopReason serve(std::unique_ptr<ITransport> transport, const Context& ctx = Context());
    StopReason serve_stdio(const Context& ctx = Context());

    /// Process one raw frame and return the serialized reply, if any.
    [[nodiscard]] std::optional<std::string> handle_frame(std::string_view line,
                                                          const Context& ctx = Context());

    void shutdown();
    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace zmcp

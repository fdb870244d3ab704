#pragma once
#include "context.hpp"
#include "json_rpc.hpp"
#include "metrics.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <variant>

namespace zmcp {

class Session;

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;

/// params is null when the frame carried none.
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params,
                                                   const Context& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Route requests for alias to method (both gating and handler lookup
    /// use the canonical name).
    void alias(const std::string& alias, const std::string& method);

    /// Reject method with InvalidRequest until the session is initialized.
    void require_initialized(const std::string& method);

    /// Optional side channel; nullptr disables recording.
    void set_metrics(std::shared_ptr<MetricsSink> metrics);

    /// Dispatch an incoming message. Returns a response for requests and
    /// nullopt for notifications.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg,
                                                          const Session& session,
                                                          const Context& ctx);

    [[nodiscard]] bool has_handler(const std::string& method) const;

    /// Canonical method name for method (itself when not an alias).
    [[nodiscard]] std::string resolve(const std::string& method) const;

private:
    JsonRpcResponse dispatch_request(const JsonRpcRequest& req, const Session& session,
                                     const Context& ctx);
    void dispatch_notification(const JsonRpcNotification& notif);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::unordered_map<std::string, std::string> aliases_;
    std::unordered_set<std::string> gated_methods_;
    std::shared_ptr<MetricsSink> metrics_;
};

} // namespace zmcp

#include "zmcp/router.hpp"
#include "zmcp/error.hpp"
#include "zmcp/logging.hpp"
#include "zmcp/session.hpp"
#include <chrono>
#include <stdexcept>

namespace zmcp {

namespace {

nlohmann::json params_or_null(const std::optional<nlohmann::json>& params) {
    return params ? *params : nlohmann::json();
}

} // anonymous namespace

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Router::alias(const std::string& alias, const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_[alias] = method;
}

void Router::require_initialized(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    gated_methods_.insert(method);
}

void Router::set_metrics(std::shared_ptr<MetricsSink> metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_ = std::move(metrics);
}

bool Router::has_handler(const std::string& method) const {
    std::string canonical = resolve(method);
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(canonical) > 0
           || notification_handlers_.count(canonical) > 0;
}

std::string Router::resolve(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(method);
    return it == aliases_.end() ? method : it->second;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcMessage& msg,
                                                const Session& session,
                                                const Context& ctx) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        std::shared_ptr<MetricsSink> metrics;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            metrics = metrics_;
        }
        auto started = std::chrono::steady_clock::now();
        JsonRpcResponse resp = dispatch_request(*req, session, ctx);
        if (metrics) {
            // Unknown methods share one label so untrusted input cannot grow the series set.
            std::string label = has_handler(req->method) ? resolve(req->method) : "unknown";
            metrics->record_request(label, resp.error ? "error" : "success",
                                    std::chrono::steady_clock::now() - started);
        }
        return resp;
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        dispatch_notification(*notif);
    }
    return std::nullopt;
}

JsonRpcResponse Router::dispatch_request(const JsonRpcRequest& req, const Session& session,
                                         const Context& ctx) {
    // Hold lock only to resolve and look up the handler
    RequestHandler handler;
    std::string method;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto alias_it = aliases_.find(req.method);
        method = alias_it == aliases_.end() ? req.method : alias_it->second;

        auto it = request_handlers_.find(method);
        if (it == request_handlers_.end()) {
            return JsonRpcResponse::failure(req.id, error::MethodNotFound,
                                            "Method not found: " + req.method);
        }
        if (gated_methods_.count(method) > 0 && !session.is_initialized()) {
            return JsonRpcResponse::failure(req.id, error::InvalidRequest,
                                            "Server not initialized");
        }
        handler = it->second;
    }

    // Call handler WITHOUT holding the lock; handlers may re-enter the router.
    try {
        auto result = handler(params_or_null(req.params), ctx);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            return JsonRpcResponse::success(req.id, std::move(*ok));
        }
        auto& err = std::get<JsonRpcError>(result);
        return JsonRpcResponse::failure(req.id, err.code, err.message, err.data);
    } catch (const McpProtocolError& e) {
        return JsonRpcResponse::failure(req.id, e.code, e.what());
    } catch (const nlohmann::json::exception& e) {
        return JsonRpcResponse::failure(req.id, error::InvalidParams, e.what());
    } catch (const std::exception& e) {
        logging::get("router")->error("Handler for {} failed: {}", method, e.what());
        return JsonRpcResponse::failure(req.id, error::InternalError, e.what());
    }
}

void Router::dispatch_notification(const JsonRpcNotification& notif) {
    auto log = logging::get("router");
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notif.method);
        if (it == notification_handlers_.end()) {
            log->debug("Unknown notification received: {}", notif.method);
            return;
        }
        handler = it->second;
    }
    // Notifications never produce replies; failures are only logged.
    try {
        handler(params_or_null(notif.params));
    } catch (const std::exception& e) {
        log->error("Notification handler for {} failed: {}", notif.method, e.what());
    }
}

} // namespace zmcp

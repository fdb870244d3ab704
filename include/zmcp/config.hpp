#pragma once
#include "logging.hpp"
#include "server.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace zmcp {

struct ServerConfig {
    std::string name{SERVER_NAME};
    std::string version{LIBRARY_VERSION};
    std::string protocol_version{PROTOCOL_VERSION};
    std::optional<std::string> instructions;
    /// An empty string in the file disables the summary.
    std::optional<std::string> strategy_guide_summary{std::string(DEFAULT_STRATEGY_GUIDE_SUMMARY)};
    size_t max_request_size = 10 * 1024 * 1024;
    std::optional<std::chrono::seconds> tool_timeout;
};

struct MonitoringConfig {
    bool metrics_enabled = true;
    /// Prometheus text dump written on shutdown when non-empty.
    std::string metrics_file;
};

struct Config {
    ServerConfig server;
    logging::LoggingConfig logging;
    MonitoringConfig monitoring;

    [[nodiscard]] McpServer::Options to_server_options(
        std::shared_ptr<MetricsSink> metrics = nullptr) const;
};

/// Load from a YAML file, then apply environment overrides.
/// An empty path yields defaults plus environment.
/// Throws McpConfigError on unreadable or invalid input.
Config load_config(const std::string& path);

/// Parse YAML text without environment overrides.
Config parse_config(const std::string& yaml_text);

/// ZMCP_LOG_LEVEL, ZMCP_LOG_FILE, ZMCP_MAX_REQUEST_SIZE,
/// ZMCP_TOOL_TIMEOUT_SECONDS, ZMCP_METRICS_ENABLED, ZMCP_METRICS_FILE.
void apply_env_overrides(Config& config);

/// "512", "64KB", "10MB", "1GB" (case-insensitive, optional space).
size_t parse_size(const std::string& text);

} // namespace zmcp

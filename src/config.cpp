#include "zmcp/config.hpp"
#include "zmcp/error.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <yaml-cpp/yaml.h>

namespace zmcp {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string validate_level(const std::string& level) {
    const std::string lower = to_lower(level);
    if (lower == "debug" || lower == "info" || lower == "warn" || lower == "warning"
        || lower == "error") {
        return lower;
    }
    throw McpConfigError("Unknown log level: " + level);
}

bool parse_bool(const std::string& key, const std::string& text) {
    const std::string lower = to_lower(text);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    throw McpConfigError(key + ": expected a boolean, got '" + text + "'");
}

// One day; longer tool deadlines are treated as misconfiguration.
constexpr long long kMaxToolTimeoutSeconds = 24 * 60 * 60;

std::chrono::seconds parse_timeout(const std::string& key, long long seconds) {
    if (seconds < 0) {
        throw McpConfigError(key + ": must not be negative");
    }
    if (seconds > kMaxToolTimeoutSeconds) {
        throw McpConfigError(key + ": must not exceed " + std::to_string(kMaxToolTimeoutSeconds)
                             + " seconds");
    }
    return std::chrono::seconds(seconds);
}

template <typename T>
T scalar(const YAML::Node& node, const std::string& key) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw McpConfigError("Invalid value for '" + key + "': " + e.what());
    }
}

void parse_server(const YAML::Node& node, ServerConfig& server) {
    if (!node.IsMap()) throw McpConfigError("'server' must be a mapping");

    if (node["name"]) server.name = scalar<std::string>(node["name"], "server.name");
    if (node["version"]) server.version = scalar<std::string>(node["version"], "server.version");
    if (node["protocol_version"]) {
        server.protocol_version =
            scalar<std::string>(node["protocol_version"], "server.protocol_version");
    }
    if (node["instructions"]) {
        server.instructions = scalar<std::string>(node["instructions"], "server.instructions");
    }
    if (node["strategy_guide_summary"]) {
        server.strategy_guide_summary =
            scalar<std::string>(node["strategy_guide_summary"], "server.strategy_guide_summary");
    }
    if (node["max_request_size"]) {
        server.max_request_size =
            parse_size(scalar<std::string>(node["max_request_size"], "server.max_request_size"));
    }
    if (node["tool_timeout"]) {
        server.tool_timeout = parse_timeout(
            "server.tool_timeout", scalar<long long>(node["tool_timeout"], "server.tool_timeout"));
    }
}

void parse_logging(const YAML::Node& node, logging::LoggingConfig& log) {
    if (!node.IsMap()) throw McpConfigError("'logging' must be a mapping");

    if (node["level"]) log.level = validate_level(scalar<std::string>(node["level"], "logging.level"));
    if (node["file"]) log.file = scalar<std::string>(node["file"], "logging.file");
}

void parse_monitoring(const YAML::Node& node, MonitoringConfig& monitoring) {
    if (!node.IsMap()) throw McpConfigError("'monitoring' must be a mapping");

    if (node["metrics_enabled"]) {
        monitoring.metrics_enabled =
            scalar<bool>(node["metrics_enabled"], "monitoring.metrics_enabled");
    }
    if (node["metrics_file"]) {
        monitoring.metrics_file = scalar<std::string>(node["metrics_file"], "monitoring.metrics_file");
    }
}

Config from_root(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return config;
    if (!root.IsMap()) throw McpConfigError("Configuration root must be a mapping");

    if (root["server"]) parse_server(root["server"], config.server);
    if (root["logging"]) parse_logging(root["logging"], config.logging);
    if (root["monitoring"]) parse_monitoring(root["monitoring"], config.monitoring);
    return config;
}

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // anonymous namespace

size_t parse_size(const std::string& text) {
    size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;

    size_t digits_start = i;
    unsigned long long value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        unsigned digit = static_cast<unsigned>(text[i] - '0');
        if (value > (std::numeric_limits<unsigned long long>::max() - digit) / 10) {
            throw McpConfigError("Size out of range: " + text);
        }
        value = value * 10 + digit;
        ++i;
    }
    if (i == digits_start) throw McpConfigError("Invalid size: '" + text + "'");

    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    std::string unit = to_lower(text.substr(i));
    while (!unit.empty() && std::isspace(static_cast<unsigned char>(unit.back()))) unit.pop_back();

    unsigned long long multiplier = 1;
    if (unit.empty() || unit == "b") {
        multiplier = 1;
    } else if (unit == "kb" || unit == "k") {
        multiplier = 1024ULL;
    } else if (unit == "mb" || unit == "m") {
        multiplier = 1024ULL * 1024;
    } else if (unit == "gb" || unit == "g") {
        multiplier = 1024ULL * 1024 * 1024;
    } else {
        throw McpConfigError("Invalid size unit in '" + text + "'");
    }

    if (value > std::numeric_limits<size_t>::max() / multiplier) {
        throw McpConfigError("Size out of range: " + text);
    }
    return static_cast<size_t>(value * multiplier);
}

Config parse_config(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw McpConfigError("Failed to parse YAML: " + std::string(e.what()));
    }
    return from_root(root);
}

Config load_config(const std::string& path) {
    Config config;
    if (!path.empty()) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            throw McpConfigError("Cannot read config file: " + path);
        } catch (const YAML::Exception& e) {
            throw McpConfigError("Failed to parse YAML file " + path + ": " + e.what());
        }
        config = from_root(root);
    }
    apply_env_overrides(config);
    return config;
}

void apply_env_overrides(Config& config) {
    if (const char* v = env("ZMCP_LOG_LEVEL")) config.logging.level = validate_level(v);
    if (const char* v = env("ZMCP_LOG_FILE")) config.logging.file = v;
    if (const char* v = env("ZMCP_MAX_REQUEST_SIZE")) config.server.max_request_size = parse_size(v);
    if (const char* v = env("ZMCP_TOOL_TIMEOUT_SECONDS")) {
        char* end = nullptr;
        long long seconds = std::strtoll(v, &end, 10);
        if (end == v || *end != '\0') {
            throw McpConfigError(std::string("ZMCP_TOOL_TIMEOUT_SECONDS: not a number: ") + v);
        }
        config.server.tool_timeout = parse_timeout("ZMCP_TOOL_TIMEOUT_SECONDS", seconds);
    }
    if (const char* v = env("ZMCP_METRICS_ENABLED")) {
        config.monitoring.metrics_enabled = parse_bool("ZMCP_METRICS_ENABLED", v);
    }
    if (const char* v = env("ZMCP_METRICS_FILE")) config.monitoring.metrics_file = v;
}

McpServer::Options Config::to_server_options(std::shared_ptr<MetricsSink> metrics) const {
    McpServer::Options opts;
    opts.server_info = Implementation{server.name, server.version};
    opts.protocol_version = server.protocol_version;
    opts.instructions = server.instructions;
    if (server.strategy_guide_summary && !server.strategy_guide_summary->empty()) {
        opts.strategy_guide_summary = server.strategy_guide_summary;
    }
    opts.max_frame_size = server.max_request_size;
    if (server.tool_timeout && server.tool_timeout->count() > 0) {
        opts.tool_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(*server.tool_timeout);
    }
    opts.metrics = monitoring.metrics_enabled ? std::move(metrics) : nullptr;
    return opts;
}

} // namespace zmcp

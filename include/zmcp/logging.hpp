#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace zmcp::logging {

struct LoggingConfig {
    /// debug, info, warn, error
    std::string level = "info";
    /// Empty: log to stderr. stdout always belongs to the protocol.
    std::string file;
};

/// Unknown names map to info.
spdlog::level::level_enum parse_level(const std::string& name);

/// Install sinks and level for every zmcp logger, existing and future.
/// Throws McpConfigError if the log file cannot be opened.
void init(const LoggingConfig& config);

/// Route every zmcp logger to sink (tests).
void init_with_sink(spdlog::sink_ptr sink, spdlog::level::level_enum level);

/// Named logger sharing the configured sinks, e.g. get("server") is
/// registered as "zmcp.server".
std::shared_ptr<spdlog::logger> get(const std::string& name);

} // namespace zmcp::logging

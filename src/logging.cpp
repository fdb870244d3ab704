#include "zmcp/logging.hpp"
#include "zmcp/error.hpp"
#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace zmcp::logging {

namespace {

constexpr const char* kLoggerPrefix = "zmcp.";
constexpr const char* kPattern = "%Y-%m-%dT%H:%M:%S.%e %^%l%$ [%n] %v";

struct LogState {
    std::mutex mutex;
    std::vector<spdlog::sink_ptr> sinks;
    spdlog::level::level_enum level = spdlog::level::info;
};

LogState& state() {
    static LogState s;
    return s;
}

// Caller holds state().mutex.
void ensure_default_sinks(LogState& s) {
    if (s.sinks.empty()) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern(kPattern);
        s.sinks.push_back(std::move(sink));
    }
}

// Caller holds state().mutex.
void apply_to_existing(const LogState& s) {
    spdlog::apply_all([&s](std::shared_ptr<spdlog::logger> l) {
        if (l->name().rfind(kLoggerPrefix, 0) != 0) return;
        l->sinks() = s.sinks;
        l->set_level(s.level);
    });
}

} // anonymous namespace

spdlog::level::level_enum parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void init(const LoggingConfig& config) {
    spdlog::sink_ptr sink;
    if (config.file.empty()) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        try {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file);
        } catch (const spdlog::spdlog_ex& e) {
            throw McpConfigError("Cannot open log file '" + config.file + "': " + e.what());
        }
    }
    sink->set_pattern(kPattern);

    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sinks = {std::move(sink)};
    s.level = parse_level(config.level);
    apply_to_existing(s);
}

void init_with_sink(spdlog::sink_ptr sink, spdlog::level::level_enum level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sinks = {std::move(sink)};
    s.level = level;
    apply_to_existing(s);
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    const std::string full = kLoggerPrefix + name;
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (auto existing = spdlog::get(full)) {
        return existing;
    }
    ensure_default_sinks(s);
    auto logger = std::make_shared<spdlog::logger>(full, s.sinks.begin(), s.sinks.end());
    logger->set_level(s.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // namespace zmcp::logging

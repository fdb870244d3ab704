#include "zmcp/metrics.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace zmcp {

namespace {

constexpr const char* kRequestsTotal        = "requests_total";
constexpr const char* kRequestDuration      = "request_duration_seconds";
constexpr const char* kToolCallsTotal       = "tool_calls_total";
constexpr const char* kToolCallDuration     = "tool_call_duration_seconds";
constexpr const char* kErrorsTotal          = "errors_total";
constexpr const char* kActiveConnections    = "active_connections";

std::string escape_label_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string format_labels(const Metrics::Labels& labels,
                          const std::string& extra_key = {},
                          const std::string& extra_value = {}) {
    if (labels.empty() && extra_key.empty()) return "";
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (const auto& [k, v] : labels) {
        if (!first) oss << ',';
        oss << k << "=\"" << escape_label_value(v) << '"';
        first = false;
    }
    if (!extra_key.empty()) {
        if (!first) oss << ',';
        oss << extra_key << "=\"" << extra_value << '"';
    }
    oss << '}';
    return oss.str();
}

std::string format_number(double v) {
    if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
    std::ostringstream oss;
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        oss << static_cast<int64_t>(v);
    } else {
        oss.precision(9);
        oss << v;
    }
    return oss.str();
}

} // anonymous namespace

const std::vector<double>& Metrics::default_buckets() {
    static const std::vector<double> buckets{
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10
    };
    return buckets;
}

Metrics::Metrics(std::string prefix) : prefix_(std::move(prefix)) {}

void Metrics::record_request(const std::string& method, const std::string& status,
                             std::chrono::duration<double> elapsed) {
    inc_counter(kRequestsTotal, "Total number of JSON-RPC requests",
                {{"method", method}, {"status", status}});
    observe(kRequestDuration, "JSON-RPC request latency",
            {{"method", method}}, elapsed.count());
}

void Metrics::record_tool_call(const std::string& tool, const std::string& status,
                               std::chrono::duration<double> elapsed) {
    inc_counter(kToolCallsTotal, "Total number of tool invocations",
                {{"tool", tool}, {"status", status}});
    observe(kToolCallDuration, "Tool invocation latency",
            {{"tool", tool}}, elapsed.count());
}

void Metrics::record_error(const std::string& component, const std::string& error_type) {
    inc_counter(kErrorsTotal, "Total number of errors",
                {{"component", component}, {"error_type", error_type}});
}

void Metrics::set_active_connections(int64_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_connections_ = n;
}

double Metrics::counter_value(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fit = families_.find(name);
    if (fit == families_.end()) return 0.0;
    auto it = fit->second.counters.find(labels);
    return it == fit->second.counters.end() ? 0.0 : it->second;
}

uint64_t Metrics::histogram_count(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fit = families_.find(name);
    if (fit == families_.end()) return 0;
    auto it = fit->second.histograms.find(labels);
    return it == fit->second.histograms.end() ? 0 : it->second.count;
}

double Metrics::histogram_sum(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto fit = families_.find(name);
    if (fit == families_.end()) return 0.0;
    auto it = fit->second.histograms.find(labels);
    return it == fit->second.histograms.end() ? 0.0 : it->second.sum;
}

int64_t Metrics::active_connections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_connections_;
}

void Metrics::inc_counter(const std::string& name, const std::string& help,
                          const Labels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& family = families_[name];
    family.help = help;
    family.counters[labels] += 1.0;
}

void Metrics::observe(const std::string& name, const std::string& help,
                      const Labels& labels, double value) {
    const auto& bounds = default_buckets();
    std::lock_guard<std::mutex> lock(mutex_);
    auto& family = families_[name];
    family.help = help;
    family.is_histogram = true;
    auto& h = family.histograms[labels];
    if (h.bucket_counts.empty()) h.bucket_counts.assign(bounds.size(), 0);
    for (size_t i = 0; i < bounds.size(); ++i) {
        if (value <= bounds[i]) ++h.bucket_counts[i];
    }
    ++h.count;
    h.sum += value;
}

std::string Metrics::full_name(const std::string& name) const {
    return prefix_.empty() ? name : prefix_ + "_" + name;
}

std::string Metrics::render_prometheus() const {
    const auto& bounds = default_buckets();
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;

    for (const auto& [name, family] : families_) {
        std::string full = full_name(name);
        out << "# HELP " << full << ' ' << family.help << '\n';
        if (!family.is_histogram) {
            out << "# TYPE " << full << " counter\n";
            for (const auto& [labels, value] : family.counters) {
                out << full << format_labels(labels) << ' ' << format_number(value) << '\n';
            }
            continue;
        }
        out << "# TYPE " << full << " histogram\n";
        for (const auto& [labels, h] : family.histograms) {
            for (size_t i = 0; i < bounds.size(); ++i) {
                out << full << "_bucket" << format_labels(labels, "le", format_number(bounds[i]))
                    << ' ' << h.bucket_counts[i] << '\n';
            }
            out << full << "_bucket" << format_labels(labels, "le", "+Inf")
                << ' ' << h.count << '\n';
            out << full << "_sum" << format_labels(labels) << ' ' << format_number(h.sum) << '\n';
            out << full << "_count" << format_labels(labels) << ' ' << h.count << '\n';
        }
    }

    std::string gauge = full_name(kActiveConnections);
    out << "# HELP " << gauge << " Number of active MCP connections\n";
    out << "# TYPE " << gauge << " gauge\n";
    out << gauge << ' ' << active_connections_ << '\n';
    return out.str();
}

} // namespace zmcp

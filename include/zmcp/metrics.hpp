#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace zmcp {

/// Observability side channel around dispatch and tool execution.
/// Implementations must not throw and must not block for long; the
/// dispatcher calls them inline.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    /// One completed dispatch. status is "success" or "error".
    virtual void record_request(const std::string& method, const std::string& status,
                                std::chrono::duration<double> elapsed) = 0;

    /// One completed tool invocation. status is "success", "error" or
    /// "tool_error" (result carried isError).
    virtual void record_tool_call(const std::string& tool, const std::string& status,
                                  std::chrono::duration<double> elapsed) = 0;

    virtual void record_error(const std::string& component, const std::string& error_type) = 0;

    virtual void set_active_connections(int64_t n) = 0;
};

/// Thread-safe in-process MetricsSink with Prometheus text exposition.
class Metrics : public MetricsSink {
public:
    using Labels = std::map<std::string, std::string>;

    /// Prometheus client default buckets, in seconds.
    static const std::vector<double>& default_buckets();

    explicit Metrics(std::string prefix = "zmcp");

    void record_request(const std::string& method, const std::string& status,
                        std::chrono::duration<double> elapsed) override;
    void record_tool_call(const std::string& tool, const std::string& status,
                          std::chrono::duration<double> elapsed) override;
    void record_error(const std::string& component, const std::string& error_type) override;
    void set_active_connections(int64_t n) override;

    [[nodiscard]] double counter_value(const std::string& name, const Labels& labels) const;
    [[nodiscard]] uint64_t histogram_count(const std::string& name, const Labels& labels) const;
    [[nodiscard]] double histogram_sum(const std::string& name, const Labels& labels) const;
    [[nodiscard]] int64_t active_connections() const;

    /// Render every series in the Prometheus text format.
    [[nodiscard]] std::string render_prometheus() const;

private:
    struct Histogram {
        std::vector<uint64_t> bucket_counts;  // cumulative per upper bound
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct Family {
        std::string help;
        bool is_histogram = false;
        std::map<Labels, double> counters;
        std::map<Labels, Histogram> histograms;
    };

    void inc_counter(const std::string& name, const std::string& help, const Labels& labels);
    void observe(const std::string& name, const std::string& help, const Labels& labels,
                 double value);
    std::string full_name(const std::string& name) const;

    std::string prefix_;
    mutable std::mutex mutex_;
    std::map<std::string, Family> families_;
    int64_t active_connections_ = 0;
};

} // namespace zmcp

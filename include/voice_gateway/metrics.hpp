#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace voice_gateway {

// Process-wide registry rendered in Prometheus text format on /metrics.
class Metrics {
public:
    static Metrics& instance();

    void increment_request();
    void increment_event(const std::string& name);
    void set_active_sessions(int64_t value);
    void observe_latency(const std::string& stage, double seconds);
    void observe_latency_summary(const std::string& stage, double seconds);

    uint64_t event_count(const std::string& name) const;
    std::string render_prometheus() const;

private:
    struct SummarySeries {
        uint64_t count = 0;
        double sum = 0.0;
    };

    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    HistogramSeries& histogram_for(const std::string& stage);

    mutable std::mutex mutex_;
    uint64_t request_total_ = 0;
    int64_t active_sessions_ = 0;
    std::map<std::string, uint64_t> events_;
    std::unordered_map<std::string, SummarySeries> latency_summaries_;
    std::unordered_map<std::string, HistogramSeries> latency_histograms_;
    std::vector<double> histogram_bounds_;
};

}

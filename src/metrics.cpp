#include "voice_gateway/metrics.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace voice_gateway {

namespace {

template <typename Map>
std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& item : map) {
        keys.push_back(item.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.005, 0.01, 0.025, 0.05, 0.075, 0.1, 0.25, 0.5,
                         0.75, 1.0, 2.5, 5.0, 7.5, 10.0};
}

void Metrics::increment_request() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++request_total_;
}

void Metrics::increment_event(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++events_[name];
}

void Metrics::set_active_sessions(int64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_sessions_ = value;
}

Metrics::HistogramSeries& Metrics::histogram_for(const std::string& stage) {
    auto& series = latency_histograms_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    return series;
}

void Metrics::observe_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histogram_for(stage);
    histogram.count += 1;
    histogram.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            histogram.buckets[i] += 1;
        }
    }
    histogram.buckets.back() += 1;
}

void Metrics::observe_latency_summary(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& summary = latency_summaries_[stage];
    summary.count += 1;
    summary.sum += seconds;
}

uint64_t Metrics::event_count(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = events_.find(name);
    return it == events_.end() ? 0 : it->second;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP voicegw_requests_total Total number of REST requests\n";
    out << "# TYPE voicegw_requests_total counter\n";
    out << "voicegw_requests_total " << request_total_ << "\n";

    out << "# HELP voicegw_active_sessions Sessions currently registered\n";
    out << "# TYPE voicegw_active_sessions gauge\n";
    out << "voicegw_active_sessions " << active_sessions_ << "\n";

    out << "# HELP voicegw_events_total Pipeline events by kind\n";
    out << "# TYPE voicegw_events_total counter\n";
    for (const auto& item : events_) {
        out << "voicegw_events_total{event=\"" << item.first << "\"} " << item.second << "\n";
    }

    out << "# HELP voicegw_latency_summary Time elapsed per pipeline stage\n";
    out << "# TYPE voicegw_latency_summary summary\n";
    for (const auto& stage : sorted_keys(latency_summaries_)) {
        const auto& series = latency_summaries_.at(stage);
        out << "voicegw_latency_summary_count{stage=\"" << stage << "\"} " << series.count
            << "\n";
        out << "voicegw_latency_summary_sum{stage=\"" << stage << "\"} " << series.sum << "\n";
    }

    out << "# HELP voicegw_latency_seconds Latency per pipeline stage in seconds\n";
    out << "# TYPE voicegw_latency_seconds histogram\n";
    for (const auto& stage : sorted_keys(latency_histograms_)) {
        const auto& series = latency_histograms_.at(stage);
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "voicegw_latency_seconds_bucket{stage=\"" << stage << "\",le=\""
                << histogram_bounds_[i] << "\"} " << series.buckets[i] << "\n";
        }
        out << "voicegw_latency_seconds_bucket{stage=\"" << stage << "\",le=\"+Inf\"} "
            << series.buckets.back() << "\n";
        out << "voicegw_latency_seconds_count{stage=\"" << stage << "\"} " << series.count
            << "\n";
        out << "voicegw_latency_seconds_sum{stage=\"" << stage << "\"} " << series.sum
            << "\n";
    }

    return out.str();
}

}

#include "metrics/metrics_registry.h"

#include <sstream>
#include <utility>

namespace vigil {

static const char* kPrefix = "vigil_";

const std::vector<double>& MetricsRegistry::default_buckets() {
    static const std::vector<double> buckets = {
        0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0
    };
    return buckets;
}

MetricsRegistry::MetricsRegistry()
    : bounds_(default_buckets()) {}

void MetricsRegistry::inc_request(const std::string& endpoint) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++requests_[endpoint];
}

void MetricsRegistry::observe_request_duration(const std::string& endpoint,
                                               double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& h = durations_[endpoint];
    if (h.counts.empty()) {
        h.counts.assign(bounds_.size() + 1, 0);
    }

    std::size_t bucket = bounds_.size();
    for (std::size_t i = 0; i < bounds_.size(); ++i) {
        if (seconds <= bounds_[i]) {
            bucket = i;
            break;
        }
    }
    ++h.counts[bucket];
    h.sum += seconds;
    ++h.count;
}

void MetricsRegistry::inc_anomalies_detected() {
    ++anomalies_detected_;
}

void MetricsRegistry::inc_samples_processed() {
    ++samples_processed_;
}

void MetricsRegistry::set_current_rate(double rate) {
    current_rate_.store(rate);
}

std::uint64_t MetricsRegistry::requests(const std::string& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(endpoint);
    return it == requests_.end() ? 0 : it->second;
}

HistogramSnapshot MetricsRegistry::request_duration(const std::string& endpoint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = durations_.find(endpoint);
    if (it == durations_.end()) {
        HistogramSnapshot empty;
        empty.bounds = bounds_;
        empty.cumulative.assign(bounds_.size() + 1, 0);
        return empty;
    }
    return snapshot(it->second);
}

HistogramSnapshot MetricsRegistry::snapshot(const Histogram& h) const {
    HistogramSnapshot snap;
    snap.bounds = bounds_;
    snap.sum = h.sum;
    snap.count = h.count;
    snap.cumulative.reserve(h.counts.size());

    std::uint64_t running = 0;
    for (auto c : h.counts) {
        running += c;
        snap.cumulative.push_back(running);
    }
    return snap;
}

std::string MetricsRegistry::render_prometheus() const {
    std::ostringstream out;

    std::lock_guard<std::mutex> lock(mutex_);

    out << "# HELP " << kPrefix << "requests_total Total number of requests\n"
        << "# TYPE " << kPrefix << "requests_total counter\n";
    for (const auto& [endpoint, count] : requests_) {
        out << kPrefix << "requests_total{endpoint=\"" << endpoint << "\"} "
            << count << "\n";
    }

    out << "# HELP " << kPrefix << "request_duration_seconds Request duration in seconds\n"
        << "# TYPE " << kPrefix << "request_duration_seconds histogram\n";
    for (const auto& [endpoint, h] : durations_) {
        auto snap = snapshot(h);
        for (std::size_t i = 0; i < snap.bounds.size(); ++i) {
            out << kPrefix << "request_duration_seconds_bucket{endpoint=\""
                << endpoint << "\",le=\"" << snap.bounds[i] << "\"} "
                << snap.cumulative[i] << "\n";
        }
        out << kPrefix << "request_duration_seconds_bucket{endpoint=\""
            << endpoint << "\",le=\"+Inf\"} " << snap.cumulative.back() << "\n";
        out << kPrefix << "request_duration_seconds_sum{endpoint=\"" << endpoint
            << "\"} " << snap.sum << "\n";
        out << kPrefix << "request_duration_seconds_count{endpoint=\"" << endpoint
            << "\"} " << snap.count << "\n";
    }

    out << "# HELP " << kPrefix << "anomalies_detected_total Total number of anomalies detected\n"
        << "# TYPE " << kPrefix << "anomalies_detected_total counter\n"
        << kPrefix << "anomalies_detected_total " << anomalies_detected_.load() << "\n";

    out << "# HELP " << kPrefix << "metrics_processed_total Total number of metrics processed\n"
        << "# TYPE " << kPrefix << "metrics_processed_total counter\n"
        << kPrefix << "metrics_processed_total " << samples_processed_.load() << "\n";

    out << "# HELP " << kPrefix << "current_rps Current RPS value\n"
        << "# TYPE " << kPrefix << "current_rps gauge\n"
        << kPrefix << "current_rps " << current_rate_.load() << "\n";

    return out.str();
}

ScopedTimer::ScopedTimer(MetricsRegistry& metrics, std::string endpoint)
    : metrics_(metrics), endpoint_(std::move(endpoint)),
      start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_);
    metrics_.observe_request_duration(endpoint_, elapsed.count());
}

} // namespace vigil

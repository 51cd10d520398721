#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {

struct HistogramSnapshot {
    std::vector<double> bounds;
    std::vector<std::uint64_t> cumulative;  // one per bound, then +Inf
    double sum = 0.0;
    std::uint64_t count = 0;
};

// Service counters rendered in the Prometheus text exposition format.
class MetricsRegistry {
public:
    MetricsRegistry();

    void inc_request(const std::string& endpoint);
    void observe_request_duration(const std::string& endpoint, double seconds);
    void inc_anomalies_detected();
    void inc_samples_processed();
    void set_current_rate(double rate);

    std::uint64_t requests(const std::string& endpoint) const;
    HistogramSnapshot request_duration(const std::string& endpoint) const;
    std::uint64_t anomalies_detected() const { return anomalies_detected_.load(); }
    std::uint64_t samples_processed() const { return samples_processed_.load(); }
    double current_rate() const { return current_rate_.load(); }

    std::string render_prometheus() const;

    static const std::vector<double>& default_buckets();

private:
    struct Histogram {
        std::vector<std::uint64_t> counts;  // per bucket, non-cumulative, +Inf last
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    HistogramSnapshot snapshot(const Histogram& h) const;

    std::vector<double> bounds_;
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> requests_;
    std::map<std::string, Histogram> durations_;
    std::atomic<std::uint64_t> anomalies_detected_{0};
    std::atomic<std::uint64_t> samples_processed_{0};
    std::atomic<double> current_rate_{0.0};
};

// Observes the elapsed time into the endpoint's duration histogram when it
// goes out of scope.
class ScopedTimer {
public:
    ScopedTimer(MetricsRegistry& metrics, std::string endpoint);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    MetricsRegistry& metrics_;
    std::string endpoint_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace vigil

#include "engine/telemetry_service.h"

#include <chrono>

namespace vigil {

TelemetryService::TelemetryService(const ServiceConfig& config, ISampleCache& cache,
                                   MetricsRegistry& metrics, Logger& logger)
    : config_(config),
      cache_(cache),
      metrics_(metrics),
      logger_(logger),
      registry_(config.buffer_capacity),
      classifier_(registry_, config.window_size),
      events_(config.queue_capacity),
      workers_(config.worker_threads, logger) {}

TelemetryService::~TelemetryService() {
    shutdown();
}

IngestResult TelemetryService::ingest(const Sample& sample) {
    if (sample.entity_id.empty()) {
        logger_.log_rejection("device_id is required");
        return IngestResult::reject("device_id is required");
    }

    registry_.get_or_create(sample.entity_id)->append(sample.value);

    metrics_.inc_samples_processed();
    metrics_.set_current_rate(sample.rate);

    bool cached = workers_.submit("cache_sample", [this, sample] { cache_sample(sample); });
    bool analyzed = workers_.submit("analyze_sample", [this, sample] { analyze_sample(sample); });
    if (!cached || !analyzed) {
        logger_.log_event(LogLevel::WARN, "background_task_rejected",
                          {{"device", sample.entity_id}, {"reason", "worker pool stopped"}});
    }

    return IngestResult::accept();
}

IngestResult TelemetryService::ingest_json(const std::string& body) {
    Sample sample;
    try {
        sample = parse_sample(body);
    } catch (const ValidationError& e) {
        logger_.log_rejection(e.what());
        return IngestResult::reject(e.what());
    }
    return ingest(sample);
}

RollingAverageReport TelemetryService::query_rolling_average(const std::string& entity_id) const {
    if (entity_id.empty()) {
        throw ValidationError("device_id parameter is required");
    }

    RollingAverageReport report;
    report.entity_id = entity_id;
    report.window_size = config_.window_size;

    // Unknown entities report 0 without allocating a buffer
    if (auto buffer = registry_.find(entity_id)) {
        report.rolling_average = buffer->window_stats(config_.window_size).mean;
    }
    return report;
}

AnomalyReport TelemetryService::list_anomalies() {
    AnomalyReport report;
    report.anomalies = events_.drain(config_.drain_grace);
    report.count = report.anomalies.size();
    return report;
}

HealthReport TelemetryService::health() {
    HealthReport report;
    report.time = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    bool cache_ok = false;
    try {
        cache_ok = cache_.ping();
    } catch (const CacheError& e) {
        logger_.log_event(LogLevel::WARN, "cache_ping_failed", {{"error", e.what()}});
    }

    report.cache = cache_ok ? "connected" : "disconnected";
    report.status = cache_ok ? "healthy" : "degraded";
    return report;
}

void TelemetryService::wait_idle() {
    workers_.wait_idle();
}

void TelemetryService::shutdown() {
    workers_.shutdown();
}

void TelemetryService::cache_sample(const Sample& sample) {
    try {
        cache_.put(sample, config_.cache_ttl);
    } catch (const CacheError& e) {
        logger_.log_cache_failure(sample.entity_id, sample.timestamp, e.what());
    }
}

void TelemetryService::analyze_sample(const Sample& sample) {
    AnalyticsResult result = classifier_.classify(sample.entity_id, sample.value,
                                                  sample.timestamp);

    if (result.is_anomaly) {
        metrics_.inc_anomalies_detected();
        logger_.log_anomaly(result);
    }

    if (!events_.try_enqueue(result)) {
        logger_.log_event(LogLevel::DEBUG, "event_dropped",
                          {{"device", result.entity_id}, {"timestamp", result.timestamp}});
    }
}

} // namespace vigil

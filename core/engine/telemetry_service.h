#pragma once

#include "buffer/buffer_registry.h"
#include "cache/sample_cache.h"
#include "config/service_config.h"
#include "engine/anomaly_classifier.h"
#include "engine/event_queue.h"
#include "engine/sample.h"
#include "engine/worker_pool.h"
#include "logging/logger.h"
#include "metrics/metrics_registry.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vigil {

struct IngestResult {
    bool accepted = false;
    std::string reason;   // set when rejected

    static IngestResult accept() { return {true, ""}; }
    static IngestResult reject(std::string why) { return {false, std::move(why)}; }
};

struct RollingAverageReport {
    std::string entity_id;
    double rolling_average = 0.0;
    std::size_t window_size = 0;
};

struct AnomalyReport {
    std::size_t count = 0;
    std::vector<AnalyticsResult> anomalies;
};

struct HealthReport {
    std::string status;   // "healthy" or "degraded"
    std::int64_t time = 0;
    std::string cache;    // "connected" or "disconnected"
};

// Ingestion and query front of the analytics core. Ingestion appends to the
// entity's buffer synchronously; caching and classification run on the
// worker pool and are never awaited by the caller.
class TelemetryService {
public:
    TelemetryService(const ServiceConfig& config, ISampleCache& cache,
                     MetricsRegistry& metrics, Logger& logger);
    ~TelemetryService();

    TelemetryService(const TelemetryService&) = delete;
    TelemetryService& operator=(const TelemetryService&) = delete;

    IngestResult ingest(const Sample& sample);
    IngestResult ingest_json(const std::string& body);

    // Throws ValidationError for an empty entity id.
    RollingAverageReport query_rolling_average(const std::string& entity_id) const;

    AnomalyReport list_anomalies();

    HealthReport health();

    // Blocks until every submitted background task has finished.
    void wait_idle();

    // Stops accepting background work and joins the workers.
    void shutdown();

    const BufferRegistry& registry() const { return registry_; }
    const AnomalyEventQueue& events() const { return events_; }

private:
    void cache_sample(const Sample& sample);
    void analyze_sample(const Sample& sample);

    ServiceConfig config_;
    ISampleCache& cache_;
    MetricsRegistry& metrics_;
    Logger& logger_;

    BufferRegistry registry_;
    AnomalyClassifier classifier_;
    AnomalyEventQueue events_;
    WorkerPool workers_;
};

} // namespace vigil

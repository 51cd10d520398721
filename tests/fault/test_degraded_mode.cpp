#include "cache/sample_cache.h"
#include "config/service_config.h"
#include "engine/telemetry_service.h"
#include "logging/logger.h"
#include "metrics/metrics_registry.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vigil;

// Cache that fails every call, standing in for an unreachable backend.
class UnavailableCache : public ISampleCache {
public:
    void put(const Sample&, std::chrono::seconds) override {
        ++put_attempts_;
        throw CacheError("connection refused");
    }

    std::optional<Sample> get(const std::string&, std::int64_t) override {
        throw CacheError("connection refused");
    }

    bool ping() override { return false; }

    int put_attempts() const { return put_attempts_.load(); }

private:
    std::atomic<int> put_attempts_{0};
};

// Cache whose ping raises instead of answering.
class ExplodingPingCache : public InMemorySampleCache {
public:
    bool ping() override { throw CacheError("timeout"); }
};

static Sample make_sample(const std::string& id, std::int64_t ts, double value) {
    Sample s;
    s.entity_id = id;
    s.timestamp = ts;
    s.value = value;
    return s;
}

namespace {

class DegradedModeTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_path_ = std::filesystem::temp_directory_path() / "vigil_fault_test.jsonl";
        std::filesystem::remove(log_path_);
    }

    void TearDown() override {
        std::filesystem::remove(log_path_);
    }

    std::vector<nlohmann::json> read_log_lines(const std::string& type) {
        std::vector<nlohmann::json> lines;
        std::ifstream file(log_path_);
        std::string line;
        while (std::getline(file, line)) {
            if (line.empty()) {
                continue;
            }
            auto j = nlohmann::json::parse(line);
            if (j["type"] == type) {
                lines.push_back(j);
            }
        }
        return lines;
    }

    std::filesystem::path log_path_;
};

} // namespace

TEST_F(DegradedModeTest, CacheFailureDoesNotBlockIngestion) {
    UnavailableCache cache;
    MetricsRegistry metrics;
    ServiceConfig config;
    {
        Logger logger(log_path_.string());
        TelemetryService service(config, cache, metrics, logger);

        for (int i = 0; i < 5; ++i) {
            EXPECT_TRUE(service.ingest(make_sample("d1", i, 10.0)).accepted);
        }
        service.wait_idle();

        // Classification still flows to the event queue
        EXPECT_EQ(service.list_anomalies().count, 5u);
        EXPECT_DOUBLE_EQ(service.query_rolling_average("d1").rolling_average, 10.0);
    }

    // One attempt per sample, never retried
    EXPECT_EQ(cache.put_attempts(), 5);

    auto failures = read_log_lines("cache_write_failed");
    ASSERT_EQ(failures.size(), 5u);
    EXPECT_EQ(failures[0]["device"], "d1");
    EXPECT_EQ(failures[0]["error"], "connection refused");
}

TEST_F(DegradedModeTest, HealthReportsDegradedWithoutCache) {
    UnavailableCache cache;
    MetricsRegistry metrics;
    ServiceConfig config;
    Logger logger(log_path_.string());
    TelemetryService service(config, cache, metrics, logger);

    auto health = service.health();
    EXPECT_EQ(health.status, "degraded");
    EXPECT_EQ(health.cache, "disconnected");
}

TEST_F(DegradedModeTest, ThrowingPingIsAbsorbed) {
    ExplodingPingCache cache;
    MetricsRegistry metrics;
    ServiceConfig config;
    {
        Logger logger(log_path_.string());
        TelemetryService service(config, cache, metrics, logger);

        HealthReport health;
        EXPECT_NO_THROW(health = service.health());
        EXPECT_EQ(health.status, "degraded");
    }
    EXPECT_EQ(read_log_lines("cache_ping_failed").size(), 1u);
}

TEST_F(DegradedModeTest, QueueOverflowDropsSilently) {
    InMemorySampleCache cache;
    MetricsRegistry metrics;
    ServiceConfig config;
    config.queue_capacity = 5;
    Logger logger(log_path_.string(), LogLevel::WARN);
    TelemetryService service(config, cache, metrics, logger);

    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(service.ingest(make_sample("d", i, 1.0)).accepted);
    }
    service.wait_idle();

    EXPECT_EQ(service.events().size(), 5u);
    EXPECT_EQ(service.events().dropped(), 15u);
    EXPECT_EQ(service.list_anomalies().count, 5u);
    EXPECT_EQ(metrics.samples_processed(), 20u);
}

TEST_F(DegradedModeTest, AnomalyBurstUnderConcurrentProducers) {
    InMemorySampleCache cache;
    MetricsRegistry metrics;
    ServiceConfig config;
    config.worker_threads = 4;
    Logger logger(log_path_.string(), LogLevel::ERROR);
    TelemetryService service(config, cache, metrics, logger);

    // Build a flat baseline for each device first
    for (int d = 0; d < 4; ++d) {
        for (int i = 0; i < 20; ++i) {
            service.ingest(make_sample("dev" + std::to_string(d), i, 10.0));
        }
    }
    service.wait_idle();
    service.list_anomalies();

    std::vector<std::thread> producers;
    for (int d = 0; d < 4; ++d) {
        producers.emplace_back([&service, d] {
            service.ingest(make_sample("dev" + std::to_string(d), 100, 500.0));
        });
    }
    for (auto& p : producers) {
        p.join();
    }
    service.wait_idle();

    auto report = service.list_anomalies();
    ASSERT_EQ(report.count, 4u);
    for (const auto& result : report.anomalies) {
        EXPECT_TRUE(result.is_anomaly);
        EXPECT_NEAR(result.z_score, std::sqrt(20.0), 1e-9);
    }
    EXPECT_EQ(metrics.anomalies_detected(), 4u);
}

TEST_F(DegradedModeTest, IngestAfterShutdownStillAppends) {
    InMemorySampleCache cache;
    MetricsRegistry metrics;
    ServiceConfig config;
    {
        Logger logger(log_path_.string());
        TelemetryService service(config, cache, metrics, logger);
        service.shutdown();

        EXPECT_TRUE(service.ingest(make_sample("late", 1, 3.0)).accepted);
        EXPECT_EQ(service.registry().find("late")->size(), 1u);
        EXPECT_EQ(service.events().size(), 0u);
    }
    EXPECT_EQ(read_log_lines("background_task_rejected").size(), 1u);
}

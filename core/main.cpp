#include "cache/sample_cache.h"
#include "config/service_config.h"
#include "engine/telemetry_service.h"
#include "http/http_server.h"
#include "http/router.h"
#include "logging/logger.h"
#include "metrics/metrics_registry.h"

#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <thread>

using namespace vigil;
using namespace std::chrono_literals;

static volatile sig_atomic_t running = 1;

static void signal_handler(int) {
    running = 0;
}

static void usage(const char* argv0) {
    std::cout << "usage: " << argv0
              << " [--config <file.json>] [--log <file.jsonl>] [--port <n>]\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_override;
    std::string port_override;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            log_override = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port_override = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    ServiceConfig config;
    try {
        if (!config_path.empty()) {
            config = ServiceConfig::load(config_path);
        }
        config.apply_env();
        if (!log_override.empty()) {
            config.log_path = log_override;
        }
        if (!port_override.empty()) {
            config.port = parse_port(port_override);
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "[vigil] configuration error: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger logger(config.log_path, parse_log_level(config.log_level));
    MetricsRegistry metrics;
    InMemorySampleCache cache(config.cache_max_entries);

    TelemetryService service(config, cache, metrics, logger);
    Router router(service, metrics);
    HttpServer server(config.host, config.port, config.http_threads, router, logger);

    try {
        server.start();
    } catch (const HttpError& e) {
        logger.log_event(LogLevel::ERROR, "listen_failed", {{"error", e.what()}});
        return 1;
    }

    std::cout << "[vigil] endpoints: /api/metrics (POST), /api/analyze (GET), "
              << "/api/anomalies (GET), /health (GET), /metrics (GET)\n";

    while (running) {
        std::this_thread::sleep_for(200ms);
    }

    std::cout << "\n[vigil] shutting down. " << service.registry().size()
              << " device(s) tracked, " << metrics.samples_processed()
              << " sample(s) processed\n";

    server.stop();
    service.shutdown();
    return 0;
}

#pragma once

#include "engine/telemetry_service.h"
#include "http/http_message.h"
#include "metrics/metrics_registry.h"

#include <nlohmann/json.hpp>
#include <string>

namespace vigil {

// Maps HTTP endpoints onto the telemetry service.
class Router {
public:
    Router(TelemetryService& service, MetricsRegistry& metrics);

    HttpResponse handle(const HttpRequest& request);

private:
    HttpResponse ingest_metric(const HttpRequest& request);
    HttpResponse analyze(const HttpRequest& request);
    HttpResponse anomalies();
    HttpResponse health();
    HttpResponse exposition();

    TelemetryService& service_;
    MetricsRegistry& metrics_;
};

HttpResponse json_response(int status, const nlohmann::json& body);
HttpResponse error_response(int status, const std::string& message);

} // namespace vigil

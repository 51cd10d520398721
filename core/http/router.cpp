#include "http/router.h"

#include <nlohmann/json.hpp>

namespace vigil {

HttpResponse json_response(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.content_type = "application/json";
    response.body = body.dump();
    return response;
}

HttpResponse error_response(int status, const std::string& message) {
    return json_response(status, {{"error", message}});
}

Router::Router(TelemetryService& service, MetricsRegistry& metrics)
    : service_(service), metrics_(metrics) {}

HttpResponse Router::handle(const HttpRequest& request) {
    const auto& path = request.path;
    const auto& method = request.method;

    if (path == "/api/metrics") {
        if (method != "POST") return error_response(405, "method not allowed");
        return ingest_metric(request);
    }
    if (path == "/api/analyze") {
        if (method != "GET") return error_response(405, "method not allowed");
        return analyze(request);
    }
    if (path == "/api/anomalies") {
        if (method != "GET") return error_response(405, "method not allowed");
        return anomalies();
    }
    if (path == "/health") {
        if (method != "GET") return error_response(405, "method not allowed");
        return health();
    }
    if (path == "/metrics") {
        if (method != "GET") return error_response(405, "method not allowed");
        return exposition();
    }
    if (path == "/") {
        if (method != "GET") return error_response(405, "method not allowed");
        HttpResponse banner;
        banner.content_type = "text/plain";
        banner.body = "vigil telemetry analytics - running";
        return banner;
    }

    return error_response(404, "not found");
}

HttpResponse Router::ingest_metric(const HttpRequest& request) {
    ScopedTimer timer(metrics_, "/api/metrics");
    metrics_.inc_request("/api/metrics");

    IngestResult result = service_.ingest_json(request.body);
    if (!result.accepted) {
        return error_response(400, result.reason);
    }

    return json_response(202, {
        {"status", "accepted"},
        {"message", "Metric received and queued for processing"}
    });
}

HttpResponse Router::analyze(const HttpRequest& request) {
    ScopedTimer timer(metrics_, "/api/analyze");
    metrics_.inc_request("/api/analyze");

    try {
        auto report = service_.query_rolling_average(request.query_param("device_id"));
        return json_response(200, {
            {"device_id", report.entity_id},
            {"rolling_average", report.rolling_average},
            {"window_size", report.window_size}
        });
    } catch (const ValidationError& e) {
        return error_response(400, e.what());
    }
}

HttpResponse Router::anomalies() {
    ScopedTimer timer(metrics_, "/api/anomalies");
    metrics_.inc_request("/api/anomalies");

    auto report = service_.list_anomalies();

    nlohmann::json items = nlohmann::json::array();
    for (const auto& result : report.anomalies) {
        items.push_back(to_json(result));
    }
    return json_response(200, {{"count", report.count}, {"anomalies", items}});
}

HttpResponse Router::health() {
    auto report = service_.health();
    return json_response(200, {
        {"status", report.status},
        {"time", report.time},
        {"cache", report.cache}
    });
}

HttpResponse Router::exposition() {
    HttpResponse response;
    response.content_type = "text/plain; version=0.0.4";
    response.body = metrics_.render_prometheus();
    return response;
}

} // namespace vigil

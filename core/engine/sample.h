#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace vigil {

struct Sample {
    std::int64_t timestamp = 0;   // unix seconds
    std::string entity_id;
    double value = 0.0;
    double rate = 0.0;            // auxiliary, last-seen request rate
    double memory = 0.0;          // auxiliary, carried to the cache only
};

struct AnalyticsResult {
    std::string entity_id;
    double rolling_average = 0.0;
    double z_score = 0.0;
    bool is_anomaly = false;
    std::int64_t timestamp = 0;
    double value = 0.0;
};

// Missing, empty or malformed input. Surfaced to the caller as a rejection.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what)
        : std::runtime_error(what) {}
};

// Parses an ingestion payload of the form
// {"timestamp": 1700000000, "device_id": "d1", "cpu": 42.0, "rps": 10, "memory": 55}.
Sample parse_sample(const std::string& body);

nlohmann::json to_json(const Sample& sample);
nlohmann::json to_json(const AnalyticsResult& result);

} // namespace vigil

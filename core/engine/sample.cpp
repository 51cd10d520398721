#include "engine/sample.h"

namespace vigil {

static double required_number(const nlohmann::json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        throw ValidationError(std::string(field) + " is required");
    }
    if (!it->is_number()) {
        throw ValidationError(std::string(field) + " must be a number");
    }
    return it->get<double>();
}

static double optional_number(const nlohmann::json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return 0.0;
    }
    if (!it->is_number()) {
        throw ValidationError(std::string(field) + " must be a number");
    }
    return it->get<double>();
}

Sample parse_sample(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw ValidationError("Invalid JSON");
    }

    Sample sample;

    auto id = j.find("device_id");
    if (id != j.end() && !id->is_null() && !id->is_string()) {
        throw ValidationError("device_id must be a string");
    }
    if (id == j.end() || id->is_null() || id->get<std::string>().empty()) {
        throw ValidationError("device_id is required");
    }
    sample.entity_id = id->get<std::string>();

    auto ts = j.find("timestamp");
    if (ts == j.end() || ts->is_null()) {
        throw ValidationError("timestamp is required");
    }
    if (!ts->is_number_integer()) {
        throw ValidationError("timestamp must be an integer");
    }
    sample.timestamp = ts->get<std::int64_t>();

    sample.value = required_number(j, "cpu");
    sample.rate = optional_number(j, "rps");
    sample.memory = optional_number(j, "memory");

    return sample;
}

nlohmann::json to_json(const Sample& sample) {
    nlohmann::json j;
    j["timestamp"] = sample.timestamp;
    j["device_id"] = sample.entity_id;
    j["cpu"] = sample.value;
    j["rps"] = sample.rate;
    j["memory"] = sample.memory;
    return j;
}

nlohmann::json to_json(const AnalyticsResult& result) {
    nlohmann::json j;
    j["device_id"] = result.entity_id;
    j["rolling_average"] = result.rolling_average;
    j["z_score"] = result.z_score;
    j["is_anomaly"] = result.is_anomaly;
    j["timestamp"] = result.timestamp;
    j["value"] = result.value;
    return j;
}

} // namespace vigil

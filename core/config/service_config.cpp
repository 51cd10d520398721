#include "config/service_config.h"

#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace vigil {

static std::size_t non_negative_size(const nlohmann::json& j, const char* key,
                                     std::size_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0) {
        throw std::runtime_error(std::string("config: ") + key +
                                 " must be a non-negative integer");
    }
    return static_cast<std::size_t>(v.get<long long>());
}

int parse_port(const std::string& text) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("port is not a number: " + text);
    }
    if (consumed != text.size()) {
        throw std::invalid_argument("port is not a number: " + text);
    }
    return value;
}

ServiceConfig ServiceConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open config: " + path);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("invalid config " + path + ": " + e.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("invalid config " + path + ": expected an object");
    }

    ServiceConfig config;
    try {
        config.host = json.value("host", config.host);
        config.port = json.value("port", config.port);
        config.log_path = json.value("log_path", config.log_path);
        config.log_level = json.value("log_level", config.log_level);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("invalid config " + path + ": " + e.what());
    }

    config.window_size = non_negative_size(json, "window_size", config.window_size);
    config.buffer_capacity = non_negative_size(json, "buffer_capacity", config.buffer_capacity);
    config.queue_capacity = non_negative_size(json, "queue_capacity", config.queue_capacity);
    config.drain_grace = std::chrono::milliseconds(
        non_negative_size(json, "drain_grace_ms", config.drain_grace.count()));
    config.cache_ttl = std::chrono::seconds(
        non_negative_size(json, "cache_ttl_s", config.cache_ttl.count()));
    config.cache_max_entries = non_negative_size(json, "cache_max_entries",
                                             config.cache_max_entries);
    config.worker_threads = non_negative_size(json, "worker_threads", config.worker_threads);
    config.http_threads = non_negative_size(json, "http_threads", config.http_threads);

    config.validate();
    return config;
}

void ServiceConfig::apply_env() {
    if (const char* env_port = std::getenv("PORT")) {
        if (*env_port != '\0') {
            port = parse_port(env_port);
        }
    }
    if (const char* env_log = std::getenv("VIGIL_LOG")) {
        if (*env_log != '\0') {
            log_path = env_log;
        }
    }
}

void ServiceConfig::validate() const {
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("port out of range: " + std::to_string(port));
    }
    if (window_size == 0) {
        throw std::invalid_argument("window_size must be positive");
    }
    if (buffer_capacity == 0) {
        throw std::invalid_argument("buffer_capacity must be positive");
    }
    if (queue_capacity == 0) {
        throw std::invalid_argument("queue_capacity must be positive");
    }
    if (http_threads == 0) {
        throw std::invalid_argument("http_threads must be positive");
    }
    if (log_level != "debug" && log_level != "info" &&
        log_level != "warn" && log_level != "error") {
        throw std::invalid_argument("unknown log_level: " + log_level);
    }
}

} // namespace vigil

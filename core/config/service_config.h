#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace vigil {

// Parses a decimal port number; the whole string must be digits. Throws
// std::invalid_argument otherwise.
int parse_port(const std::string& text);

struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = 8080;

    std::size_t window_size = 50;
    std::size_t buffer_capacity = 1000;
    std::size_t queue_capacity = 100;
    std::chrono::milliseconds drain_grace{100};

    std::chrono::seconds cache_ttl{600};
    std::size_t cache_max_entries = 100000;

    std::size_t worker_threads = 0;   // 0 = hardware concurrency
    std::size_t http_threads = 8;

    std::string log_path = "vigil.jsonl";
    std::string log_level = "info";

    // Reads a JSON object; absent keys keep their defaults.
    static ServiceConfig load(const std::string& path);

    // Overrides port from PORT and log_path from VIGIL_LOG when set.
    void apply_env();

    // Throws std::invalid_argument on out-of-range values.
    void validate() const;
};

} // namespace vigil

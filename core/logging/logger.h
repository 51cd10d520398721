#pragma once

#include "engine/sample.h"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace vigil {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

const char* to_string(LogLevel level);

// Throws std::invalid_argument for anything but debug/info/warn/error.
LogLevel parse_log_level(const std::string& name);

// JSON-lines event log. Each line is mirrored to stdout.
class Logger {
public:
    explicit Logger(const std::string& output_path,
                    LogLevel min_level = LogLevel::INFO);
    ~Logger();

    void log_anomaly(const AnalyticsResult& result);
    void log_rejection(const std::string& reason);
    void log_cache_failure(const std::string& entity_id, std::int64_t timestamp,
                           const std::string& error);
    void log_event(LogLevel level, const std::string& event,
                   const nlohmann::json& fields = nlohmann::json::object());

    LogLevel min_level() const { return min_level_; }

private:
    void write_line(const std::string& json);
    std::string timestamp_iso8601() const;

    LogLevel min_level_;
    std::ofstream file_;
    std::mutex mutex_;
};

} // namespace vigil

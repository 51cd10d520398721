#include "logging/logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace vigil {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO:  return "info";
        case LogLevel::WARN:  return "warn";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn")  return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    throw std::invalid_argument("unknown log level: " + name);
}

Logger::Logger(const std::string& output_path, LogLevel min_level)
    : min_level_(min_level) {
    if (!output_path.empty()) {
        file_.open(output_path, std::ios::app);
    }
}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log_anomaly(const AnalyticsResult& result) {
    if (LogLevel::WARN < min_level_) {
        return;
    }
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "anomaly";
    j["level"] = to_string(LogLevel::WARN);
    j["device"] = result.entity_id;
    j["value"] = result.value;
    j["z_score"] = result.z_score;
    j["rolling_average"] = result.rolling_average;
    j["sample_ts"] = result.timestamp;
    write_line(j.dump());
}

void Logger::log_rejection(const std::string& reason) {
    if (LogLevel::INFO < min_level_) {
        return;
    }
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "rejection";
    j["level"] = to_string(LogLevel::INFO);
    j["reason"] = reason;
    write_line(j.dump());
}

void Logger::log_cache_failure(const std::string& entity_id,
                               std::int64_t timestamp,
                               const std::string& error) {
    if (LogLevel::WARN < min_level_) {
        return;
    }
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = "cache_write_failed";
    j["level"] = to_string(LogLevel::WARN);
    j["device"] = entity_id;
    j["sample_ts"] = timestamp;
    j["error"] = error;
    write_line(j.dump());
}

void Logger::log_event(LogLevel level, const std::string& event,
                       const nlohmann::json& fields) {
    if (level < min_level_) {
        return;
    }
    nlohmann::json j;
    j["ts"] = timestamp_iso8601();
    j["type"] = event;
    j["level"] = to_string(level);
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            j[it.key()] = it.value();
        }
    }
    write_line(j.dump());
}

void Logger::write_line(const std::string& json) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << json << "\n";
        file_.flush();
    }
    std::cout << json << std::endl;
}

std::string Logger::timestamp_iso8601() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace vigil

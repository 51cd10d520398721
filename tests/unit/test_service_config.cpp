#include "config/service_config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace vigil;

namespace {

class ServiceConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "vigil_test_config.json";
        std::filesystem::remove(path_);
        unsetenv("PORT");
        unsetenv("VIGIL_LOG");
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        unsetenv("PORT");
        unsetenv("VIGIL_LOG");
    }

    void write_config(const std::string& content) {
        std::ofstream file(path_);
        file << content;
    }

    std::filesystem::path path_;
};

} // namespace

TEST_F(ServiceConfigTest, DefaultsMatchServiceConstants) {
    ServiceConfig config;
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.window_size, 50u);
    EXPECT_EQ(config.buffer_capacity, 1000u);
    EXPECT_EQ(config.queue_capacity, 100u);
    EXPECT_EQ(config.drain_grace.count(), 100);
    EXPECT_EQ(config.cache_ttl.count(), 600);
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ServiceConfigTest, LoadOverridesPresentKeysOnly) {
    write_config(R"({
        "port": 9090,
        "window_size": 20,
        "queue_capacity": 10,
        "drain_grace_ms": 250,
        "log_path": "/tmp/custom.jsonl",
        "log_level": "debug"
    })");

    auto config = ServiceConfig::load(path_.string());
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.window_size, 20u);
    EXPECT_EQ(config.queue_capacity, 10u);
    EXPECT_EQ(config.drain_grace.count(), 250);
    EXPECT_EQ(config.log_path, "/tmp/custom.jsonl");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.buffer_capacity, 1000u);
    EXPECT_EQ(config.host, "0.0.0.0");
}

TEST_F(ServiceConfigTest, MissingFileThrows) {
    EXPECT_THROW(ServiceConfig::load("/nonexistent/vigil.json"), std::runtime_error);
}

TEST_F(ServiceConfigTest, MalformedJsonThrows) {
    write_config("{ \"port\": ");
    EXPECT_THROW(ServiceConfig::load(path_.string()), std::runtime_error);
}

TEST_F(ServiceConfigTest, InvalidValuesThrow) {
    write_config(R"({"window_size": -3})");
    EXPECT_THROW(ServiceConfig::load(path_.string()), std::runtime_error);

    write_config(R"({"queue_capacity": 0})");
    EXPECT_THROW(ServiceConfig::load(path_.string()), std::invalid_argument);

    write_config(R"({"port": "eighty"})");
    EXPECT_THROW(ServiceConfig::load(path_.string()), std::runtime_error);

    write_config(R"({"log_level": "loud"})");
    EXPECT_THROW(ServiceConfig::load(path_.string()), std::invalid_argument);
}

TEST_F(ServiceConfigTest, EnvironmentOverridesPortAndLog) {
    setenv("PORT", "7070", 1);
    setenv("VIGIL_LOG", "/tmp/env.jsonl", 1);

    ServiceConfig config;
    config.apply_env();
    EXPECT_EQ(config.port, 7070);
    EXPECT_EQ(config.log_path, "/tmp/env.jsonl");
}

TEST_F(ServiceConfigTest, EmptyEnvironmentKeepsDefaults) {
    setenv("PORT", "", 1);

    ServiceConfig config;
    config.apply_env();
    EXPECT_EQ(config.port, 8080);
    EXPECT_EQ(config.log_path, "vigil.jsonl");
}

TEST_F(ServiceConfigTest, MalformedEnvironmentPortThrows) {
    setenv("PORT", "8080abc", 1);
    ServiceConfig trailing;
    EXPECT_THROW(trailing.apply_env(), std::invalid_argument);

    setenv("PORT", "abc", 1);
    ServiceConfig letters;
    EXPECT_THROW(letters.apply_env(), std::invalid_argument);
    EXPECT_EQ(letters.port, 8080);
}

TEST_F(ServiceConfigTest, ParsePortRequiresWholeString) {
    EXPECT_EQ(parse_port("9090"), 9090);
    EXPECT_THROW(parse_port("90x"), std::invalid_argument);
    EXPECT_THROW(parse_port(""), std::invalid_argument);
    EXPECT_THROW(parse_port("99999999999999"), std::invalid_argument);
}

TEST_F(ServiceConfigTest, NegativeSizeIsRejectedButZeroIsRead) {
    write_config(R"({"worker_threads": 0, "cache_max_entries": -1})");
    EXPECT_THROW(ServiceConfig::load(path_.string()), std::runtime_error);

    write_config(R"({"worker_threads": 0})");
    auto config = ServiceConfig::load(path_.string());
    EXPECT_EQ(config.worker_threads, 0u);
}

#include "engine/sample.h"

#include <gtest/gtest.h>

using namespace vigil;

TEST(SampleParsing, ParsesFullPayload) {
    auto sample = parse_sample(
        R"({"timestamp": 1700000000, "device_id": "device_test",
            "cpu": 65.5, "rps": 250.0, "memory": 55.0})");

    EXPECT_EQ(sample.timestamp, 1700000000);
    EXPECT_EQ(sample.entity_id, "device_test");
    EXPECT_DOUBLE_EQ(sample.value, 65.5);
    EXPECT_DOUBLE_EQ(sample.rate, 250.0);
    EXPECT_DOUBLE_EQ(sample.memory, 55.0);
}

TEST(SampleParsing, AuxiliaryFieldsAreOptional) {
    auto sample = parse_sample(R"({"timestamp": 5, "device_id": "d", "cpu": 1})");
    EXPECT_DOUBLE_EQ(sample.value, 1.0);
    EXPECT_DOUBLE_EQ(sample.rate, 0.0);
    EXPECT_DOUBLE_EQ(sample.memory, 0.0);
}

TEST(SampleParsing, RejectsMalformedJson) {
    try {
        parse_sample("{not json");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid JSON");
    }
}

TEST(SampleParsing, RejectsNonObject) {
    EXPECT_THROW(parse_sample("[1, 2, 3]"), ValidationError);
}

TEST(SampleParsing, RejectsMissingOrEmptyDeviceId) {
    try {
        parse_sample(R"({"timestamp": 1, "device_id": "", "cpu": 1})");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "device_id is required");
    }
    EXPECT_THROW(parse_sample(R"({"timestamp": 1, "cpu": 1})"), ValidationError);
}

TEST(SampleParsing, RejectsWrongTypes) {
    EXPECT_THROW(parse_sample(R"({"timestamp": 1, "device_id": 7, "cpu": 1})"),
                 ValidationError);
    EXPECT_THROW(parse_sample(R"({"timestamp": "now", "device_id": "d", "cpu": 1})"),
                 ValidationError);
    EXPECT_THROW(parse_sample(R"({"timestamp": 1.5, "device_id": "d", "cpu": 1})"),
                 ValidationError);
    EXPECT_THROW(parse_sample(R"({"timestamp": 1, "device_id": "d", "cpu": "high"})"),
                 ValidationError);
    EXPECT_THROW(parse_sample(R"({"timestamp": 1, "device_id": "d", "cpu": 1, "rps": "x"})"),
                 ValidationError);
}

TEST(SampleParsing, RejectsMissingValue) {
    try {
        parse_sample(R"({"timestamp": 1, "device_id": "d"})");
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "cpu is required");
    }
}

TEST(SampleJson, ResultUsesWireFieldNames) {
    AnalyticsResult r;
    r.entity_id = "d1";
    r.rolling_average = 54.5;
    r.z_score = 3.1;
    r.is_anomaly = true;
    r.timestamp = 42;
    r.value = 95.0;

    auto j = to_json(r);
    EXPECT_EQ(j["device_id"], "d1");
    EXPECT_DOUBLE_EQ(j["rolling_average"].get<double>(), 54.5);
    EXPECT_DOUBLE_EQ(j["z_score"].get<double>(), 3.1);
    EXPECT_EQ(j["is_anomaly"], true);
    EXPECT_EQ(j["timestamp"], 42);
    EXPECT_DOUBLE_EQ(j["value"].get<double>(), 95.0);
}

TEST(SampleJson, SampleSerializesToIngestionShape) {
    Sample s;
    s.timestamp = 9;
    s.entity_id = "dev";
    s.value = 12.5;
    s.rate = 3.0;

    auto parsed = parse_sample(to_json(s).dump());
    EXPECT_EQ(parsed.entity_id, "dev");
    EXPECT_EQ(parsed.timestamp, 9);
    EXPECT_DOUBLE_EQ(parsed.value, 12.5);
    EXPECT_DOUBLE_EQ(parsed.rate, 3.0);
}

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include "latmon/server/json_codec.h"

namespace latmon {
namespace server {
namespace {

using core::Component;
using core::LatencyEvent;

rapidjson::Document Parse(const std::string& body) {
    rapidjson::Document doc;
    doc.Parse(body.c_str());
    EXPECT_FALSE(doc.HasParseError()) << body;
    return doc;
}

TEST(JsonCodecTest, ErrorBody) {
    auto doc = Parse(json::EncodeError("limit must be \"positive\""));
    EXPECT_STREQ(doc["status"].GetString(), "error");
    EXPECT_STREQ(doc["error"].GetString(), "limit must be \"positive\"");
}

TEST(JsonCodecTest, EventFields) {
    LatencyEvent event(1700000000000000, Component::FILE_SYSTEM, "read config", 1500, false,
                       {{"path", "/etc/app.json"}});
    auto doc = Parse(json::EncodeEvents({event.with_id(42)}, "events"));

    EXPECT_STREQ(doc["status"].GetString(), "ok");
    EXPECT_TRUE(doc["timestamp_us"].IsInt64());
    EXPECT_EQ(doc["count"].GetUint64(), 1u);
    ASSERT_TRUE(doc["events"].IsArray());
    const auto& e = doc["events"][0];
    EXPECT_EQ(e["id"].GetInt64(), 42);
    EXPECT_EQ(e["wall_timestamp_us"].GetInt64(), 1700000000000000);
    EXPECT_STREQ(e["component"].GetString(), "file_system");
    EXPECT_STREQ(e["source_label"].GetString(), "read config");
    EXPECT_EQ(e["duration_us"].GetInt64(), 1500);
    EXPECT_DOUBLE_EQ(e["duration_ms"].GetDouble(), 1.5);
    EXPECT_FALSE(e["success"].GetBool());
    EXPECT_STREQ(e["metadata"]["path"].GetString(), "/etc/app.json");
}

TEST(JsonCodecTest, CustomArrayKey) {
    auto doc = Parse(json::EncodeEvents({}, "raw_metrics"));
    ASSERT_TRUE(doc.HasMember("raw_metrics"));
    EXPECT_EQ(doc["raw_metrics"].Size(), 0u);
    EXPECT_FALSE(doc.HasMember("events"));
}

TEST(JsonCodecTest, EmptySummaryOmitsStatistics) {
    core::AggregateSnapshot empty;
    empty.window_start = 10;
    empty.window_end = 20;
    auto doc = Parse(json::EncodeSummary(empty, {}));

    const auto& s = doc["summary"];
    EXPECT_STREQ(s["component"].GetString(), "all");
    EXPECT_EQ(s["count"].GetUint64(), 0u);
    EXPECT_FALSE(s.HasMember("p50_us"));
    EXPECT_FALSE(doc.HasMember("components"));
}

TEST(JsonCodecTest, SummaryWithBreakdown) {
    core::AggregateSnapshot snap;
    snap.component = Component::MODEL;
    snap.window_start = 0;
    snap.window_end = 1000000;
    snap.count = 4;
    snap.mean_us = 2.5;
    snap.p50_us = 2;
    snap.p95_us = 4;
    snap.p99_us = 4;
    snap.min_us = 1;
    snap.max_us = 4;
    snap.success_count = 3;
    snap.error_rate = 0.25;
    snap.events_per_second = 4.0;

    auto doc = Parse(json::EncodeSummary(snap, {snap, snap}));
    const auto& s = doc["summary"];
    EXPECT_STREQ(s["component"].GetString(), "model");
    EXPECT_STREQ(s["strategy"].GetString(), "exact");
    EXPECT_EQ(s["p50_us"].GetInt64(), 2);
    EXPECT_DOUBLE_EQ(s["error_rate"].GetDouble(), 0.25);
    EXPECT_EQ(doc["components"].Size(), 2u);
}

TEST(JsonCodecTest, HealthReportsDegradedAndNullAge) {
    query::HealthReport health;
    health.ok = false;
    health.consecutive_commit_failures = 3;
    auto doc = Parse(json::EncodeHealth(health));
    EXPECT_STREQ(doc["status"].GetString(), "degraded");
    EXPECT_EQ(doc["consecutive_commit_failures"].GetUint64(), 3u);
    EXPECT_TRUE(doc["last_commit_age_ms"].IsNull());

    health.ok = true;
    health.last_commit_age = std::chrono::milliseconds(250);
    doc = Parse(json::EncodeHealth(health));
    EXPECT_STREQ(doc["status"].GetString(), "healthy");
    EXPECT_EQ(doc["last_commit_age_ms"].GetInt64(), 250);
}

TEST(JsonCodecTest, SystemResourcesLayout) {
    query::SystemResources resources;
    resources.memory_total_bytes = 4096;
    resources.memory_used_bytes = 1024;
    resources.memory_available_bytes = 3072;
    resources.cpu_count = 4;
    resources.load_one = 0.5;
    resources.processes = 120;
    auto doc = Parse(json::EncodeSystemResources(resources));

    const auto& r = doc["system_resources"];
    EXPECT_EQ(r["memory"]["total"].GetUint64(), 4096u);
    EXPECT_EQ(r["memory"]["available"].GetUint64(), 3072u);
    EXPECT_EQ(r["cpu"]["cpu_count"].GetUint(), 4u);
    EXPECT_DOUBLE_EQ(r["load_average"]["one_minute"].GetDouble(), 0.5);
    EXPECT_EQ(r["processes"].GetUint64(), 120u);
}

TEST(JsonCodecTest, ExportEchoesWindowAndFilter) {
    auto doc = Parse(json::EncodeExport(core::TimeWindow(5, 50), Component::TERMINAL,
                                        {LatencyEvent(7, Component::TERMINAL, "ls", 3, true)}));
    EXPECT_EQ(doc["window_start_us"].GetInt64(), 5);
    EXPECT_EQ(doc["window_end_us"].GetInt64(), 50);
    EXPECT_STREQ(doc["component"].GetString(), "terminal");
    EXPECT_EQ(doc["count"].GetUint64(), 1u);
}

} // namespace
} // namespace server
} // namespace latmon

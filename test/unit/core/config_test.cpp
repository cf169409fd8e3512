#include <gtest/gtest.h>
#include "latmon/core/config.h"
#include "test_util/temp_dir.h"

#include <filesystem>
#include <fstream>
#include <string>

namespace latmon {
namespace core {
namespace {

TEST(MonitorConfigTest, Defaults) {
    MonitorConfig config = MonitorConfig::Default();
    EXPECT_EQ(config.buffer.capacity, 10000u);
    EXPECT_EQ(config.server.port, 3030);
    EXPECT_EQ(config.server.default_raw_limit, 50u);
    ASSERT_TRUE(config.retention.max_age.has_value());
    EXPECT_EQ(*config.retention.max_age, std::chrono::hours(24 * 30));
    EXPECT_FALSE(config.retention.max_count.has_value());
    EXPECT_EQ(config.retention.interval, std::chrono::seconds(60));
    EXPECT_DOUBLE_EQ(config.storage.compaction_garbage_ratio, 0.5);
    EXPECT_EQ(config.log_level, "info");
    EXPECT_TRUE(config.Validate().ok());
}

TEST(MonitorConfigTest, FromJsonOverridesOnlyGivenKeys) {
    auto parsed = MonitorConfig::FromJson(R"({
        "log_level": "debug",
        "buffer": {"capacity": 500},
        "writer": {"batch_size": 50, "flush_interval_ms": 100},
        "retention": {"max_age_seconds": null, "max_count": 1000},
        "server": {"port": 8080}
    })");
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    const auto& config = parsed.value();

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.buffer.capacity, 500u);
    EXPECT_EQ(config.writer.batch_size, 50u);
    EXPECT_EQ(config.writer.flush_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(config.writer.max_commit_retries, WriterConfig().max_commit_retries);
    EXPECT_FALSE(config.retention.max_age.has_value());
    ASSERT_TRUE(config.retention.max_count.has_value());
    EXPECT_EQ(*config.retention.max_count, 1000u);
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.storage.path, StorageConfig::Default().path);
}

TEST(MonitorConfigTest, FromJsonRejectsBadInput) {
    EXPECT_FALSE(MonitorConfig::FromJson("{not json").ok());
    EXPECT_FALSE(MonitorConfig::FromJson("[1, 2]").ok());

    auto wrong_type = MonitorConfig::FromJson(R"({"buffer": {"capacity": "big"}})");
    ASSERT_FALSE(wrong_type.ok());
    EXPECT_EQ(wrong_type.error_code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(wrong_type.error().find("buffer.capacity"), std::string::npos);

    EXPECT_FALSE(MonitorConfig::FromJson(R"({"server": {"port": 70000}})").ok());
}

TEST(MonitorConfigTest, JsonRoundTripPreservesEveryField) {
    MonitorConfig config;
    config.storage.path = "/var/lib/latmon/events.lmlog";
    config.storage.sync_on_commit = false;
    config.writer.max_recovery_rounds = 9;
    config.retention.max_age.reset();
    config.retention.max_count = 42;
    config.aggregation.exact_threshold = 1234;
    config.server.enabled = false;
    config.server.max_export_events = 77;

    auto parsed = MonitorConfig::FromJson(config.ToJson());
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    const auto& back = parsed.value();
    EXPECT_EQ(back.storage.path, config.storage.path);
    EXPECT_FALSE(back.storage.sync_on_commit);
    EXPECT_EQ(back.writer.max_recovery_rounds, 9u);
    EXPECT_FALSE(back.retention.max_age.has_value());
    EXPECT_EQ(back.retention.max_count, std::optional<size_t>(42));
    EXPECT_EQ(back.aggregation.exact_threshold, 1234u);
    EXPECT_FALSE(back.server.enabled);
    EXPECT_EQ(back.server.max_export_events, 77u);
}

TEST(MonitorConfigTest, ValidateRejectsInconsistentSettings) {
    auto expect_invalid = [](const MonitorConfig& config, const std::string& field) {
        auto result = config.Validate();
        ASSERT_FALSE(result.ok()) << field;
        EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
        EXPECT_NE(result.error().find(field), std::string::npos) << result.error();
    };

    MonitorConfig config;
    config.buffer.capacity = 0;
    expect_invalid(config, "buffer.capacity");

    config = MonitorConfig();
    config.writer.batch_size = config.buffer.capacity + 1;
    expect_invalid(config, "writer.batch_size");

    config = MonitorConfig();
    config.writer.flush_interval = std::chrono::milliseconds(0);
    expect_invalid(config, "writer.flush_interval_ms");

    config = MonitorConfig();
    config.retention.max_age.reset();
    config.retention.max_count.reset();
    expect_invalid(config, "retention");

    config = MonitorConfig();
    config.aggregation.histogram_growth_factor = 1.0;
    expect_invalid(config, "histogram_growth_factor");

    config = MonitorConfig();
    config.server.port = 80;
    expect_invalid(config, "server.port");
    config.server.enabled = false;
    EXPECT_TRUE(config.Validate().ok());

    config = MonitorConfig();
    config.storage.path.clear();
    expect_invalid(config, "storage.path");

    config = MonitorConfig();
    config.retention.max_age = std::chrono::seconds(10000000000000LL);
    expect_invalid(config, "retention.max_age_seconds");

    config = MonitorConfig();
    config.retention.max_age = std::chrono::seconds(-1);
    expect_invalid(config, "retention.max_age_seconds");
}

TEST(MonitorConfigTest, MaxAgeBeyondMicrosecondRangeFailsValidation) {
    auto parsed = MonitorConfig::FromJson(R"({"retention": {"max_age_seconds": 18446744073709551615}})");
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    auto valid = parsed.value().Validate();
    ASSERT_FALSE(valid.ok());
    EXPECT_EQ(valid.error_code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(valid.error().find("retention.max_age_seconds"), std::string::npos);

    // One year is far inside the representable range
    MonitorConfig config;
    config.retention.max_age = std::chrono::seconds(365LL * 24 * 3600);
    EXPECT_TRUE(config.Validate().ok());
}

TEST(MonitorConfigTest, MissingFileYieldsDefaultsAndIsWritten) {
    testutil::ScopedTestDir dir("latmon_config");
    std::string path = dir.file("conf/latmon.json");

    auto loaded = MonitorConfig::LoadFromFile(path);
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value().buffer.capacity, BufferConfig::Default().capacity);
    EXPECT_TRUE(std::filesystem::exists(path));

    auto again = MonitorConfig::LoadFromFile(path);
    ASSERT_TRUE(again.ok());
    EXPECT_EQ(again.value().server.port, loaded.value().server.port);
}

TEST(MonitorConfigTest, SaveThenLoad) {
    testutil::ScopedTestDir dir("latmon_config");
    std::string path = dir.file("latmon.json");

    MonitorConfig config;
    config.buffer.capacity = 2048;
    config.log_level = "warn";
    ASSERT_TRUE(config.SaveToFile(path).ok());

    auto loaded = MonitorConfig::LoadFromFile(path);
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value().buffer.capacity, 2048u);
    EXPECT_EQ(loaded.value().log_level, "warn");
}

TEST(MonitorConfigTest, LoadReportsMalformedFile) {
    testutil::ScopedTestDir dir("latmon_config");
    std::string path = dir.file("broken.json");
    {
        std::ofstream out(path);
        out << "{\"buffer\": ";
    }
    auto loaded = MonitorConfig::LoadFromFile(path);
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.error_code(), Error::Code::INVALID_ARGUMENT);
}

} // namespace
} // namespace core
} // namespace latmon

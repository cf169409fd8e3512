#include <gtest/gtest.h>
#include "latmon/query/query_service.h"
#include "latmon/query/system_resources.h"
#include "test_util/temp_dir.h"

#include <fstream>

namespace latmon {
namespace query {
namespace {

using core::Component;
using core::LatencyEvent;
using core::TimeWindow;

class FixedResources : public SystemResourceProvider {
public:
    core::Result<SystemResources> sample() const override {
        SystemResources resources;
        resources.cpu_count = 8;
        resources.memory_total_bytes = 1024;
        return core::Result<SystemResources>(resources);
    }
};

class QueryServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto config = core::StorageConfig::Default();
        config.path = dir_.file("events.lmlog");
        store_ = storage::EventStore::Open(config).take_value();

        limits_.max_raw_events = 100;
        limits_.max_export_events = 10;
        service_ = std::make_unique<QueryService>(store_->reader(), counters_, core::AggregationConfig(),
                                                  limits_, std::make_shared<FixedResources>());
    }

    void Commit(const std::vector<LatencyEvent>& events) {
        auto writer = store_->acquire_writer().take_value();
        ASSERT_TRUE(writer.commit_batch(events).ok());
    }

    testutil::ScopedTestDir dir_{"latmon_query"};
    std::shared_ptr<storage::EventStore> store_;
    std::shared_ptr<core::PipelineCounters> counters_ = std::make_shared<core::PipelineCounters>();
    core::ServerConfig limits_;
    std::unique_ptr<QueryService> service_;
};

TEST_F(QueryServiceTest, RawEventsNewestFirst) {
    Commit({LatencyEvent(100, Component::EDITOR, "a", 1, true),
            LatencyEvent(300, Component::MODEL, "b", 2, true),
            LatencyEvent(200, Component::EDITOR, "c", 3, true)});

    auto all = service_->raw_events(10);
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), 3u);
    EXPECT_EQ(all.value()[0].wall_timestamp(), 300);
    EXPECT_EQ(all.value()[2].wall_timestamp(), 100);
    EXPECT_TRUE(all.value()[0].committed());

    auto editor = service_->raw_events(1, Component::EDITOR);
    ASSERT_TRUE(editor.ok());
    ASSERT_EQ(editor.value().size(), 1u);
    EXPECT_EQ(editor.value()[0].source_label(), "c");
}

TEST_F(QueryServiceTest, RawEventsRejectsLimitOutOfRange) {
    for (size_t limit : {size_t{0}, size_t{101}}) {
        auto result = service_->raw_events(limit);
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error_code(), core::Error::Code::QUERY_FAILURE);
        EXPECT_NE(result.error().find("limit"), std::string::npos);
    }
    EXPECT_TRUE(service_->raw_events(100).ok());
}

TEST_F(QueryServiceTest, SummaryOfCommittedEvents) {
    std::vector<LatencyEvent> events;
    for (int d = 1; d <= 5; ++d) {
        events.emplace_back(1000 + d, Component::NETWORK, "fetch", d, true);
    }
    Commit(events);

    auto snap = service_->summary(TimeWindow(0, 10000), Component::NETWORK);
    ASSERT_TRUE(snap.ok()) << snap.error();
    EXPECT_EQ(snap.value().count, 5u);
    EXPECT_EQ(snap.value().p50_us, 3);
    EXPECT_EQ(snap.value().max_us, 5);

    auto other = service_->summary(TimeWindow(0, 10000), Component::TERMINAL);
    ASSERT_TRUE(other.ok());
    EXPECT_FALSE(other.value().valid());
}

TEST_F(QueryServiceTest, MalformedWindowIsQueryFailure) {
    auto reversed = service_->summary(TimeWindow(500, 100));
    ASSERT_FALSE(reversed.ok());
    EXPECT_EQ(reversed.error_code(), core::Error::Code::QUERY_FAILURE);

    EXPECT_FALSE(service_->summary(TimeWindow(-5, 100)).ok());
    EXPECT_FALSE(service_->summary_by_component(TimeWindow(7, 7)).ok());
    EXPECT_FALSE(service_->export_range(TimeWindow(7, 7)).ok());
}

TEST_F(QueryServiceTest, UnknownComponentName) {
    auto known = QueryService::ParseComponentName("file_system");
    ASSERT_TRUE(known.ok());
    EXPECT_EQ(known.value(), Component::FILE_SYSTEM);

    auto unknown = QueryService::ParseComponentName("gpu");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error_code(), core::Error::Code::QUERY_FAILURE);
    EXPECT_NE(unknown.error().find("gpu"), std::string::npos);
}

TEST_F(QueryServiceTest, ExportIsAscendingAndBounded) {
    std::vector<LatencyEvent> events;
    for (int i = 0; i < 15; ++i) {
        events.emplace_back(1000 - i, Component::SYSTEM, "tick", i, true);
    }
    Commit(events);

    auto small = service_->export_range(TimeWindow(991, 1001));
    ASSERT_TRUE(small.ok());
    ASSERT_EQ(small.value().size(), 10u);
    EXPECT_EQ(small.value().front().wall_timestamp(), 991);
    EXPECT_EQ(small.value().back().wall_timestamp(), 1000);

    auto too_big = service_->export_range(TimeWindow::All());
    ASSERT_FALSE(too_big.ok());
    EXPECT_EQ(too_big.error_code(), core::Error::Code::QUERY_FAILURE);
}

TEST_F(QueryServiceTest, HealthFollowsCounters) {
    auto initial = service_->health();
    EXPECT_FALSE(initial.ok);
    EXPECT_FALSE(initial.last_commit_age.has_value());

    counters_->writer_running = true;
    counters_->record_commit(10);
    auto healthy = service_->health();
    EXPECT_TRUE(healthy.ok);
    EXPECT_TRUE(healthy.writer_running);
    ASSERT_TRUE(healthy.last_commit_age.has_value());

    counters_->consecutive_commit_failures = 2;
    counters_->batches_lost = 1;
    auto failing = service_->health();
    EXPECT_FALSE(failing.ok);
    EXPECT_EQ(failing.consecutive_commit_failures, 2u);
    EXPECT_EQ(failing.batches_lost, 1u);
}

TEST_F(QueryServiceTest, DroppedCountAndCounters) {
    counters_->events_submitted = 30;
    counters_->events_dropped = 12;
    EXPECT_EQ(service_->dropped_count(), 12u);
    EXPECT_EQ(service_->counters().accepted(), 18u);
}

TEST_F(QueryServiceTest, StatusReportsStoreAndLastHour) {
    core::Timestamp now = core::WallNowUs();
    Commit({LatencyEvent(now - 1000, Component::EDITOR, "a", 10, true),
            LatencyEvent(now - 2LL * 3600 * 1000000, Component::EDITOR, "old", 10, true)});

    auto status = service_->status();
    ASSERT_TRUE(status.ok()) << status.error();
    EXPECT_EQ(status.value().total_events, 2u);
    ASSERT_TRUE(status.value().newest_event.has_value());
    EXPECT_EQ(*status.value().newest_event, now - 1000);
    EXPECT_EQ(status.value().store.live_events, 2u);
    ASSERT_EQ(status.value().last_hour.size(), core::kComponentCount);
    EXPECT_EQ(status.value().last_hour[0].count, 1u);
}

TEST_F(QueryServiceTest, SystemResourcesPassThrough) {
    auto resources = service_->system_resources();
    ASSERT_TRUE(resources.ok());
    EXPECT_EQ(resources.value().cpu_count, 8u);

    QueryService without(store_->reader(), counters_, core::AggregationConfig(), limits_);
    EXPECT_FALSE(without.system_resources().ok());
}

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

TEST(ProcfsResourceProviderTest, ParsesProcLayout) {
    testutil::ScopedTestDir dir("latmon_procfs");
    WriteFile(dir.file("meminfo"), "MemTotal:       16000 kB\n"
                                   "MemFree:         2000 kB\n"
                                   "MemAvailable:    6000 kB\n");
    WriteFile(dir.file("stat"), "cpu  1 2 3 4\ncpu0 1 2 3 4\ncpu1 1 2 3 4\nintr 5\n");
    WriteFile(dir.file("loadavg"), "0.50 0.25 0.10 2/345 6789\n");
    WriteFile(dir.file("uptime"), "1234.56 999.0\n");

    ProcfsResourceProvider provider(dir.path());
    auto result = provider.sample();
    ASSERT_TRUE(result.ok()) << result.error();
    const auto& r = result.value();
    EXPECT_EQ(r.memory_total_bytes, 16000u * 1024);
    EXPECT_EQ(r.memory_available_bytes, 6000u * 1024);
    EXPECT_EQ(r.memory_used_bytes, 10000u * 1024);
    EXPECT_EQ(r.cpu_count, 2u);
    EXPECT_DOUBLE_EQ(r.load_one, 0.5);
    EXPECT_DOUBLE_EQ(r.load_fifteen, 0.1);
    EXPECT_EQ(r.processes, 345u);
    EXPECT_EQ(r.uptime_seconds, 1234u);
}

TEST(ProcfsResourceProviderTest, MissingFilesFail) {
    testutil::ScopedTestDir dir("latmon_procfs_empty");
    ProcfsResourceProvider provider(dir.path());
    auto result = provider.sample();
    ASSERT_FALSE(result.ok());
    // An unreadable host is a server-side fault, not a bad request
    EXPECT_EQ(result.error_code(), core::Error::Code::INTERNAL);
}

} // namespace
} // namespace query
} // namespace latmon

#include <gtest/gtest.h>
#include "latmon/ingest/batch_writer.h"
#include "latmon/ingest/ingestion_buffer.h"
#include "latmon/monitor/monitor_service.h"
#include "latmon/storage/event_store.h"
#include "test_util/temp_dir.h"

#include <fstream>
#include <thread>
#include <vector>

namespace latmon {
namespace integration {
namespace {

using core::Component;
using core::LatencyEvent;
using core::TimeWindow;

constexpr std::chrono::seconds kFlushTimeout(30);

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.storage.path = dir_.file("events.lmlog");
        config_.storage.sync_on_commit = false;
        config_.writer.flush_interval = std::chrono::milliseconds(20);
    }

    std::unique_ptr<monitor::MonitorService> Open() {
        auto created = monitor::MonitorService::Create(config_);
        EXPECT_TRUE(created.ok()) << created.error();
        return created.take_value();
    }

    // The enforcer's first run is asynchronous; later runs are a minute apart
    static void WaitForFirstRetentionRun(const monitor::MonitorService& monitor) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (monitor.counters()->snapshot().retention_runs == 0 &&
               std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_GE(monitor.counters()->snapshot().retention_runs, 1u);
    }

    static core::AggregateSnapshot Summary(const monitor::MonitorService& monitor,
                                           std::optional<Component> component = std::nullopt) {
        auto summary = monitor.queries()->summary(TimeWindow::All(), component);
        EXPECT_TRUE(summary.ok());
        return summary.value();
    }

    testutil::ScopedTestDir dir_{"latmon_pipeline"};
    core::MonitorConfig config_;
};

TEST_F(PipelineTest, ConcurrentProducersAllCounted) {
    auto monitor = Open();
    ASSERT_TRUE(monitor);
    auto session = monitor->start_session({});
    ASSERT_TRUE(session.ok());

    constexpr int kProducers = 4;
    constexpr int kPerProducer = 600;
    std::vector<std::vector<LatencyEvent>> produced(kProducers);
    std::vector<std::thread> threads;
    for (int p = 0; p < kProducers; ++p) {
        threads.emplace_back([&, p]() {
            auto component = core::AllComponents()[p];
            for (int i = 0; i < kPerProducer; ++i) {
                auto handle = monitor->sampler()->begin(component, "op");
                auto event = handle.end(i % 10 != 0);
                if (event) {
                    produced[p].push_back(*event);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    ASSERT_TRUE(monitor->stop_session(session.value()).ok());

    for (const auto& events : produced) {
        ASSERT_EQ(events.size(), static_cast<size_t>(kPerProducer));
        for (size_t i = 0; i < events.size(); ++i) {
            EXPECT_GE(events[i].duration_us(), 0);
            if (i > 0) {
                EXPECT_GE(events[i].wall_timestamp(), events[i - 1].wall_timestamp());
            }
        }
    }

    auto overall = Summary(*monitor);
    EXPECT_EQ(overall.count, static_cast<uint64_t>(kProducers * kPerProducer));
    EXPECT_NEAR(overall.error_rate, 0.1, 1e-9);
    EXPECT_EQ(Summary(*monitor, Component::EDITOR).count, static_cast<uint64_t>(kPerProducer));
    EXPECT_EQ(monitor->counters()->snapshot().events_committed, overall.count);
}

TEST_F(PipelineTest, OneToFivePercentiles) {
    auto monitor = Open();
    ASSERT_TRUE(monitor);
    auto session = monitor->start_session({});
    ASSERT_TRUE(session.ok());
    for (uint64_t d : {4u, 1u, 5u, 3u, 2u}) {
        monitor->sampler()->record(Component::MODEL, "completion", d, true);
    }
    ASSERT_TRUE(monitor->stop_session(session.value()).ok());

    auto snap = Summary(*monitor, Component::MODEL);
    EXPECT_EQ(snap.count, 5u);
    EXPECT_EQ(snap.p50_us, 3);
    EXPECT_EQ(snap.max_us, 5);
    EXPECT_EQ(snap.min_us, 1);
    EXPECT_DOUBLE_EQ(snap.mean_us, 3.0);
}

TEST_F(PipelineTest, ConstantDurationsAggregateExactly) {
    auto monitor = Open();
    ASSERT_TRUE(monitor);
    auto session = monitor->start_session({Component::FILE_SYSTEM});
    ASSERT_TRUE(session.ok());
    for (int i = 0; i < 1000; ++i) {
        monitor->sampler()->record(Component::FILE_SYSTEM, "stat", 100, true);
    }
    ASSERT_TRUE(monitor->stop_session(session.value()).ok());

    auto snap = Summary(*monitor);
    EXPECT_EQ(snap.count, 1000u);
    EXPECT_DOUBLE_EQ(snap.mean_us, 100.0);
    EXPECT_EQ(snap.p50_us, 100);
    EXPECT_EQ(snap.p95_us, 100);
    EXPECT_EQ(snap.p99_us, 100);
}

TEST_F(PipelineTest, OverflowConservesEvents) {
    auto counters = std::make_shared<core::PipelineCounters>();
    core::BufferConfig buffer_config;
    buffer_config.capacity = 10000;
    auto buffer = std::make_shared<ingest::IngestionBuffer>(buffer_config, counters);

    for (int i = 0; i < 20000; ++i) {
        ASSERT_TRUE(buffer->push(LatencyEvent(i, Component::SYSTEM, "tick", i, true)));
    }
    auto before = counters->snapshot();
    EXPECT_EQ(before.events_submitted, 20000u);
    EXPECT_EQ(before.events_dropped, 10000u);
    EXPECT_EQ(before.accepted(), 10000u);

    auto store = storage::EventStore::Open(config_.storage).take_value();
    ingest::BatchWriter writer(config_.writer, buffer,
                               std::make_unique<storage::StoreWriter>(store->acquire_writer().take_value()),
                               counters);
    ASSERT_TRUE(writer.start().ok());
    ASSERT_TRUE(writer.flush(kFlushTimeout));
    writer.stop();

    auto after = counters->snapshot();
    EXPECT_EQ(after.events_committed, after.accepted());
    EXPECT_EQ(store->reader().total_count(), 10000u);

    // The oldest half was evicted
    auto oldest = store->reader().range(TimeWindow::All(), std::nullopt, 1);
    ASSERT_EQ(oldest.size(), 1u);
    EXPECT_EQ(oldest[0].wall_timestamp(), 10000);
}

TEST_F(PipelineTest, ZeroMaxAgeEmptiesStore) {
    config_.retention.max_age = std::chrono::seconds(0);
    auto monitor = Open();
    ASSERT_TRUE(monitor);
    WaitForFirstRetentionRun(*monitor);
    auto session = monitor->start_session({});
    ASSERT_TRUE(session.ok());
    for (int i = 0; i < 50; ++i) {
        monitor->sampler()->record(Component::TERMINAL, "cmd", 10 + i, true);
    }
    ASSERT_TRUE(monitor->stop_session(session.value()).ok());
    ASSERT_EQ(Summary(*monitor).count, 50u);

    auto report = monitor->enforce_retention(std::chrono::seconds(10));
    ASSERT_TRUE(report.ok()) << report.error();
    EXPECT_EQ(report.value().expired_by_age, 50u);
    EXPECT_EQ(Summary(*monitor).count, 0u);
    EXPECT_EQ(monitor->counters()->snapshot().events_expired, 50u);
}

TEST_F(PipelineTest, RepeatedSummariesAreIdentical) {
    auto monitor = Open();
    ASSERT_TRUE(monitor);
    auto session = monitor->start_session({});
    ASSERT_TRUE(session.ok());
    for (int i = 0; i < 300; ++i) {
        monitor->sampler()->record(core::AllComponents()[i % core::kComponentCount], "op",
                                   static_cast<uint64_t>((i * 37) % 1000), i % 7 != 0);
    }
    ASSERT_TRUE(monitor->stop_session(session.value()).ok());

    TimeWindow window(0, core::WallNowUs() + 1);
    auto first = monitor->queries()->summary(window);
    auto second = monitor->queries()->summary(window);
    ASSERT_TRUE(first.ok() && second.ok());
    EXPECT_EQ(first.value(), second.value());

    auto by_first = monitor->queries()->summary_by_component(window);
    auto by_second = monitor->queries()->summary_by_component(window);
    ASSERT_TRUE(by_first.ok() && by_second.ok());
    EXPECT_EQ(by_first.value(), by_second.value());
}

TEST_F(PipelineTest, TornTailAfterCrashKeepsCommittedEvents) {
    {
        auto monitor = Open();
        ASSERT_TRUE(monitor);
        auto session = monitor->start_session({});
        ASSERT_TRUE(session.ok());
        for (int i = 0; i < 40; ++i) {
            monitor->sampler()->record(Component::NETWORK, "fetch", 200, true);
        }
        ASSERT_TRUE(monitor->stop_session(session.value()).ok());
    }

    // A frame cut short by a crash
    {
        std::ofstream out(config_.storage.path, std::ios::binary | std::ios::app);
        out.write("\x10\x00\x00", 3);
    }

    auto reopened = Open();
    ASSERT_TRUE(reopened);
    EXPECT_EQ(Summary(*reopened).count, 40u);

    auto session = reopened->start_session({});
    ASSERT_TRUE(session.ok());
    reopened->sampler()->record(Component::NETWORK, "fetch", 300, true);
    ASSERT_TRUE(reopened->stop_session(session.value()).ok());

    auto events = reopened->queries()->raw_events(1);
    ASSERT_TRUE(events.ok());
    ASSERT_EQ(events.value().size(), 1u);
    EXPECT_EQ(events.value()[0].duration_us(), 300);
    EXPECT_EQ(events.value()[0].id(), 41);
    EXPECT_EQ(Summary(*reopened).count, 41u);
}

} // namespace
} // namespace integration
} // namespace latmon

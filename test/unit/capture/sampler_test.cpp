#include <gtest/gtest.h>
#include "latmon/capture/sampler.h"

#include <stdexcept>
#include <thread>

namespace latmon {
namespace capture {
namespace {

using core::Component;
using core::LatencyEvent;

// Manually advanced clocks.
struct FakeClock {
    std::atomic<int64_t> monotonic{1000};
    std::atomic<core::Timestamp> wall{1700000000000000};
    std::atomic<bool> fail{false};

    ClockSource source() {
        ClockSource clock;
        clock.monotonic_us = [this] {
            if (fail) {
                throw std::runtime_error("clock unavailable");
            }
            return monotonic.load();
        };
        clock.wall_us = [this] { return wall.load(); };
        return clock;
    }
};

class SamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        buffer_ = std::make_shared<ingest::IngestionBuffer>(core::BufferConfig::Default(), counters_);
        sampler_ = std::make_unique<Sampler>(buffer_, counters_, clock_.source());
        sampler_->open({});
    }

    std::vector<LatencyEvent> Drain() {
        std::vector<LatencyEvent> out;
        buffer_->drain(out, 100000);
        return out;
    }

    FakeClock clock_;
    std::shared_ptr<core::PipelineCounters> counters_ = std::make_shared<core::PipelineCounters>();
    std::shared_ptr<ingest::IngestionBuffer> buffer_;
    std::unique_ptr<Sampler> sampler_;
};

TEST_F(SamplerTest, DurationComesFromMonotonicClock) {
    auto handle = sampler_->begin(Component::TERMINAL, "command");
    ASSERT_TRUE(handle.active());

    clock_.monotonic += 250;
    // A wall clock jump must not affect the duration
    clock_.wall -= 3600LL * 1000000;
    auto event = handle.end(true);

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->duration_us(), 250);
    EXPECT_EQ(event->wall_timestamp(), clock_.wall.load());
    EXPECT_EQ(event->component(), Component::TERMINAL);
    EXPECT_EQ(event->source_label(), "command");
    EXPECT_TRUE(event->success());
    EXPECT_FALSE(event->committed());

    auto buffered = Drain();
    ASSERT_EQ(buffered.size(), 1u);
    EXPECT_EQ(buffered[0], *event);
}

TEST_F(SamplerTest, AnnotationsBecomeMetadata) {
    auto handle = sampler_->begin(Component::MODEL, "completion");
    auto event = handle.annotate("model", "large").annotate("tokens", "12").end(false);

    ASSERT_TRUE(event.has_value());
    EXPECT_FALSE(event->success());
    EXPECT_EQ(event->metadata().at("model"), "large");
    EXPECT_EQ(event->metadata().at("tokens"), "12");
}

TEST_F(SamplerTest, EndTwiceRecordsOnce) {
    auto handle = sampler_->begin(Component::EDITOR, "keystroke");
    EXPECT_TRUE(handle.end(true).has_value());
    EXPECT_FALSE(handle.active());
    EXPECT_FALSE(handle.end(true).has_value());
    EXPECT_EQ(Drain().size(), 1u);
}

TEST_F(SamplerTest, DroppedHandleRecordsNothing) {
    {
        auto handle = sampler_->begin(Component::EDITOR, "keystroke");
        auto moved = std::move(handle);
        EXPECT_FALSE(handle.active());
        EXPECT_TRUE(moved.active());
    }
    EXPECT_TRUE(Drain().empty());
    EXPECT_EQ(counters_->events_submitted.load(), 0u);
}

TEST_F(SamplerTest, BackwardsClockIsCaptureError) {
    auto handle = sampler_->begin(Component::NETWORK, "fetch");
    clock_.monotonic -= 10;

    EXPECT_FALSE(handle.end(true).has_value());
    EXPECT_EQ(counters_->capture_errors.load(), 1u);
    EXPECT_TRUE(Drain().empty());
}

TEST_F(SamplerTest, ThrowingClockIsCaptureError) {
    clock_.fail = true;
    auto handle = sampler_->begin(Component::NETWORK, "fetch");
    EXPECT_FALSE(handle.active());
    EXPECT_EQ(counters_->capture_errors.load(), 1u);

    clock_.fail = false;
    auto second = sampler_->begin(Component::NETWORK, "fetch");
    clock_.fail = true;
    EXPECT_FALSE(second.end(true).has_value());
    EXPECT_EQ(counters_->capture_errors.load(), 2u);
}

TEST_F(SamplerTest, RecordClampsHugeDurations) {
    auto event = sampler_->record(Component::SYSTEM, "sleep", UINT64_MAX, true);
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->duration_us(), core::kMaxDurationUs);
    EXPECT_EQ(event->metadata().at(core::kDurationClampedKey), "true");
    EXPECT_EQ(counters_->durations_clamped.load(), 1u);

    auto normal = sampler_->record(Component::SYSTEM, "sleep", 42, true, {{"k", "v"}});
    ASSERT_TRUE(normal.has_value());
    EXPECT_EQ(normal->duration_us(), 42);
    EXPECT_EQ(normal->metadata().count(core::kDurationClampedKey), 0u);
}

TEST_F(SamplerTest, ClampBoundary) {
    auto at_limit = ClampDuration(static_cast<uint64_t>(core::kMaxDurationUs));
    EXPECT_EQ(at_limit.first, core::kMaxDurationUs);
    EXPECT_FALSE(at_limit.second);

    auto above = ClampDuration(static_cast<uint64_t>(core::kMaxDurationUs) + 1);
    EXPECT_EQ(above.first, core::kMaxDurationUs);
    EXPECT_TRUE(above.second);
}

TEST_F(SamplerTest, ClosedGateAdmitsNothing) {
    sampler_->close();
    EXPECT_FALSE(sampler_->admitting());

    auto handle = sampler_->begin(Component::EDITOR, "keystroke");
    EXPECT_FALSE(handle.active());
    EXPECT_FALSE(handle.end(true).has_value());
    EXPECT_FALSE(sampler_->record(Component::EDITOR, "keystroke", 5, true).has_value());
    EXPECT_EQ(counters_->events_submitted.load(), 0u);
    EXPECT_EQ(counters_->capture_errors.load(), 0u);
}

TEST_F(SamplerTest, FilterRestrictsComponents) {
    sampler_->open({Component::MODEL, Component::NETWORK});
    EXPECT_TRUE(sampler_->admits(Component::MODEL));
    EXPECT_TRUE(sampler_->admits(Component::NETWORK));
    EXPECT_FALSE(sampler_->admits(Component::EDITOR));

    EXPECT_FALSE(sampler_->begin(Component::EDITOR, "keystroke").active());
    EXPECT_TRUE(sampler_->begin(Component::MODEL, "completion").end(true).has_value());
}

TEST_F(SamplerTest, HandleStartedBeforeCloseStillCompletes) {
    auto handle = sampler_->begin(Component::FILE_SYSTEM, "read");
    sampler_->close();
    EXPECT_TRUE(handle.end(true).has_value());
}

TEST_F(SamplerTest, TimeRecordsSuccessAndReturnsValue) {
    int value = sampler_->time(Component::EDITOR_EXTENSION, "activate", [this] {
        clock_.monotonic += 7;
        return 5;
    });
    EXPECT_EQ(value, 5);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].success());
    EXPECT_EQ(events[0].duration_us(), 7);
}

TEST_F(SamplerTest, TimeRecordsFailureAndRethrows) {
    EXPECT_THROW(sampler_->time(Component::EDITOR_EXTENSION, "activate",
                                [] { throw std::runtime_error("boom"); }),
                 std::runtime_error);

    auto events = Drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events[0].success());
}

TEST(SamplerSystemClockTest, TimestampsNonDecreasingPerProducer) {
    auto counters = std::make_shared<core::PipelineCounters>();
    core::BufferConfig config;
    config.capacity = 100000;
    auto buffer = std::make_shared<ingest::IngestionBuffer>(config, counters);
    Sampler sampler(buffer, counters);
    sampler.open({});

    constexpr int kThreads = 4;
    constexpr int kPerThread = 2000;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&sampler, t] {
            for (int i = 0; i < kPerThread; ++i) {
                sampler.begin(Component::SYSTEM, "producer-" + std::to_string(t)).end(true);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<LatencyEvent> events;
    buffer->drain(events, config.capacity);
    ASSERT_EQ(events.size(), static_cast<size_t>(kThreads * kPerThread));

    std::map<std::string, core::Timestamp> last_seen;
    for (const auto& event : events) {
        EXPECT_GE(event.duration_us(), 0);
        auto it = last_seen.find(event.source_label());
        if (it != last_seen.end()) {
            EXPECT_GE(event.wall_timestamp(), it->second);
        }
        last_seen[event.source_label()] = event.wall_timestamp();
    }
}

} // namespace
} // namespace capture
} // namespace latmon

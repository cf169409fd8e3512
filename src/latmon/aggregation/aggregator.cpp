#include "latmon/aggregation/aggregator.h"
#include "latmon/common/logger.h"
#include "latmon/core/error.h"

#include <algorithm>
#include <limits>

namespace latmon {
namespace aggregation {

namespace {

constexpr double kMicrosPerSecond = 1000000.0;

void CheckWindow(const core::TimeWindow& window) {
    if (!window.valid()) {
        throw core::InvalidArgumentError("Invalid window [" + std::to_string(window.start) + ", " +
                                         std::to_string(window.end) + ")");
    }
}

} // namespace

SummaryBuilder::SummaryBuilder(PercentileStrategy strategy,
                               const core::AggregationConfig& config,
                               uint64_t expected_rows)
    : strategy_(strategy),
      estimator_(MakeEstimator(strategy, config, expected_rows)),
      count_(0),
      success_count_(0),
      sum_(0),
      min_(std::numeric_limits<core::DurationUs>::max()),
      max_(0) {}

void SummaryBuilder::add(core::DurationUs duration_us, bool success) {
    count_++;
    if (success) {
        success_count_++;
    }
    sum_ += duration_us;
    min_ = std::min(min_, duration_us);
    max_ = std::max(max_, duration_us);
    std::visit([duration_us](auto& estimator) { estimator.add(duration_us); }, estimator_);
}

core::AggregateSnapshot SummaryBuilder::finish(const core::TimeWindow& window,
                                               std::optional<core::Component> component) {
    core::AggregateSnapshot snapshot;
    snapshot.component = component;
    snapshot.window_start = window.start;
    snapshot.window_end = window.end;
    snapshot.strategy = strategy_;
    snapshot.count = count_;
    if (count_ == 0) {
        return snapshot;
    }

    snapshot.mean_us = static_cast<double>(sum_ / count_);
    snapshot.min_us = min_;
    snapshot.max_us = max_;
    snapshot.success_count = success_count_;
    snapshot.error_rate = static_cast<double>(count_ - success_count_) / static_cast<double>(count_);
    snapshot.events_per_second =
        static_cast<double>(count_) / (static_cast<double>(window.length()) / kMicrosPerSecond);

    std::visit([&snapshot](auto& estimator) {
        snapshot.p50_us = estimator.quantile(0.50);
        snapshot.p95_us = estimator.quantile(0.95);
        snapshot.p99_us = estimator.quantile(0.99);
    }, estimator_);
    return snapshot;
}

Aggregator::Aggregator(storage::StoreReader reader, const core::AggregationConfig& config)
    : reader_(std::move(reader)), config_(config) {}

core::AggregateSnapshot Aggregator::summarize(const core::TimeWindow& window,
                                              std::optional<core::Component> component) const {
    CheckWindow(window);

    uint64_t rows = reader_.count(window, component);
    PercentileStrategy strategy = SelectStrategy(rows, config_);
    if (strategy == PercentileStrategy::HISTOGRAM) {
        LATMON_DEBUG("Summarizing {} rows with the histogram strategy", rows);
    }

    SummaryBuilder builder(strategy, config_, rows);
    reader_.scan_durations(window, component, [&builder](const std::vector<storage::DurationSample>& chunk) {
        for (const auto& sample : chunk) {
            builder.add(sample.duration_us, sample.success);
        }
    });
    return builder.finish(window, component);
}

std::vector<core::AggregateSnapshot> Aggregator::summarize_by_component(const core::TimeWindow& window) const {
    CheckWindow(window);
    std::vector<core::AggregateSnapshot> snapshots;
    snapshots.reserve(core::kComponentCount);
    for (core::Component component : core::AllComponents()) {
        snapshots.push_back(summarize(window, component));
    }
    return snapshots;
}

core::AggregateSnapshot Aggregator::FromEvents(const std::vector<core::LatencyEvent>& events,
                                               const core::TimeWindow& window,
                                               std::optional<core::Component> component,
                                               const core::AggregationConfig& config) {
    CheckWindow(window);

    auto selected = [&](const core::LatencyEvent& event) {
        return window.contains(event.wall_timestamp()) &&
               (!component || event.component() == *component);
    };
    uint64_t rows = static_cast<uint64_t>(std::count_if(events.begin(), events.end(), selected));

    SummaryBuilder builder(SelectStrategy(rows, config), config, rows);
    for (const auto& event : events) {
        if (selected(event)) {
            builder.add(event.duration_us(), event.success());
        }
    }
    return builder.finish(window, component);
}

} // namespace aggregation
} // namespace latmon

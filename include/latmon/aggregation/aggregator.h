#ifndef LATMON_AGGREGATION_AGGREGATOR_H_
#define LATMON_AGGREGATION_AGGREGATOR_H_

#include <optional>
#include <vector>

#include "latmon/aggregation/percentile.h"
#include "latmon/core/config.h"
#include "latmon/core/types.h"
#include "latmon/storage/event_store.h"

namespace latmon {
namespace aggregation {

/**
 * @brief Accumulates one window's statistics
 *
 * count, mean, min, max and success_count are exact; percentiles come from
 * the estimator picked at construction.
 */
class SummaryBuilder {
public:
    SummaryBuilder(PercentileStrategy strategy, const core::AggregationConfig& config, uint64_t expected_rows);

    void add(core::DurationUs duration_us, bool success);

    core::AggregateSnapshot finish(const core::TimeWindow& window, std::optional<core::Component> component);

private:
    PercentileStrategy strategy_;
    PercentileEstimator estimator_;
    uint64_t count_;
    uint64_t success_count_;
    long double sum_;
    core::DurationUs min_;
    core::DurationUs max_;
};

/**
 * @brief Windowed statistics over committed events
 *
 * Read-only; uses a StoreReader and never blocks the writer for longer than
 * one scan chunk.
 */
class Aggregator {
public:
    Aggregator(storage::StoreReader reader, const core::AggregationConfig& config);

    /**
     * @brief Statistics for one component (or all) over the window
     * @throws core::InvalidArgumentError if the window is invalid
     */
    core::AggregateSnapshot summarize(const core::TimeWindow& window,
                                      std::optional<core::Component> component) const;

    /** @brief One snapshot per component, in component order, including empty ones */
    std::vector<core::AggregateSnapshot> summarize_by_component(const core::TimeWindow& window) const;

    /**
     * @brief Same statistics over an in-memory event set
     */
    static core::AggregateSnapshot FromEvents(const std::vector<core::LatencyEvent>& events,
                                              const core::TimeWindow& window,
                                              std::optional<core::Component> component,
                                              const core::AggregationConfig& config);

    const core::AggregationConfig& config() const { return config_; }

private:
    storage::StoreReader reader_;
    core::AggregationConfig config_;
};

} // namespace aggregation
} // namespace latmon

#endif // LATMON_AGGREGATION_AGGREGATOR_H_

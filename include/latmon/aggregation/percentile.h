#ifndef LATMON_AGGREGATION_PERCENTILE_H_
#define LATMON_AGGREGATION_PERCENTILE_H_

#include <memory>
#include <variant>
#include <vector>

#include "latmon/core/config.h"
#include "latmon/core/types.h"
#include "latmon/histogram/histogram.h"

namespace latmon {
namespace aggregation {

using PercentileStrategy = core::PercentileStrategy;

/**
 * @brief Nearest-rank percentiles over every sample, collected then sorted
 */
class ExactPercentiles {
public:
    ExactPercentiles() : sorted_(true) {}

    void reserve(size_t rows) { samples_.reserve(rows); }
    void add(core::DurationUs value);
    uint64_t count() const { return samples_.size(); }

    /** @brief Exact nearest-rank quantile, 0 when empty */
    core::DurationUs quantile(double q);

private:
    std::vector<core::DurationUs> samples_;
    bool sorted_;
};

/**
 * @brief Bounded-memory percentiles from a geometric fixed-bucket histogram
 *
 * Each reported quantile lies within histogram_growth_factor - 1 (relative) of the
 * exact nearest-rank value and inside the observed [min, max].
 */
class HistogramPercentiles {
public:
    explicit HistogramPercentiles(const core::AggregationConfig& config);

    void add(core::DurationUs value);
    uint64_t count() const { return histogram_->count(); }
    core::DurationUs quantile(double q) const;

private:
    std::unique_ptr<histogram::FixedBucketHistogram> histogram_;
};

using PercentileEstimator = std::variant<ExactPercentiles, HistogramPercentiles>;

/**
 * @brief EXACT up to config.exact_threshold rows, HISTOGRAM beyond
 */
PercentileStrategy SelectStrategy(uint64_t rows, const core::AggregationConfig& config);

PercentileEstimator MakeEstimator(PercentileStrategy strategy,
                                  const core::AggregationConfig& config,
                                  uint64_t expected_rows);

} // namespace aggregation
} // namespace latmon

#endif // LATMON_AGGREGATION_PERCENTILE_H_

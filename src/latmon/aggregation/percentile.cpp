#include "latmon/aggregation/percentile.h"
#include "latmon/core/error.h"

#include <algorithm>

namespace latmon {
namespace aggregation {

void ExactPercentiles::add(core::DurationUs value) {
    samples_.push_back(value);
    sorted_ = false;
}

core::DurationUs ExactPercentiles::quantile(double q) {
    if (q < 0.0 || q > 1.0) {
        throw core::InvalidArgumentError("Quantile must be between 0 and 1");
    }
    if (samples_.empty()) {
        return 0;
    }
    if (!sorted_) {
        std::sort(samples_.begin(), samples_.end());
        sorted_ = true;
    }
    return samples_[core::NearestRankIndex(q, samples_.size())];
}

HistogramPercentiles::HistogramPercentiles(const core::AggregationConfig& config)
    : histogram_(histogram::FixedBucketHistogram::create_exponential(config.histogram_growth_factor,
                                                                     config.histogram_max_us)) {}

void HistogramPercentiles::add(core::DurationUs value) {
    histogram_->add(value);
}

core::DurationUs HistogramPercentiles::quantile(double q) const {
    return histogram_->quantile(q);
}

PercentileStrategy SelectStrategy(uint64_t rows, const core::AggregationConfig& config) {
    return rows <= config.exact_threshold ? PercentileStrategy::EXACT : PercentileStrategy::HISTOGRAM;
}

PercentileEstimator MakeEstimator(PercentileStrategy strategy,
                                  const core::AggregationConfig& config,
                                  uint64_t expected_rows) {
    if (strategy == PercentileStrategy::HISTOGRAM) {
        return PercentileEstimator(std::in_place_type<HistogramPercentiles>, config);
    }
    ExactPercentiles exact;
    exact.reserve(static_cast<size_t>(expected_rows));
    return PercentileEstimator(std::move(exact));
}

} // namespace aggregation
} // namespace latmon

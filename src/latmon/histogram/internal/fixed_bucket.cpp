#include "latmon/histogram/internal/fixed_bucket_impl.h"
#include "latmon/core/error.h"
#include <algorithm>
#include <cmath>

namespace latmon {
namespace histogram {
namespace internal {

FixedBucketHistogramImpl::FixedBucketHistogramImpl(const std::vector<core::DurationUs>& bounds)
    : bounds_(bounds), total_count_(0), min_(0), max_(0) {
    if (bounds_.empty()) {
        throw core::InvalidArgumentError("Bucket boundaries cannot be empty");
    }
    if (bounds_.front() <= 0) {
        throw core::InvalidArgumentError("Bucket boundaries must be positive");
    }
    if (std::adjacent_find(bounds_.begin(), bounds_.end(),
                           [](core::DurationUs a, core::DurationUs b) { return a >= b; }) != bounds_.end()) {
        throw core::InvalidArgumentError("Bucket boundaries must be strictly increasing");
    }
    // One bucket below each bound plus the overflow bucket
    counts_.assign(bounds_.size() + 1, 0);
}

size_t FixedBucketHistogramImpl::find_bucket_index(core::DurationUs value) const {
    auto it = std::upper_bound(bounds_.begin(), bounds_.end(), value);
    return static_cast<size_t>(std::distance(bounds_.begin(), it));
}

void FixedBucketHistogramImpl::add(core::DurationUs value) {
    if (value < 0) {
        throw core::InvalidArgumentError("Histogram values must be non-negative");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    ++counts_[find_bucket_index(value)];
    if (total_count_ == 0) {
        min_ = max_ = value;
    } else {
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }
    ++total_count_;
}

uint64_t FixedBucketHistogramImpl::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_count_;
}

core::DurationUs FixedBucketHistogramImpl::quantile(double q) const {
    if (q < 0.0 || q > 1.0) {
        throw core::InvalidArgumentError("Quantile must be between 0 and 1");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (total_count_ == 0) {
        return 0;
    }

    uint64_t rank = core::NearestRankIndex(q, total_count_);
    uint64_t cumulative = 0;

    for (size_t i = 0; i < counts_.size(); ++i) {
        cumulative += counts_[i];
        if (cumulative > rank) {
            core::DurationUs estimate = i < bounds_.size() ? bounds_[i] - 1 : max_;
            return std::clamp(estimate, min_, max_);
        }
    }

    return max_;
}

}  // namespace internal

std::vector<core::DurationUs> ExponentialBounds(double growth_factor, core::DurationUs max_value) {
    if (!(growth_factor > 1.0)) {
        throw core::InvalidArgumentError("Histogram growth factor must be greater than 1");
    }
    if (max_value <= 0) {
        throw core::InvalidArgumentError("Histogram max value must be positive");
    }

    std::vector<core::DurationUs> bounds;
    core::DurationUs bound = 1;
    bounds.push_back(bound);
    while (bound <= max_value) {
        double scaled = std::ceil(static_cast<double>(bound) * growth_factor);
        bound = std::max(bound + 1, static_cast<core::DurationUs>(scaled));
        bounds.push_back(bound);
    }
    return bounds;
}

std::unique_ptr<FixedBucketHistogram> FixedBucketHistogram::create(
    const std::vector<core::DurationUs>& bounds) {
    return std::make_unique<internal::FixedBucketHistogramImpl>(bounds);
}

std::unique_ptr<FixedBucketHistogram> FixedBucketHistogram::create_exponential(
    double growth_factor, core::DurationUs max_value) {
    return create(ExponentialBounds(growth_factor, max_value));
}

}  // namespace histogram
}  // namespace latmon

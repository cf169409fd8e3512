#ifndef LATMON_HISTOGRAM_INTERNAL_FIXED_BUCKET_IMPL_H_
#define LATMON_HISTOGRAM_INTERNAL_FIXED_BUCKET_IMPL_H_

#include <vector>
#include <mutex>
#include <memory>
#include "latmon/histogram/histogram.h"

namespace latmon {
namespace histogram {
namespace internal {

/**
 * @brief Implementation of fixed-bucket histogram
 *
 * Bucket i counts values in [bounds[i-1], bounds[i]); bucket 0 starts at 0
 * and the last bucket is the overflow bucket [bounds.back(), +inf).
 */
class FixedBucketHistogramImpl : public FixedBucketHistogram {
public:
    explicit FixedBucketHistogramImpl(const std::vector<core::DurationUs>& bounds);

    void add(core::DurationUs value) override;
    uint64_t count() const override;
    core::DurationUs quantile(double q) const override;

private:
    size_t find_bucket_index(core::DurationUs value) const;

    std::vector<core::DurationUs> bounds_;
    std::vector<uint64_t> counts_;
    uint64_t total_count_;
    core::DurationUs min_;
    core::DurationUs max_;
    mutable std::mutex mutex_;
};

}  // namespace internal
}  // namespace histogram
}  // namespace latmon

#endif  // LATMON_HISTOGRAM_INTERNAL_FIXED_BUCKET_IMPL_H_

#ifndef LATMON_HISTOGRAM_HISTOGRAM_H_
#define LATMON_HISTOGRAM_HISTOGRAM_H_

#include <memory>
#include <vector>
#include <cstdint>

#include "latmon/core/types.h"

namespace latmon {
namespace histogram {

/**
 * @brief Interface for latency histograms over non-negative microsecond durations
 */
class Histogram {
public:
    virtual ~Histogram() = default;

    /**
     * @brief Add a single duration to the histogram
     * @throws core::InvalidArgumentError if value is negative
     */
    virtual void add(core::DurationUs value) = 0;

    virtual uint64_t count() const = 0;

    /**
     * @brief Nearest-rank estimate of the q quantile
     *
     * Returns the inclusive upper edge of the bucket holding the nearest-rank
     * sample, clamped to the observed [min, max]. Returns 0 when empty.
     */
    virtual core::DurationUs quantile(double q) const = 0;
};

/**
 * @brief Interface for fixed-bucket histogram
 */
class FixedBucketHistogram : public Histogram {
public:
    /**
     * @brief Create a new fixed-bucket histogram
     *
     * @param bounds Strictly increasing positive bucket boundaries
     * @throws core::InvalidArgumentError if bounds are empty or unsorted
     */
    static std::unique_ptr<FixedBucketHistogram> create(
        const std::vector<core::DurationUs>& bounds);

    /**
     * @brief Create a histogram with geometric bounds 1, ~f, ~f^2, ... up to max_value
     */
    static std::unique_ptr<FixedBucketHistogram> create_exponential(
        double growth_factor, core::DurationUs max_value);
};

/**
 * @brief Geometric bucket boundaries starting at 1us
 *
 * Consecutive bounds differ by at least 1 and by a factor of at most
 * growth_factor once past the integer-step region, so an upper-edge estimate
 * is within growth_factor - 1 of the true value. The last bound exceeds
 * max_value.
 *
 * @throws core::InvalidArgumentError if growth_factor <= 1 or max_value <= 0
 */
std::vector<core::DurationUs> ExponentialBounds(double growth_factor, core::DurationUs max_value);

} // namespace histogram
} // namespace latmon

#endif // LATMON_HISTOGRAM_HISTOGRAM_H_

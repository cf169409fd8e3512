#include <gtest/gtest.h>
#include "latmon/histogram/histogram.h"
#include "latmon/core/error.h"
#include "latmon/core/types.h"
#include <thread>

namespace latmon {
namespace histogram {
namespace {

class FixedBucketTest : public ::testing::Test {
protected:
    void SetUp() override {
        bounds_ = {1, 2, 5, 10, 20, 50, 100};
        hist_ = FixedBucketHistogram::create(bounds_);
    }

    std::vector<core::DurationUs> bounds_;
    std::unique_ptr<FixedBucketHistogram> hist_;
};

TEST_F(FixedBucketTest, EmptyHistogram) {
    EXPECT_EQ(hist_->count(), 0u);
    EXPECT_EQ(hist_->quantile(0.0), 0);
    EXPECT_EQ(hist_->quantile(0.5), 0);
    EXPECT_EQ(hist_->quantile(1.0), 0);
}

TEST_F(FixedBucketTest, SingleValue) {
    hist_->add(42);

    EXPECT_EQ(hist_->count(), 1u);
    // Lands in [20, 50); every quantile clamps to the single observation
    EXPECT_EQ(hist_->quantile(0.0), 42);
    EXPECT_EQ(hist_->quantile(0.5), 42);
    EXPECT_EQ(hist_->quantile(0.99), 42);
}

TEST_F(FixedBucketTest, OneValuePerBucket) {
    std::vector<core::DurationUs> values = {0, 1, 3, 7, 15, 30, 75, 150};
    for (auto value : values) {
        hist_->add(value);
    }

    EXPECT_EQ(hist_->count(), values.size());
    // Sample k sits alone in bucket k; finite buckets report bound - 1
    EXPECT_EQ(hist_->quantile(0.0), 0);
    EXPECT_EQ(hist_->quantile(0.25), 1);
    EXPECT_EQ(hist_->quantile(0.5), 9);
    EXPECT_EQ(hist_->quantile(0.75), 49);
    EXPECT_EQ(hist_->quantile(1.0), 150);
}

TEST_F(FixedBucketTest, ValueOnBoundOpensNextBucket) {
    hist_->add(4);
    hist_->add(5);
    // 5 belongs to [5, 10), so the max quantile reports the observed max
    EXPECT_EQ(hist_->quantile(1.0), 5);
    EXPECT_EQ(hist_->quantile(0.0), 4);
}

TEST_F(FixedBucketTest, Concurrent) {
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([this]() {
            for (int j = 0; j < 1000; ++j) {
                hist_->add(j % 100);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(hist_->count(), 10000u);
}

TEST_F(FixedBucketTest, NearestRankQuantiles) {
    for (int i = 1; i <= 100; ++i) {
        hist_->add(i);
    }

    // Rank 1 sits in [1, 2)
    EXPECT_EQ(hist_->quantile(0.0), 1);
    // Rank 49 is the last sample of [20, 50)
    EXPECT_EQ(hist_->quantile(0.49), 49);
    // Rank 50 opens [50, 100), reported as its inclusive upper edge
    EXPECT_EQ(hist_->quantile(0.5), 99);
    // Rank 100 is in the overflow bucket, reported as the observed max
    EXPECT_EQ(hist_->quantile(1.0), 100);

    EXPECT_THROW(hist_->quantile(1.5), core::InvalidArgumentError);
    EXPECT_THROW(hist_->quantile(-0.1), core::InvalidArgumentError);
}

TEST_F(FixedBucketTest, InvalidConstruction) {
    EXPECT_THROW(FixedBucketHistogram::create({}), core::InvalidArgumentError);
    EXPECT_THROW(FixedBucketHistogram::create({2, 1}), core::InvalidArgumentError);
    EXPECT_THROW(FixedBucketHistogram::create({1, 1}), core::InvalidArgumentError);
    EXPECT_THROW(FixedBucketHistogram::create({0, 1}), core::InvalidArgumentError);
    EXPECT_THROW(hist_->add(-1), core::InvalidArgumentError);
}

TEST(ExponentialBoundsTest, CoversRangeAndIncreases) {
    auto bounds = ExponentialBounds(1.05, core::kMaxDurationUs);

    ASSERT_GE(bounds.size(), 2u);
    EXPECT_EQ(bounds.front(), 1);
    EXPECT_GT(bounds.back(), core::kMaxDurationUs);
    EXPECT_LE(bounds[bounds.size() - 2], core::kMaxDurationUs);
    for (size_t i = 1; i < bounds.size(); ++i) {
        EXPECT_GT(bounds[i], bounds[i - 1]);
    }
    // Geometric growth keeps the bucket count small
    EXPECT_LT(bounds.size(), 1000u);
}

TEST(ExponentialBoundsTest, RejectsBadParameters) {
    EXPECT_THROW(ExponentialBounds(1.0, 1000), core::InvalidArgumentError);
    EXPECT_THROW(ExponentialBounds(0.5, 1000), core::InvalidArgumentError);
    EXPECT_THROW(ExponentialBounds(1.05, 0), core::InvalidArgumentError);
}

TEST(ExponentialHistogramTest, EstimateWithinGrowthFactor) {
    const double growth = 1.05;
    auto hist = FixedBucketHistogram::create_exponential(growth, core::kMaxDurationUs);
    const int n = 10000;
    for (int i = 1; i <= n; ++i) {
        hist->add(i);
    }

    for (int i = 1; i <= n; i += 7) {
        double q = static_cast<double>(i) / n;
        core::DurationUs estimate = hist->quantile(q);
        // Upper-edge reporting never underestimates
        EXPECT_GE(estimate, i);
        EXPECT_LT(static_cast<double>(estimate - i) / i, growth - 1.0) << "i=" << i;
    }
}

TEST(ExponentialHistogramTest, ConstantSamplesReportExactValue) {
    auto hist = FixedBucketHistogram::create_exponential(1.05, core::kMaxDurationUs);
    for (int i = 0; i < 1000; ++i) {
        hist->add(100);
    }

    EXPECT_EQ(hist->count(), 1000u);
    EXPECT_EQ(hist->quantile(0.0), 100);
    EXPECT_EQ(hist->quantile(0.5), 100);
    EXPECT_EQ(hist->quantile(0.99), 100);
}

TEST(ExponentialHistogramTest, LargeDurationsStayInRange) {
    auto hist = FixedBucketHistogram::create_exponential(1.05, core::kMaxDurationUs);
    hist->add(core::kMaxDurationUs);
    hist->add(1);

    EXPECT_EQ(hist->quantile(1.0), core::kMaxDurationUs);
    EXPECT_EQ(hist->quantile(0.0), 1);
}

} // namespace
} // namespace histogram
} // namespace latmon

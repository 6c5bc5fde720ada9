//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/StatisticsTests.cpp
// Purpose: Check streaming statistics and batch-mean order statistics.
// Key invariants: Summaries sort batch means before selecting from them.
// Ownership/Lifetime: Pure value tests.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bench/Statistics.hpp"
#include "bench/TimingResult.hpp"

#include <vector>

using namespace hat::bench;

TEST(StatisticsTest, RunningStatsMatchesDirectFormulas)
{
    RunningStats stats;
    for (double x : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0})
        stats.add(x);

    EXPECT_EQ(stats.count(), 8u);
    EXPECT_DOUBLE_EQ(stats.mean(), 5.0);
    EXPECT_NEAR(stats.variance(), 32.0 / 7.0, 1e-12);
    EXPECT_DOUBLE_EQ(stats.min(), 2.0);
    EXPECT_DOUBLE_EQ(stats.max(), 9.0);
}

TEST(StatisticsTest, SingleSampleHasNoVariance)
{
    RunningStats stats;
    stats.add(3.0);
    EXPECT_DOUBLE_EQ(stats.variance(), 0.0);
}

TEST(StatisticsTest, BatchesAverageFullGroupsOnly)
{
    BatchAccumulator batches(3);
    for (double x : {1.0, 2.0, 3.0, 10.0, 20.0, 30.0, 100.0})
        batches.add(x);

    ASSERT_EQ(batches.means().size(), 2u);
    EXPECT_DOUBLE_EQ(batches.means()[0], 2.0);
    EXPECT_DOUBLE_EQ(batches.means()[1], 20.0);
    EXPECT_EQ(batches.meansOrPartial().size(), 2u);
}

TEST(StatisticsTest, PartialBatchStandsInWhenNoneCompleted)
{
    BatchAccumulator batches(10);
    batches.add(1.0);
    batches.add(3.0);
    EXPECT_TRUE(batches.means().empty());
    ASSERT_EQ(batches.meansOrPartial().size(), 1u);
    EXPECT_DOUBLE_EQ(batches.meansOrPartial()[0], 2.0);
}

TEST(StatisticsTest, SummaryFollowsSortedMeans)
{
    const auto s = summarizeBatches({5.0, 1.0, 4.0, 2.0, 3.0, 10.0, 6.0, 8.0, 7.0, 9.0});
    EXPECT_DOUBLE_EQ(s.meanOfMeans, 5.5);
    EXPECT_DOUBLE_EQ(s.medianOfMeans, 6.0);
    EXPECT_DOUBLE_EQ(s.meanOfSmallMeans, 3.0);
    ASSERT_TRUE(s.robustMean.has_value());
    // Drops the two smallest and two largest: mean of 3..8.
    EXPECT_DOUBLE_EQ(*s.robustMean, 5.5);
    EXPECT_DOUBLE_EQ(s.minOfMeans, 1.0);
}

TEST(StatisticsTest, RobustMeanNeedsEnoughBatches)
{
    const auto one = summarizeBatches({4.0});
    EXPECT_DOUBLE_EQ(one.meanOfSmallMeans, 4.0);
    EXPECT_DOUBLE_EQ(one.medianOfMeans, 4.0);
    // One batch: ceil(1/5) = 1 is trimmed from the top, leaving nothing.
    EXPECT_FALSE(one.robustMean.has_value());

    const auto three = summarizeBatches({3.0, 1.0, 2.0});
    ASSERT_TRUE(three.robustMean.has_value());
    EXPECT_DOUBLE_EQ(*three.robustMean, 1.5);
}

TEST(StatisticsTest, FinalizeFromBatchesFallsBackToOverallMean)
{
    TimingResult result;
    result.iterations = 4;
    result.totalSeconds = 2.0;
    finalizeFromBatches(result);
    EXPECT_DOUBLE_EQ(result.meanDuration, 0.5);
    ASSERT_TRUE(result.summary.has_value());
    EXPECT_DOUBLE_EQ(result.summary->minOfMeans, 0.5);
}

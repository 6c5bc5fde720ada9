//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/Statistics.cpp
// Purpose: Implement streaming and batch statistics for benchmark timings.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Timing statistics.
/// @details Per-call durations stream through a Welford accumulator so long
///          sessions never store every sample.  Batch means feed the order
///          statistics reported per function: the median, the mean of the
///          faster half, a trimmed mean, and the minimum.

#include "bench/Statistics.hpp"

#include <algorithm>
#include <numeric>

namespace hat::bench
{

void RunningStats::add(double sample) noexcept
{
    ++count_;
    if (count_ == 1)
    {
        min_ = sample;
        max_ = sample;
    }
    else
    {
        min_ = std::min(min_, sample);
        max_ = std::max(max_, sample);
    }
    const double delta = sample - mean_;
    mean_ += delta / static_cast<double>(count_);
    m2_ += delta * (sample - mean_);
}

double RunningStats::variance() const noexcept
{
    if (count_ < 2)
        return 0.0;
    return m2_ / static_cast<double>(count_ - 1);
}

bool BatchAccumulator::add(double sample)
{
    pendingSum_ += sample;
    if (++pending_ < batchSize_)
        return false;
    means_.push_back(pendingSum_ / static_cast<double>(batchSize_));
    pending_ = 0;
    pendingSum_ = 0.0;
    return true;
}

std::vector<double> BatchAccumulator::meansOrPartial() const
{
    if (!means_.empty() || pending_ == 0)
        return means_;
    return {pendingSum_ / static_cast<double>(pending_)};
}

namespace
{

double meanOf(std::vector<double>::const_iterator first, std::vector<double>::const_iterator last)
{
    const auto n = std::distance(first, last);
    return std::accumulate(first, last, 0.0) / static_cast<double>(n);
}

} // namespace

/// @brief Summarise @p batchMeans.
/// @details With n sorted means: the median is element n/2; the small-means
///          average covers the first max(1, n/2); the robust mean drops
///          floor(n/5) from the low end and ceil(n/5) from the high end and is
///          absent when nothing remains.
BatchSummary summarizeBatches(std::vector<double> batchMeans)
{
    BatchSummary summary;
    if (batchMeans.empty())
        return summary;

    std::sort(batchMeans.begin(), batchMeans.end());
    const std::size_t n = batchMeans.size();

    summary.meanOfMeans = meanOf(batchMeans.begin(), batchMeans.end());
    summary.medianOfMeans = batchMeans[n / 2];
    summary.meanOfSmallMeans =
        meanOf(batchMeans.begin(),
               batchMeans.begin() + static_cast<std::ptrdiff_t>(std::max<std::size_t>(1, n / 2)));

    const std::size_t low = n / 5;
    const std::size_t high = n - (n + 4) / 5;
    if (low < high)
        summary.robustMean = meanOf(batchMeans.begin() + static_cast<std::ptrdiff_t>(low),
                                    batchMeans.begin() + static_cast<std::ptrdiff_t>(high));
    summary.minOfMeans = batchMeans.front();
    return summary;
}

} // namespace hat::bench

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/Statistics.hpp
// Purpose: Streaming statistics over per-call durations and order statistics
//          over batch means.
// Key invariants: Memory use is independent of the number of calls except for
//                 one double per completed batch.
// Ownership/Lifetime: Value types.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace hat::bench
{

/// @brief Welford accumulator for mean, variance and range.
class RunningStats
{
  public:
    /// @brief Add one sample.
    void add(double sample) noexcept;

    [[nodiscard]] std::uint64_t count() const noexcept
    {
        return count_;
    }

    [[nodiscard]] double mean() const noexcept
    {
        return mean_;
    }

    /// @brief Sample variance; 0 with fewer than two samples.
    [[nodiscard]] double variance() const noexcept;

    [[nodiscard]] double min() const noexcept
    {
        return min_;
    }

    [[nodiscard]] double max() const noexcept
    {
        return max_;
    }

  private:
    std::uint64_t count_ = 0;
    double mean_ = 0.0;
    double m2_ = 0.0;
    double min_ = 0.0;
    double max_ = 0.0;
};

/// @brief Groups consecutive samples into fixed-size batches and keeps their means.
class BatchAccumulator
{
  public:
    explicit BatchAccumulator(std::size_t batchSize) : batchSize_(batchSize ? batchSize : 1) {}

    /// @brief Add one sample.
    /// @return True when the sample completed a batch.
    bool add(double sample);

    /// @brief Means of completed batches in completion order.
    [[nodiscard]] const std::vector<double> &means() const noexcept
    {
        return means_;
    }

    /// @brief Completed batch means, or the partial batch when none completed.
    [[nodiscard]] std::vector<double> meansOrPartial() const;

  private:
    std::size_t batchSize_;
    std::size_t pending_ = 0;
    double pendingSum_ = 0.0;
    std::vector<double> means_;
};

/// @brief Order statistics over batch means.
struct BatchSummary
{
    double meanOfMeans = 0.0;
    double medianOfMeans = 0.0;     ///< Element n/2 of the sorted means.
    double meanOfSmallMeans = 0.0;  ///< Mean of the lower half, at least one batch.
    std::optional<double> robustMean; ///< Mean after trimming a fifth from each end.
    double minOfMeans = 0.0;
};

/// @brief Summarise @p batchMeans; empty input yields an all-zero summary.
[[nodiscard]] BatchSummary summarizeBatches(std::vector<double> batchMeans);

} // namespace hat::bench

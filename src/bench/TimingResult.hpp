//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/TimingResult.hpp
// Purpose: Declares the outcome of one benchmark session.
// Key invariants: meanDuration == totalSeconds / iterations when iterations > 0.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bench/Statistics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hat::bench
{

/// @brief Measurements of one function.
/// @details Sessions update a result in place as they go, so progress hooks
///          and isolated runs can observe partial results.
struct TimingResult
{
    std::string functionName;
    std::uint64_t iterations = 0;        ///< Measured calls.
    std::uint64_t warmupIterations = 0;  ///< Untimed calls before measurement.
    std::size_t replicaCount = 0;        ///< Argument sets in the working set.
    std::size_t footprintBytes = 0;      ///< Binder-owned bytes per call.
    double totalSeconds = 0.0;           ///< Sum of measured call durations.
    double meanDuration = 0.0;           ///< Seconds per call.
    std::vector<double> batchMeans;      ///< Completed batch means in order.

    double variance = 0.0; ///< Sample variance of per-call durations.
    double min = 0.0;      ///< Fastest call.
    double max = 0.0;      ///< Slowest call.
    std::optional<BatchSummary> summary;

    bool complete = true;
    std::string incompleteReason;
};

/// @brief Fill the derived fields of @p result from the session accumulators.
void finalizeResult(TimingResult &result,
                    const RunningStats &calls,
                    const BatchAccumulator &batches);

/// @brief Derive mean and batch summary from the counters alone.
/// @details Used when per-call samples are unavailable, e.g. for partial
///          results reassembled from an isolated child.  Without a completed
///          batch the overall mean stands in as the single partial batch.
void finalizeFromBatches(TimingResult &result);

/// @brief Write a one-line human-readable summary of @p result.
void printResult(const TimingResult &result, std::ostream &os);

} // namespace hat::bench

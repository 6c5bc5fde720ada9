//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/TimingResult.cpp
// Purpose: Derive and print the summary fields of a TimingResult.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include "bench/TimingResult.hpp"

namespace hat::bench
{

void finalizeResult(TimingResult &result,
                    const RunningStats &calls,
                    const BatchAccumulator &batches)
{
    result.batchMeans = batches.means();
    result.meanDuration =
        result.iterations ? result.totalSeconds / static_cast<double>(result.iterations) : 0.0;
    result.variance = calls.variance();
    result.min = calls.min();
    result.max = calls.max();

    auto means = batches.meansOrPartial();
    if (means.empty())
        result.summary.reset();
    else
        result.summary = summarizeBatches(std::move(means));
}

void finalizeFromBatches(TimingResult &result)
{
    result.meanDuration =
        result.iterations ? result.totalSeconds / static_cast<double>(result.iterations) : 0.0;
    if (!result.batchMeans.empty())
        result.summary = summarizeBatches(result.batchMeans);
    else if (result.iterations)
        result.summary = summarizeBatches({result.meanDuration});
    else
        result.summary.reset();
}

void printResult(const TimingResult &result, std::ostream &os)
{
    os << result.functionName << ": " << result.iterations << " calls, mean "
       << result.meanDuration << " s";
    if (result.summary)
        os << ", median of means " << result.summary->medianOfMeans << " s";
    os << " (" << result.replicaCount << " replicas of " << result.footprintBytes << " bytes)";
    if (!result.complete)
        os << " [incomplete: " << result.incompleteReason << ']';
    os << '\n';
}

} // namespace hat::bench

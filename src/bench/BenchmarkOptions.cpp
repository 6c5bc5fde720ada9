//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/BenchmarkOptions.cpp
// Purpose: Range checks for benchmark settings.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include "bench/BenchmarkOptions.hpp"

#include <cmath>
#include <string>

namespace hat::bench
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

namespace
{

support::Diag invalid(const char *field, const std::string &constraint)
{
    auto diag = makeError(ErrorKind::InvalidOption, std::string(field) + " must be " + constraint);
    diag.parameter = field;
    return diag;
}

bool nonNegativeFinite(double value)
{
    return std::isfinite(value) && value >= 0.0;
}

} // namespace

Expected<void> validateOptions(const BenchmarkOptions &options)
{
    if (options.minimumIterations < 1)
        return invalid("minimumIterations", "at least 1");
    if (!nonNegativeFinite(options.minimumTimeInSec))
        return invalid("minimumTimeInSec", "finite and non-negative");
    if (!nonNegativeFinite(options.minimumWorkingSetSizeMB))
        return invalid("minimumWorkingSetSizeMB", "finite and non-negative");
    if (options.warmupIterations < 0)
        return invalid("warmupIterations", "non-negative");
    if (options.batchSize < 1)
        return invalid("batchSize", "at least 1");
    if (!nonNegativeFinite(options.maximumTimeInSec))
        return invalid("maximumTimeInSec", "finite and non-negative");
    if (options.dimensionChoices.empty())
        return invalid("dimensionChoices", "non-empty");
    for (const auto choice : options.dimensionChoices)
    {
        if (choice <= 0)
            return invalid("dimensionChoices", "positive");
    }
    return {};
}

std::size_t workingSetBytes(const BenchmarkOptions &options) noexcept
{
    return static_cast<std::size_t>(std::ceil(options.minimumWorkingSetSizeMB *
                                              static_cast<double>(kBytesPerMB)));
}

} // namespace hat::bench

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/BenchmarkOptions.hpp
// Purpose: Declares the settings that control one benchmark session.
// Key invariants: Sessions only run with options accepted by validateOptions().
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include "binder/ArgumentBinder.hpp"
#include "binder/RandomInputs.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hat::bench
{

/// @brief Bytes per MB in working-set sizes.
inline constexpr std::size_t kBytesPerMB = std::size_t{1} << 20;

/// @brief Settings for a benchmark session.
/// @invariant Floors are combined with AND: a session stops only when both
///            the iteration floor and the time floor are met.
/// @ownership Value type.
struct BenchmarkOptions
{
    /// @brief Measured calls required before the session may stop.
    int minimumIterations = 100;

    /// @brief Measured seconds required before the session may stop.
    double minimumTimeInSec = 1.0;

    /// @brief Minimum total bytes of input replicas; 0 uses a single replica.
    double minimumWorkingSetSizeMB = 50.0;

    /// @brief Untimed calls made before measurement starts.
    int warmupIterations = 10;

    /// @brief Calls grouped into one batch mean.
    int batchSize = 10;

    /// @brief Soft limit on the whole session in seconds (0 means unlimited).
    double maximumTimeInSec = 0.0;

    /// @brief Seed for input generation (0 means nondeterministic).
    std::uint64_t seed = 0;

    /// @brief Values drawn for integer parameters that size input arrays.
    std::vector<long long> dimensionChoices = binder::kDefaultDimensionChoices;

    /// @brief Policy for callee-allocated outputs without a release convention.
    binder::OwnershipPolicy unspecifiedOwnership = binder::OwnershipPolicy::Leak;

    /// @brief Emit `[bench]` progress lines to the trace stream.
    bool verbose = false;
};

/// @brief Check every field of @p options against its documented range.
/// @return InvalidOption naming the offending field.
support::Expected<void> validateOptions(const BenchmarkOptions &options);

/// @brief Working-set size in bytes requested by @p options.
[[nodiscard]] std::size_t workingSetBytes(const BenchmarkOptions &options) noexcept;

} // namespace hat::bench

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/PackageRunner.hpp
// Purpose: Declares package-wide benchmark runs and their CSV report.
// Key invariants: A failing function never stops the functions after it.
// Ownership/Lifetime: Results are returned by value; the package is only
//                     modified through its auxiliary metadata.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bench/Harness.hpp"
#include "invoke/NativeLibrary.hpp"
#include "schema/Package.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace hat::bench
{

/// @brief Maps a function to the native handle that implements it.
using NativeResolver =
    std::function<support::Expected<invoke::NativeFunction>(const schema::FunctionSpec &)>;

/// @brief Resolver looking functions up in @p library, which must outlive it.
[[nodiscard]] NativeResolver resolverFor(const invoke::NativeLibrary &library);

/// @brief Settings of a package run.
struct PackageRunOptions
{
    BenchmarkOptions benchmark;
    /// Functions to run in this order; empty runs the whole package.
    std::vector<std::string> functions;
    /// Run every session in a forked child.
    bool isolate = false;
    /// Record the mean of batch means under kMeanDurationKey.
    bool storeInPackage = false;
};

/// @brief Outcome of a package run.
struct PackageRunReport
{
    std::vector<TimingResult> results;
    std::vector<std::string> skipped;   ///< Initialization and debug helpers.
    std::vector<support::Diag> failures; ///< One per function that could not be benchmarked.
};

/// @brief True for package helpers that are never benchmarked.
/// @details Matches names containing "Initialize" or "_debug_check_allclose".
[[nodiscard]] bool isHelperFunction(std::string_view name);

/// @brief Benchmark the functions of @p package.
/// @details Failures are collected per function, also reported to
///          @p hooks.diags, and the run moves on to the next function.
/// @return InvalidOption for bad options, UnknownFunction when a requested
///         name is not in the package.
support::Expected<PackageRunReport> benchmarkPackage(schema::Package &package,
                                                     const NativeResolver &resolve,
                                                     const PackageRunOptions &options,
                                                     const SessionHooks &hooks = {});

/// @brief Write @p results as CSV with the columns
///        function_name,mean,median_of_means,mean_of_small_means,robust_mean,min_of_means.
/// @details A robust mean that could not be computed is written as -1.
support::Expected<void> writeCsv(const std::vector<TimingResult> &results, std::ostream &os);

/// @brief writeCsv() into the file at @p path, replacing it.
support::Expected<void> writeCsvFile(const std::vector<TimingResult> &results,
                                     const std::string &path);

} // namespace hat::bench

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/Harness.hpp
// Purpose: Declares the benchmark session and the single-call verification pass.
// Key invariants: Only the native call itself is inside the timed region;
//                 binding, recycling and harvesting happen outside it.
// Ownership/Lifetime: A session owns its working set for its whole duration.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bench/BenchmarkOptions.hpp"
#include "bench/TimingResult.hpp"
#include "invoke/NativeCall.hpp"
#include "schema/FunctionSpec.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <ostream>

namespace hat::bench
{

/// @brief Optional observers of a session.
struct SessionHooks
{
    /// Receives warnings such as UnspecifiedOwnership.
    support::DiagnosticEngine *diags = nullptr;
    /// Destination of `[bench]` lines when verbose; std::cerr when null.
    std::ostream *trace = nullptr;
    /// Called once the working set is bound.
    std::function<void(const TimingResult &)> onSetup;
    /// Called after every completed measured batch.
    std::function<void(const TimingResult &)> onBatch;
};

/// @brief Benchmark @p fn through @p native.
/// @details Binds a rotating working set of random inputs, runs the warmup
///          calls, then times calls until both floors of @p options are met.
///          A session that hits maximumTimeInSec first returns a result
///          tagged incomplete.
/// @return InvalidOption for bad options, or the binding diagnostic that
///         stopped the session.
support::Expected<TimingResult> runBenchmark(const schema::FunctionSpec &fn,
                                             const invoke::NativeFunction &native,
                                             const BenchmarkOptions &options,
                                             const SessionHooks &hooks = {});

/// @brief Call @p fn once with random inputs and print its arguments before
///        and after the call, then its return value, to @p os.
support::Expected<void> verifyFunction(const schema::FunctionSpec &fn,
                                       const invoke::NativeFunction &native,
                                       std::ostream &os,
                                       const BenchmarkOptions &options = {});

} // namespace hat::bench

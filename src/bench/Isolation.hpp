//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/Isolation.hpp
// Purpose: Declares benchmark sessions run in a forked child process.
// Key invariants: A fault in the native function never terminates the caller.
// Ownership/Lifetime: The child owns the working set; the parent only sees
//                     progress records.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include "bench/Harness.hpp"

namespace hat::bench
{

/// @brief Run runBenchmark() in a forked child.
/// @details The child streams setup, batch and completion records through a
///          pipe.  When it dies before completing, the parent returns the
///          partial result tagged incomplete, naming the terminating signal
///          or exit status.  Warnings the child reports are forwarded to
///          @p hooks.diags and onBatch runs in the parent as batches arrive.
/// @return IsolationFailed when the child cannot be started, or the
///         diagnostic that stopped the child's session.
support::Expected<TimingResult> runIsolated(const schema::FunctionSpec &fn,
                                            const invoke::NativeFunction &native,
                                            const BenchmarkOptions &options,
                                            const SessionHooks &hooks = {});

} // namespace hat::bench

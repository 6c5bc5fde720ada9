//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/Harness.cpp
// Purpose: Implement the measured benchmark loop.
// Key invariants: Call k uses replica k mod replicaCount, warmup included.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Benchmark session driver.
/// @details A session proceeds in phases:
///          1. bind the working set;
///          2. warm up by cycling through replicas without timing;
///          3. time individual calls with a monotonic clock until both the
///             iteration floor and the measured-time floor are met;
///          4. reduce the samples into a TimingResult.
///          The optional session limit is checked between calls only, so a
///          slow call always runs to completion.

#include "bench/Harness.hpp"

#include "bench/WorkingSet.hpp"
#include "binder/RandomInputs.hpp"

#include <chrono>
#include <iostream>

namespace hat::bench
{

using support::ErrorKind;
using support::Expected;
using Clock = std::chrono::steady_clock;

namespace
{

double secondsBetween(Clock::time_point begin, Clock::time_point end)
{
    return std::chrono::duration<double>(end - begin).count();
}

Expected<binder::ArgumentBinder> makeBinder(const schema::FunctionSpec &fn,
                                            const invoke::NativeFunction &native,
                                            const BenchmarkOptions &options,
                                            support::DiagnosticEngine *diags)
{
    if (!native.symbol)
        return support::makeError(
            ErrorKind::SymbolNotFound, "native function has no address", fn.name);

    binder::BinderOptions binderOptions;
    binderOptions.unspecifiedOwnership = options.unspecifiedOwnership;
    binderOptions.release = native.release;
    binderOptions.diags = diags;
    return binder::ArgumentBinder::create(fn, binderOptions);
}

} // namespace

Expected<TimingResult> runBenchmark(const schema::FunctionSpec &fn,
                                    const invoke::NativeFunction &native,
                                    const BenchmarkOptions &options,
                                    const SessionHooks &hooks)
{
    if (auto ok = validateOptions(options); !ok)
        return ok.takeError();

    auto binder = makeBinder(fn, native, options, hooks.diags);
    if (!binder)
        return binder.takeError();

    std::ostream &trace = hooks.trace ? *hooks.trace : std::cerr;
    const auto sessionStart = Clock::now();

    binder::RandomInputs inputs(options.seed, options.dimensionChoices);
    auto built = WorkingSet::build(binder.value(), inputs, workingSetBytes(options));
    if (!built)
        return built.takeError();
    WorkingSet &ws = built.value();

    TimingResult result;
    result.functionName = fn.name;
    result.replicaCount = ws.replicaCount();
    result.footprintBytes = ws.footprint();
    result.warmupIterations = static_cast<std::uint64_t>(options.warmupIterations);

    if (options.verbose)
        trace << "[bench] " << fn.name << ": using " << ws.replicaCount()
              << " input sets, each " << ws.footprint() << " bytes\n";
    if (hooks.onSetup)
        hooks.onSetup(result);

    const invoke::ReturnClass rc = invoke::returnClassOf(fn);
    std::uint64_t sequence = 0;

    if (options.verbose)
        trace << "[bench] " << fn.name << ": warming up for " << options.warmupIterations
              << " iterations\n";
    for (int i = 0; i < options.warmupIterations; ++i)
    {
        binder::ArgumentSet &args = ws.slot(sequence++);
        args.recycle();
        if (auto ok = invoke::callAndHarvest(native, args); !ok)
            return ok.takeError();
    }

    if (options.verbose)
        trace << "[bench] " << fn.name << ": timing for at least " << options.minimumTimeInSec
              << " s and at least " << options.minimumIterations << " iterations\n";

    RunningStats calls;
    BatchAccumulator batches(static_cast<std::size_t>(options.batchSize));
    const auto minimumIterations = static_cast<std::uint64_t>(options.minimumIterations);

    while (result.iterations < minimumIterations ||
           result.totalSeconds < options.minimumTimeInSec)
    {
        if (options.maximumTimeInSec > 0.0 &&
            secondsBetween(sessionStart, Clock::now()) >= options.maximumTimeInSec)
        {
            result.complete = false;
            result.incompleteReason = "session limit of " +
                                      std::to_string(options.maximumTimeInSec) +
                                      " s reached after " + std::to_string(result.iterations) +
                                      " calls";
            break;
        }

        binder::ArgumentSet &args = ws.slot(sequence++);
        args.recycle();

        const auto begin = Clock::now();
        const std::uint64_t raw = invoke::callWords(native.symbol, args.words(), rc);
        const auto end = Clock::now();

        args.setReturnBits(raw);
        if (auto ok = args.harvest(); !ok)
            return ok.takeError();

        const double elapsed = secondsBetween(begin, end);
        calls.add(elapsed);
        ++result.iterations;
        result.totalSeconds += elapsed;
        if (batches.add(elapsed) && hooks.onBatch)
        {
            result.batchMeans = batches.means();
            hooks.onBatch(result);
        }
    }

    finalizeResult(result, calls, batches);

    if (options.verbose)
    {
        trace << "[bench] " << fn.name << ": mean " << result.meanDuration << " s over "
              << result.iterations << " calls";
        if (!result.complete)
            trace << " (incomplete: " << result.incompleteReason << ')';
        trace << '\n';
    }
    return result;
}

Expected<void> verifyFunction(const schema::FunctionSpec &fn,
                              const invoke::NativeFunction &native,
                              std::ostream &os,
                              const BenchmarkOptions &options)
{
    auto binder = makeBinder(fn, native, options, nullptr);
    if (!binder)
        return binder.takeError();

    binder::RandomInputs inputs(options.seed, options.dimensionChoices);
    auto bound = binder.value().bind(inputs);
    if (!bound)
        return bound.takeError();
    binder::ArgumentSet &args = bound.value();

    os << fn.name << '\n';
    for (const auto &arg : args.arguments())
        os << "  before " << binder::formatArgument(args, arg) << '\n';

    if (auto ok = invoke::callAndHarvest(native, args); !ok)
        return ok.takeError();

    for (const auto &arg : args.arguments())
        os << "  after  " << binder::formatArgument(args, arg) << '\n';
    if (args.returnValue())
        os << "  return " << binder::formatScalar(*args.returnValue()) << '\n';

    if (!os)
        return support::makeError(ErrorKind::IOError, "failed to write verification output", fn.name);
    return {};
}

} // namespace hat::bench

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/HarnessTests.cpp
// Purpose: Exercise benchmark sessions end to end against the test kernels.
// Key invariants: Sessions stop only when both floors are met, rotate through
//                 every replica, and time out into an incomplete result.
// Ownership/Lifetime: Function descriptions outlive each session.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bench/Harness.hpp"
#include "bench/WorkingSet.hpp"
#include "binder/RandomInputs.hpp"
#include "invoke/NativeCall.hpp"
#include "support/diagnostics.hpp"
#include "tests/common/FunctionFixtures.hpp"

#include <cstddef>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using namespace hat;
using namespace hat::test;
using bench::BenchmarkOptions;
using support::ErrorKind;

namespace
{

/// Options for short sessions: no time floor, no warmup, one replica.
BenchmarkOptions quickOptions(int iterations)
{
    BenchmarkOptions options;
    options.minimumIterations = iterations;
    options.minimumTimeInSec = 0.0;
    options.minimumWorkingSetSizeMB = 0.0;
    options.warmupIterations = 0;
    options.batchSize = 5;
    options.seed = 42;
    return options;
}

} // namespace

TEST(WorkingSetTest, ReplicaCountRoundsUp)
{
    constexpr std::size_t MiB = bench::kBytesPerMB;
    EXPECT_EQ(bench::replicaCountFor(4 * MiB, MiB), 4u);
    EXPECT_EQ(bench::replicaCountFor(4 * MiB + 1, MiB), 5u);
    EXPECT_EQ(bench::replicaCountFor(100, MiB), 1u);
    EXPECT_EQ(bench::replicaCountFor(0, MiB), 1u);
    EXPECT_EQ(bench::replicaCountFor(MiB, 0), 1u);
}

TEST(WorkingSetTest, ReplicasHaveDistinctStorage)
{
    const auto fn = touchSpec();
    auto binder = binder::ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);
    binder::RandomInputs inputs(7);

    auto ws = bench::WorkingSet::build(binder.value(), inputs, 3 * bench::kBytesPerMB);
    ASSERT_TRUE(ws);
    EXPECT_EQ(ws.value().replicaCount(), 3u);
    EXPECT_EQ(ws.value().footprint(), 256u * 1024u * sizeof(float));
    EXPECT_GE(ws.value().arena().capacity(), 3 * ws.value().footprint());

    std::set<const void *> addresses;
    for (std::uint64_t i = 0; i < 3; ++i)
        addresses.insert(ws.value().slot(i).bytes("data").data());
    EXPECT_EQ(addresses.size(), 3u);
    EXPECT_EQ(ws.value().slot(3).bytes("data").data(), ws.value().slot(0).bytes("data").data());
}

TEST(WorkingSetTest, MoveAssignmentReleasesPendingBuffersFirst)
{
    released_reset();
    auto fn = rangeSpec("output_dim", "RangePaired");
    fn.outputRelease = "release_buffer";
    binder::BinderOptions binderOptions;
    binderOptions.release = &release_buffer;
    auto binder = binder::ArgumentBinder::create(fn, binderOptions);
    ASSERT_TRUE(binder);
    const auto kernel = native(&RangePaired, &release_buffer);
    binder::RandomInputs inputs(5);

    {
        auto single = bench::WorkingSet::build(binder.value(), inputs, 0);
        ASSERT_TRUE(single);
        ASSERT_EQ(single.value().replicaCount(), 1u);
        auto triple =
            bench::WorkingSet::build(binder.value(), inputs, 3 * single.value().footprint());
        ASSERT_TRUE(triple);
        ASSERT_EQ(triple.value().replicaCount(), 3u);

        ASSERT_TRUE(invoke::callAndHarvest(kernel, single.value().slot(0)));
        for (std::uint64_t i = 0; i < 3; ++i)
            ASSERT_TRUE(invoke::callAndHarvest(kernel, triple.value().slot(i)));
        released_reset();

        single.value() = std::move(triple.value());
        EXPECT_EQ(released_count(), 1u);
        EXPECT_EQ(single.value().replicaCount(), 3u);

        single.value().slot(0).recycle();
        EXPECT_EQ(released_count(), 2u);
        ASSERT_TRUE(invoke::callAndHarvest(kernel, single.value().slot(0)));
    }
    EXPECT_EQ(released_count(), 5u);
    released_reset();
}

TEST(BenchmarkOptionsTest, RejectsOutOfRangeFields)
{
    BenchmarkOptions options;
    EXPECT_TRUE(bench::validateOptions(options));

    options.minimumIterations = 0;
    auto bad = bench::validateOptions(options);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidOption);
    EXPECT_EQ(bad.error().parameter, "minimumIterations");

    options = BenchmarkOptions{};
    options.batchSize = 0;
    EXPECT_EQ(bench::validateOptions(options).error().parameter, "batchSize");

    options = BenchmarkOptions{};
    options.minimumTimeInSec = -1.0;
    EXPECT_EQ(bench::validateOptions(options).error().parameter, "minimumTimeInSec");

    options = BenchmarkOptions{};
    options.dimensionChoices = {128, 0};
    EXPECT_EQ(bench::validateOptions(options).error().parameter, "dimensionChoices");

    options = BenchmarkOptions{};
    options.minimumWorkingSetSizeMB = 1.5;
    EXPECT_EQ(bench::workingSetBytes(options), 3 * bench::kBytesPerMB / 2);
}

TEST(HarnessTest, InvalidOptionsFailBeforeBinding)
{
    auto options = quickOptions(1);
    options.warmupIterations = -1;
    auto result = bench::runBenchmark(sleepSpec(), native(&sleep_1ms), options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidOption);
}

TEST(HarnessTest, NullSymbolIsReported)
{
    auto result = bench::runBenchmark(sleepSpec(), invoke::NativeFunction{}, quickOptions(1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::SymbolNotFound);
    EXPECT_EQ(result.error().function, "sleep_1ms");
}

TEST(HarnessTest, IterationFloorIsMet)
{
    const auto fn = identitySpec();
    auto result = bench::runBenchmark(fn, native(&identity_f32), quickOptions(10));
    ASSERT_TRUE(result);
    EXPECT_GE(result.value().iterations, 10u);
    EXPECT_TRUE(result.value().complete);
    EXPECT_EQ(result.value().functionName, "identity_f32");
    EXPECT_EQ(result.value().replicaCount, 1u);
    EXPECT_GT(result.value().meanDuration, 0.0);
    ASSERT_TRUE(result.value().summary.has_value());
    EXPECT_EQ(result.value().batchMeans.size(), result.value().iterations / 5);
}

TEST(HarnessTest, TimeFloorIsMet)
{
    auto options = quickOptions(1);
    options.minimumTimeInSec = 0.25;
    auto result = bench::runBenchmark(sleepSpec(), native(&sleep_1ms), options);
    ASSERT_TRUE(result);
    EXPECT_GE(result.value().totalSeconds, 0.25);
    // Each call sleeps at least 1 ms, so the floor takes at most 250 calls.
    EXPECT_LE(result.value().iterations, 250u);
    EXPECT_GE(result.value().min, 0.001);
}

TEST(HarnessTest, WorkingSetRotatesThroughReplicas)
{
    touched_reset();
    auto options = quickOptions(8);
    options.minimumWorkingSetSizeMB = 4.0;

    const auto fn = touchSpec();
    auto result = bench::runBenchmark(fn, native(&touch_f32), options);
    ASSERT_TRUE(result);
    EXPECT_GE(result.value().replicaCount, 4u);
    EXPECT_EQ(result.value().footprintBytes, bench::kBytesPerMB);

    ASSERT_EQ(touched_count(), result.value().iterations);
    std::set<const void *> distinct;
    for (std::size_t i = 0; i < touched_count(); ++i)
    {
        distinct.insert(touched_address(i));
        if (i > 0)
            EXPECT_NE(touched_address(i), touched_address(i - 1)) << "call " << i;
    }
    EXPECT_EQ(distinct.size(), result.value().replicaCount);
    touched_reset();
}

TEST(HarnessTest, WarmupCallsAreNotMeasured)
{
    touched_reset();
    auto options = quickOptions(6);
    options.warmupIterations = 3;
    const auto fn = touchSpec();
    auto result = bench::runBenchmark(fn, native(&touch_f32), options);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().warmupIterations, 3u);
    EXPECT_EQ(touched_count(), result.value().iterations + 3);
    touched_reset();
}

TEST(HarnessTest, SessionLimitMarksResultIncomplete)
{
    auto options = quickOptions(1000000);
    options.maximumTimeInSec = 0.05;
    auto result = bench::runBenchmark(sleepSpec(), native(&sleep_1ms), options);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().complete);
    EXPECT_NE(result.value().incompleteReason.find("session limit"), std::string::npos);
    EXPECT_LT(result.value().iterations, 1000000u);
    EXPECT_GT(result.value().iterations, 0u);
}

TEST(HarnessTest, BatchHookSeesGrowingBatchMeans)
{
    std::vector<std::size_t> seen;
    bench::SessionHooks hooks;
    hooks.onBatch = [&](const bench::TimingResult &partial)
    { seen.push_back(partial.batchMeans.size()); };

    bool setupCalled = false;
    hooks.onSetup = [&](const bench::TimingResult &partial)
    {
        setupCalled = true;
        EXPECT_EQ(partial.iterations, 0u);
    };

    const auto fn = identitySpec();
    auto result = bench::runBenchmark(fn, native(&identity_f32), quickOptions(20), hooks);
    ASSERT_TRUE(result);
    EXPECT_TRUE(setupCalled);
    ASSERT_EQ(seen.size(), 4u);
    for (std::size_t i = 0; i < seen.size(); ++i)
        EXPECT_EQ(seen[i], i + 1);
}

TEST(HarnessTest, CalleeAllocatedOutputsAreReleasedEachCall)
{
    auto fn = rangeSpec();
    fn.outputRelease = "free";
    support::DiagnosticEngine diags;
    bench::SessionHooks hooks;
    hooks.diags = &diags;

    auto result = bench::runBenchmark(fn, native(&Range), quickOptions(25), hooks);
    ASSERT_TRUE(result);
    EXPECT_GE(result.value().iterations, 25u);
    EXPECT_EQ(diags.warningCount(), 0u);
}

TEST(HarnessTest, InvalidSchemaFailsBeforeBinding)
{
    auto fn = touchSpec();
    fn.arguments[0].affineOffset = -1;
    auto result = bench::runBenchmark(fn, native(&touch_f32), quickOptions(5));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidSchema);
    EXPECT_EQ(result.error().parameter, "data");
}

TEST(HarnessTest, PairedReleaseFunctionRunsForEveryCall)
{
    released_reset();
    auto fn = rangeSpec("output_dim", "RangePaired");
    fn.outputRelease = "release_buffer";
    auto options = quickOptions(10);
    options.warmupIterations = 2;

    auto result = bench::runBenchmark(fn, native(&RangePaired, &release_buffer), options);
    ASSERT_TRUE(result);
    // Every call's buffer is released, the last one when the working set is destroyed.
    EXPECT_EQ(released_count(), result.value().iterations + 2);
    released_reset();
}

TEST(HarnessTest, UnspecifiedOwnershipWarningReachesHooks)
{
    support::DiagnosticEngine diags;
    bench::SessionHooks hooks;
    hooks.diags = &diags;

    const auto fn = rangeSpec();
    auto result = bench::runBenchmark(fn, native(&Range), quickOptions(3), hooks);
    ASSERT_TRUE(result);
    EXPECT_TRUE(diags.contains(ErrorKind::UnspecifiedOwnership));
    EXPECT_EQ(diags.errorCount(), 0u);
}

TEST(HarnessTest, RejectPolicyStopsTheSession)
{
    auto options = quickOptions(3);
    options.unspecifiedOwnership = binder::OwnershipPolicy::Reject;
    const auto fn = rangeSpec();
    auto result = bench::runBenchmark(fn, native(&Range), options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::UnspecifiedOwnership);
}

TEST(HarnessTest, VerboseProgressGoesToTraceStream)
{
    std::ostringstream trace;
    bench::SessionHooks hooks;
    hooks.trace = &trace;
    auto options = quickOptions(5);
    options.verbose = true;

    const auto fn = identitySpec();
    ASSERT_TRUE(bench::runBenchmark(fn, native(&identity_f32), options, hooks));
    const std::string text = trace.str();
    EXPECT_NE(text.find("[bench] identity_f32: using 1 input sets"), std::string::npos) << text;
    EXPECT_NE(text.find("[bench] identity_f32: warming up for 0 iterations"), std::string::npos);
    EXPECT_NE(text.find("[bench] identity_f32: mean "), std::string::npos);
}

TEST(VerifyFunctionTest, PrintsArgumentsAndReturnValue)
{
    auto fn = function("add_i32",
                       {element("a", ElementType::Int32), element("b", ElementType::Int32)});
    fn.returnValue = returns(ElementType::Int32);

    std::ostringstream os;
    auto options = quickOptions(1);
    ASSERT_TRUE(bench::verifyFunction(fn, native(&add_i32), os, options));
    const std::string text = os.str();
    EXPECT_EQ(text.rfind("add_i32\n", 0), 0u) << text;
    EXPECT_NE(text.find("  before a (input int32): "), std::string::npos);
    EXPECT_NE(text.find("  before b (input int32): "), std::string::npos);
    EXPECT_NE(text.find("  after  a (input int32): "), std::string::npos);
    EXPECT_NE(text.find("  return "), std::string::npos);
}

TEST(VerifyFunctionTest, ShowsHarvestedOutputs)
{
    auto fn = rangeSpec();
    fn.outputRelease = "free";
    std::ostringstream os;
    ASSERT_TRUE(bench::verifyFunction(fn, native(&Range), os, quickOptions(1)));
    const std::string text = os.str();
    EXPECT_NE(text.find("  before output (output int32): <pending>"), std::string::npos) << text;
    EXPECT_NE(text.find("  after  output (output int32["), std::string::npos) << text;
    EXPECT_EQ(text.find("  return "), std::string::npos);
}

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/IsolationTests.cpp
// Purpose: Run benchmark sessions in a forked child and check what the parent
//          reassembles, including after the child crashes.
// Key invariants: A crashing kernel never takes the test process down.
// Ownership/Lifetime: Each test forks and reaps its own child.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "bench/Isolation.hpp"
#include "support/diagnostics.hpp"
#include "tests/common/FunctionFixtures.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace hat;
using namespace hat::test;
using bench::BenchmarkOptions;
using support::ErrorKind;

namespace
{

BenchmarkOptions isolatedOptions(int iterations)
{
    BenchmarkOptions options;
    options.minimumIterations = iterations;
    options.minimumTimeInSec = 0.0;
    options.minimumWorkingSetSizeMB = 0.0;
    options.warmupIterations = 1;
    options.batchSize = 5;
    options.seed = 11;
    return options;
}

} // namespace

TEST(IsolationTest, CompletedChildReportsFullResult)
{
    std::vector<std::size_t> batches;
    bench::SessionHooks hooks;
    hooks.onBatch = [&](const bench::TimingResult &partial)
    { batches.push_back(partial.batchMeans.size()); };

    const auto fn = identitySpec();
    auto result = bench::runIsolated(fn, native(&identity_f32), isolatedOptions(20), hooks);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().complete) << result.value().incompleteReason;
    EXPECT_EQ(result.value().functionName, "identity_f32");
    EXPECT_EQ(result.value().iterations, 20u);
    EXPECT_EQ(result.value().warmupIterations, 1u);
    EXPECT_EQ(result.value().replicaCount, 1u);
    EXPECT_EQ(result.value().batchMeans.size(), 4u);
    ASSERT_TRUE(result.value().summary.has_value());
    EXPECT_GT(result.value().meanDuration, 0.0);
    EXPECT_EQ(batches, (std::vector<std::size_t>{1, 2, 3, 4}));
}

TEST(IsolationTest, SetupIsReportedBeforeBatches)
{
    std::vector<std::string> events;
    std::uint64_t setupIterations = 1;
    std::size_t setupReplicas = 0;
    bench::SessionHooks hooks;
    hooks.onSetup = [&](const bench::TimingResult &partial)
    {
        events.push_back("setup");
        setupIterations = partial.iterations;
        setupReplicas = partial.replicaCount;
    };
    hooks.onBatch = [&](const bench::TimingResult &) { events.push_back("batch"); };

    const auto fn = identitySpec();
    auto result = bench::runIsolated(fn, native(&identity_f32), isolatedOptions(10), hooks);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().complete) << result.value().incompleteReason;
    EXPECT_EQ(events, (std::vector<std::string>{"setup", "batch", "batch"}));
    EXPECT_EQ(setupIterations, 0u);
    EXPECT_EQ(setupReplicas, 1u);
}

TEST(IsolationTest, CrashingKernelYieldsIncompleteResult)
{
    const auto fn = function("crash_now", {});
    auto result = bench::runIsolated(fn, native(&crash_now), isolatedOptions(10));
    ASSERT_TRUE(result);
    EXPECT_FALSE(result.value().complete);
    EXPECT_NE(result.value().incompleteReason.find("signal"), std::string::npos)
        << result.value().incompleteReason;
    EXPECT_NE(result.value().incompleteReason.find("after 0 calls"), std::string::npos)
        << result.value().incompleteReason;
    EXPECT_EQ(result.value().iterations, 0u);
    EXPECT_FALSE(result.value().summary.has_value());
}

TEST(IsolationTest, ChildWarningsAreForwarded)
{
    support::DiagnosticEngine diags;
    bench::SessionHooks hooks;
    hooks.diags = &diags;

    const auto fn = rangeSpec();
    auto result = bench::runIsolated(fn, native(&Range), isolatedOptions(5), hooks);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result.value().complete);
    ASSERT_EQ(diags.diagnostics().size(), 1u);
    const auto &warning = diags.diagnostics().front();
    EXPECT_EQ(warning.kind, ErrorKind::UnspecifiedOwnership);
    EXPECT_EQ(warning.severity, support::Severity::Warning);
    EXPECT_EQ(warning.function, "Range");
    EXPECT_EQ(warning.parameter, "output");
}

TEST(IsolationTest, ChildErrorIsReturned)
{
    auto options = isolatedOptions(5);
    options.unspecifiedOwnership = binder::OwnershipPolicy::Reject;
    const auto fn = rangeSpec();
    auto result = bench::runIsolated(fn, native(&Range), options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::UnspecifiedOwnership);
    EXPECT_EQ(result.error().function, "Range");
    EXPECT_EQ(result.error().parameter, "output");
}

TEST(IsolationTest, InvalidOptionsFailWithoutForking)
{
    auto options = isolatedOptions(0);
    auto result = bench::runIsolated(sleepSpec(), native(&sleep_1ms), options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind, ErrorKind::InvalidOption);
}

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/RandomInputsTests.cpp
// Purpose: Check the value ranges and determinism of generated inputs.
// Key invariants: Floats lie in [0, 1); dimensions come from the configured
//                 choices; other integers are small and non-negative.
// Ownership/Lifetime: Each test owns its generator and bound sets.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "binder/ArgumentBinder.hpp"
#include "binder/RandomInputs.hpp"
#include "tests/common/FunctionFixtures.hpp"

#include <algorithm>
#include <cstdint>
#include <vector>

using namespace hat;
using namespace hat::test;
using binder::ArgumentBinder;
using binder::RandomInputs;

TEST(RandomInputsTest, DimensionsComeFromChoices)
{
    const auto fn = identitySpec();
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);

    RandomInputs inputs(1234);
    for (int i = 0; i < 20; ++i)
    {
        auto args = binder.value().bind(inputs);
        ASSERT_TRUE(args);
        const long long n = args.value().inputEnvironment().at("n");
        EXPECT_TRUE(n == 128 || n == 256 || n == 1234) << n;

        const auto data = args.value().view<float>("data");
        ASSERT_EQ(data.size(), static_cast<std::size_t>(n));
        for (const float x : data)
        {
            ASSERT_GE(x, 0.0f);
            ASSERT_LT(x, 1.0f);
        }
    }
}

TEST(RandomInputsTest, CustomDimensionChoices)
{
    const auto fn = unsqueezeSpec();
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);

    RandomInputs inputs(99, {3});
    auto args = binder.value().bind(inputs);
    ASSERT_TRUE(args);
    EXPECT_EQ(args.value().inputEnvironment().at("output_dim0"), 3);
    const auto data = args.value().view<std::int64_t>("data");
    ASSERT_EQ(data.size(), 3u);
    for (const auto v : data)
    {
        EXPECT_GE(v, 0);
        EXPECT_LT(v, RandomInputs::kIntegerBound);
    }
}

TEST(RandomInputsTest, NonDimensionIntegersStaySmall)
{
    const auto fn = rangeSpec();
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);

    RandomInputs inputs(5);
    for (int i = 0; i < 50; ++i)
    {
        auto args = binder.value().bind(inputs);
        ASSERT_TRUE(args);
        for (const char *name : {"start", "limit", "delta"})
        {
            const long long v = args.value().inputEnvironment().at(name);
            EXPECT_GE(v, 0);
            EXPECT_LT(v, RandomInputs::kIntegerBound);
        }
    }
}

TEST(RandomInputsTest, SameSeedSameData)
{
    const auto fn = identitySpec();
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);

    RandomInputs first(77);
    RandomInputs second(77);
    auto a = binder.value().bind(first);
    auto b = binder.value().bind(second);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    const auto x = a.value().view<float>("data");
    const auto y = b.value().view<float>("data");
    ASSERT_EQ(x.size(), y.size());
    EXPECT_TRUE(std::equal(x.begin(), x.end(), y.begin()));
}

TEST(RandomInputsTest, NarrowFloatsStayBelowOne)
{
    const auto fn = function("halves", {affine("h", ElementType::BFloat16, {4096})});
    auto binder = ArgumentBinder::create(fn);
    ASSERT_TRUE(binder);

    RandomInputs inputs(3);
    auto args = binder.value().bind(inputs);
    ASSERT_TRUE(args);
    for (const std::uint16_t bits : args.value().view<std::uint16_t>("h"))
    {
        const float x = binder::bfloat16ToFloat(bits);
        ASSERT_GE(x, 0.0f);
        ASSERT_LT(x, 1.0f);
    }
}

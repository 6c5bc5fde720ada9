//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/ElementCodecTests.cpp
// Purpose: Check scalar encoding, register widening and 16-bit float codecs.
// Key invariants: Narrow integers widen by signedness; half and bfloat16
//                 round-trip exactly representable values.
// Ownership/Lifetime: Pure value tests.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "binder/ElementCodec.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>

using namespace hat;
using binder::ScalarValue;
using schema::ElementType;

TEST(ElementCodecTest, IntegersTruncateToWidth)
{
    const auto v = ScalarValue::fromInteger(ElementType::UInt8, 300);
    EXPECT_EQ(v.bits, 44u);
    EXPECT_EQ(v.toInteger(), 44);

    const auto n = ScalarValue::fromInteger(ElementType::Int16, -2);
    EXPECT_EQ(n.bits, 0xFFFEu);
    EXPECT_EQ(n.toInteger(), -2);
}

TEST(ElementCodecTest, RegisterWordsWidenBySignedness)
{
    EXPECT_EQ(ScalarValue::fromInteger(ElementType::Int32, -1).registerWord(),
              std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(ScalarValue::fromInteger(ElementType::UInt32, 0xFFFFFFFFLL).registerWord(),
              0xFFFFFFFFull);
    EXPECT_EQ(ScalarValue::fromInteger(ElementType::Int8, 100).registerWord(), 100u);
}

TEST(ElementCodecTest, RealsKeepTheirBitImage)
{
    const auto f = ScalarValue::fromReal(ElementType::Float32, 1.5);
    EXPECT_EQ(f.bits, 0x3FC00000u);
    EXPECT_DOUBLE_EQ(f.toReal(), 1.5);

    const auto d = ScalarValue::fromReal(ElementType::Float64, -0.25);
    EXPECT_DOUBLE_EQ(d.toReal(), -0.25);
    EXPECT_EQ(d.toInteger(), 0);

    const auto i = ScalarValue::fromReal(ElementType::Int32, 7.9);
    EXPECT_EQ(i.toInteger(), 7);
}

TEST(ElementCodecTest, HalfPrecisionRoundTrips)
{
    for (const float value : {0.0f, 1.0f, -2.5f, 0.099975586f, 65504.0f})
        EXPECT_FLOAT_EQ(binder::halfToFloat(binder::floatToHalf(value)), value) << value;

    EXPECT_EQ(binder::floatToHalf(1.0f), 0x3C00u);
    EXPECT_EQ(binder::floatToHalf(1e6f), 0x7C00u);
    EXPECT_TRUE(std::isnan(binder::halfToFloat(binder::floatToHalf(std::nanf("")))));
    // Smallest subnormal half.
    EXPECT_FLOAT_EQ(binder::halfToFloat(0x0001u), std::ldexp(1.0f, -24));
}

TEST(ElementCodecTest, BFloat16RoundsToNearestEven)
{
    EXPECT_EQ(binder::floatToBFloat16(1.0f), 0x3F80u);
    EXPECT_FLOAT_EQ(binder::bfloat16ToFloat(0x3F80u), 1.0f);
    // 1 + 2^-8 is halfway between 1 and 1 + 2^-7 and rounds to the even 1.
    EXPECT_EQ(binder::floatToBFloat16(1.0f + std::ldexp(1.0f, -8)), 0x3F80u);
    // 1 + 3 * 2^-8 rounds up to the even 1 + 2^-6.
    EXPECT_EQ(binder::floatToBFloat16(1.0f + 3 * std::ldexp(1.0f, -8)), 0x3F82u);
}

TEST(ElementCodecTest, StoresAndLoadsElements)
{
    std::array<std::byte, 8> buffer{};
    binder::storeBits(buffer.data(), ElementType::Int16, 0xABCDu);
    EXPECT_EQ(binder::loadBits(buffer.data(), ElementType::Int16), 0xABCDu);
    EXPECT_EQ(buffer[2], std::byte{0});

    const auto scalar = binder::loadScalar(buffer.data(), ElementType::UInt16);
    EXPECT_EQ(scalar.toInteger(), 0xABCD);
    EXPECT_EQ(binder::formatScalar(scalar), "43981");
    EXPECT_EQ(binder::formatScalar(ScalarValue::fromInteger(ElementType::Int64, -5)), "-5");
}

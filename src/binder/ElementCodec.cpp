//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/ElementCodec.cpp
// Purpose: Implement element encoding, including the 16-bit float formats.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Element encoding helpers.
/// @details Buffers handed to native code hold raw element images, so every
///          conversion goes through memcpy of the exact width.  The 16-bit
///          float formats are converted in software; hosts without F16C still
///          produce the same bit patterns.

#include "binder/ElementCodec.hpp"

#include "common/IntegerHelpers.hpp"

#include <cstring>
#include <sstream>

namespace hat::binder
{

using schema::ElementType;

namespace
{

namespace integer = common::integer;

int widthInBits(ElementType type)
{
    return static_cast<int>(schema::elementSize(type) * 8);
}

integer::Signedness signednessOf(ElementType type)
{
    return schema::elementInfo(type).isSigned ? integer::Signedness::Signed
                                              : integer::Signedness::Unsigned;
}

std::uint64_t encodeReal(ElementType type, double value)
{
    std::uint64_t bits = 0;
    switch (type)
    {
        case ElementType::Float16:
            bits = floatToHalf(static_cast<float>(value));
            break;
        case ElementType::BFloat16:
            bits = floatToBFloat16(static_cast<float>(value));
            break;
        case ElementType::Float32:
        {
            const float f = static_cast<float>(value);
            std::uint32_t u = 0;
            std::memcpy(&u, &f, sizeof(f));
            bits = u;
            break;
        }
        case ElementType::Float64:
            std::memcpy(&bits, &value, sizeof(value));
            break;
        default:
            break;
    }
    return bits;
}

double decodeReal(ElementType type, std::uint64_t bits)
{
    switch (type)
    {
        case ElementType::Float16:
            return halfToFloat(static_cast<std::uint16_t>(bits));
        case ElementType::BFloat16:
            return bfloat16ToFloat(static_cast<std::uint16_t>(bits));
        case ElementType::Float32:
        {
            const auto u = static_cast<std::uint32_t>(bits);
            float f = 0.0f;
            std::memcpy(&f, &u, sizeof(f));
            return f;
        }
        case ElementType::Float64:
        {
            double d = 0.0;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }
        default:
            return 0.0;
    }
}

} // namespace

ScalarValue ScalarValue::fromInteger(ElementType type, long long value) noexcept
{
    if (!schema::isInteger(type))
        return fromReal(type, static_cast<double>(value));
    const auto raw = static_cast<std::uint64_t>(value);
    return {type, raw & integer::detail::mask_for(widthInBits(type))};
}

ScalarValue ScalarValue::fromReal(ElementType type, double value) noexcept
{
    if (schema::isInteger(type))
        return fromInteger(type, static_cast<long long>(value));
    return {type, encodeReal(type, value)};
}

long long ScalarValue::toInteger() const noexcept
{
    if (!schema::isInteger(type))
        return static_cast<long long>(toReal());
    return static_cast<long long>(integer::widen_to(bits, widthInBits(type), signednessOf(type)));
}

double ScalarValue::toReal() const noexcept
{
    if (schema::isInteger(type))
    {
        if (type == ElementType::UInt64)
            return static_cast<double>(bits);
        return static_cast<double>(toInteger());
    }
    return decodeReal(type, bits);
}

/// @brief Bits as passed in a 64-bit argument register.
/// @details Integers narrower than a register are extended according to
///          their signedness, which is what the SysV and Win64 ABIs let the
///          callee assume after promotion.
std::uint64_t ScalarValue::registerWord() const noexcept
{
    if (!schema::isInteger(type))
        return bits;
    return integer::widen_to(bits, widthInBits(type), signednessOf(type));
}

/// @brief IEEE binary16 encoding of @p value.
/// @details Mantissa bits beyond the tenth are truncated.  Values too small
///          for a normal half flush to signed zero and values too large become
///          infinity; NaN inputs stay NaN.
std::uint16_t floatToHalf(float value) noexcept
{
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(float));

    const std::uint32_t sign = (bits >> 16) & 0x8000u;
    const std::uint32_t rawExponent = (bits >> 23) & 0xFFu;
    const std::uint32_t mantissa = bits & 0x7FFFFFu;

    if (rawExponent == 0xFFu)
        return static_cast<std::uint16_t>(sign | 0x7C00u | (mantissa ? 0x200u : 0u));

    const std::int32_t exponent = static_cast<std::int32_t>(rawExponent) - 127 + 15;
    if (exponent <= 0)
        return static_cast<std::uint16_t>(sign);
    if (exponent >= 31)
        return static_cast<std::uint16_t>(sign | 0x7C00u);

    return static_cast<std::uint16_t>(sign | (static_cast<std::uint32_t>(exponent) << 10) |
                                      (mantissa >> 13));
}

float halfToFloat(std::uint16_t half) noexcept
{
    const std::uint32_t sign = static_cast<std::uint32_t>(half & 0x8000u) << 16;
    std::uint32_t exponent = (half >> 10) & 0x1Fu;
    std::uint32_t mantissa = half & 0x3FFu;

    std::uint32_t bits = 0;
    if (exponent == 0)
    {
        if (mantissa == 0)
        {
            bits = sign;
        }
        else
        {
            // Subnormal: renormalise into the float exponent range.
            std::int32_t e = 1;
            while ((mantissa & 0x400u) == 0)
            {
                mantissa <<= 1;
                --e;
            }
            mantissa &= 0x3FFu;
            bits = sign | (static_cast<std::uint32_t>(e + (127 - 15)) << 23) | (mantissa << 13);
        }
    }
    else if (exponent == 31)
    {
        bits = sign | 0x7F800000u | (mantissa << 13);
    }
    else
    {
        bits = sign | ((exponent + (127 - 15)) << 23) | (mantissa << 13);
    }

    float result = 0.0f;
    std::memcpy(&result, &bits, sizeof(float));
    return result;
}

std::uint16_t floatToBFloat16(float value) noexcept
{
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(float));
    if ((bits & 0x7F800000u) == 0x7F800000u && (bits & 0x7FFFFFu) != 0)
        return static_cast<std::uint16_t>((bits >> 16) | 0x40u);
    const std::uint32_t rounding = 0x7FFFu + ((bits >> 16) & 1u);
    return static_cast<std::uint16_t>((bits + rounding) >> 16);
}

float bfloat16ToFloat(std::uint16_t bits) noexcept
{
    const std::uint32_t wide = static_cast<std::uint32_t>(bits) << 16;
    float result = 0.0f;
    std::memcpy(&result, &wide, sizeof(float));
    return result;
}

void storeBits(std::byte *dst, ElementType type, std::uint64_t bits) noexcept
{
    // Little-endian hosts only: the low bytes of the word are the element.
    std::memcpy(dst, &bits, schema::elementSize(type));
}

std::uint64_t loadBits(const std::byte *src, ElementType type) noexcept
{
    std::uint64_t bits = 0;
    std::memcpy(&bits, src, schema::elementSize(type));
    return bits;
}

ScalarValue loadScalar(const std::byte *src, ElementType type) noexcept
{
    return {type, loadBits(src, type)};
}

std::string formatScalar(const ScalarValue &value)
{
    if (schema::isInteger(value.type))
    {
        if (value.type == ElementType::UInt64)
            return std::to_string(value.bits);
        return std::to_string(value.toInteger());
    }
    std::ostringstream os;
    os << value.toReal();
    return os.str();
}

} // namespace hat::binder

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/common/IntegerHelpers.hpp
// Purpose: Provide reusable helpers for fixed-width integer arithmetic used by
//          shape resolution and argument marshalling.
// Key invariants: Helper functions never trigger undefined behaviour when
//                 operating on signed integers; overflow is reported, not wrapped.
// Ownership/Lifetime: Header-only utilities with no dynamic ownership.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

namespace hat::common::integer
{

using Value = long long;

/// @brief Indicates how sign-extension should be applied when widening values.
enum class Signedness
{
    Signed,
    Unsigned,
};

namespace detail
{

[[nodiscard]] inline std::uint64_t mask_for(int bits) noexcept
{
    if (bits <= 0)
    {
        return 0;
    }
    if (bits >= 64)
    {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return (std::uint64_t{1} << static_cast<unsigned>(bits)) - 1U;
}

} // namespace detail

/// @brief Widen the low @p bits of @p value to 64 bits using @p signedness.
/// @details Native scalars narrower than a register are passed in a full
///          64-bit word; this produces the sign- or zero-extended image the
///          callee expects.
[[nodiscard]] inline std::uint64_t widen_to(std::uint64_t value,
                                            int bits,
                                            Signedness signedness) noexcept
{
    if (bits >= 64)
    {
        return value;
    }

    const std::uint64_t mask = detail::mask_for(bits);
    const std::uint64_t truncated = value & mask;
    if (signedness == Signedness::Unsigned || bits <= 0)
    {
        return truncated;
    }
    const std::uint64_t signBit = std::uint64_t{1} << static_cast<unsigned>(bits - 1);
    if ((truncated & signBit) == 0)
    {
        return truncated;
    }
    return truncated | (detail::mask_for(64) ^ mask);
}

/// @brief Checked addition; empty when the result overflows.
[[nodiscard]] inline std::optional<Value> checkedAdd(Value a, Value b) noexcept
{
    Value result{};
    if (__builtin_add_overflow(a, b, &result))
        return std::nullopt;
    return result;
}

/// @brief Checked subtraction; empty when the result overflows.
[[nodiscard]] inline std::optional<Value> checkedSub(Value a, Value b) noexcept
{
    Value result{};
    if (__builtin_sub_overflow(a, b, &result))
        return std::nullopt;
    return result;
}

/// @brief Checked multiplication; empty when the result overflows.
[[nodiscard]] inline std::optional<Value> checkedMul(Value a, Value b) noexcept
{
    Value result{};
    if (__builtin_mul_overflow(a, b, &result))
        return std::nullopt;
    return result;
}

/// @brief Checked truncating division; empty on division by zero or INT64_MIN / -1.
[[nodiscard]] inline std::optional<Value> checkedDiv(Value a, Value b) noexcept
{
    if (b == 0)
        return std::nullopt;
    if (a == std::numeric_limits<Value>::min() && b == -1)
        return std::nullopt;
    return a / b;
}

/// @brief Checked unsigned multiplication for byte-size computations.
[[nodiscard]] inline std::optional<std::size_t> checkedMulSize(std::size_t a,
                                                               std::size_t b) noexcept
{
    std::size_t result{};
    if (__builtin_mul_overflow(a, b, &result))
        return std::nullopt;
    return result;
}

} // namespace hat::common::integer

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/ElementCodec.hpp
// Purpose: Read and write individual elements of every ElementType, and carry
//          typed scalar values as raw bit images.
// Key invariants: A ScalarValue's significant bits are the low
//                 elementSize(type) bytes; the rest are zero.
// Ownership/Lifetime: Operates on caller-owned memory.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/ElementType.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace hat::binder
{

/// @brief One typed scalar, stored as its native bit image.
struct ScalarValue
{
    schema::ElementType type = schema::ElementType::Int64;
    std::uint64_t bits = 0;

    /// @brief Encode integer @p value as @p type, truncating to its width.
    static ScalarValue fromInteger(schema::ElementType type, long long value) noexcept;

    /// @brief Encode @p value as @p type, converting to integers by truncation.
    static ScalarValue fromReal(schema::ElementType type, double value) noexcept;

    /// @brief Sign- or zero-extended integer view; floats are truncated.
    [[nodiscard]] long long toInteger() const noexcept;

    /// @brief Floating view of the value.
    [[nodiscard]] double toReal() const noexcept;

    /// @brief Bits as passed in a 64-bit argument register.
    [[nodiscard]] std::uint64_t registerWord() const noexcept;
};

/// @brief IEEE binary16 encoding of @p value; underflow flushes to zero.
[[nodiscard]] std::uint16_t floatToHalf(float value) noexcept;

/// @brief Decode an IEEE binary16 bit pattern.
[[nodiscard]] float halfToFloat(std::uint16_t half) noexcept;

/// @brief bfloat16 encoding of @p value with round-to-nearest-even.
[[nodiscard]] std::uint16_t floatToBFloat16(float value) noexcept;

/// @brief Decode a bfloat16 bit pattern.
[[nodiscard]] float bfloat16ToFloat(std::uint16_t bits) noexcept;

/// @brief Copy the low elementSize(@p type) bytes of @p bits to @p dst.
void storeBits(std::byte *dst, schema::ElementType type, std::uint64_t bits) noexcept;

/// @brief Read one element's bit image from @p src.
[[nodiscard]] std::uint64_t loadBits(const std::byte *src, schema::ElementType type) noexcept;

/// @brief Read element @p src as a ScalarValue.
[[nodiscard]] ScalarValue loadScalar(const std::byte *src, schema::ElementType type) noexcept;

/// @brief Render a scalar for diagnostics and verification output.
[[nodiscard]] std::string formatScalar(const ScalarValue &value);

} // namespace hat::binder

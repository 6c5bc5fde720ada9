//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/ElementType.hpp
// Purpose: Declares the primitive numeric element kinds a parameter may carry.
// Key invariants: Every kind has a fixed byte size of 1, 2, 4 or 8.
// Ownership/Lifetime: Value types only; the info table has static storage.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace hat::schema
{

/// @brief Primitive numeric kinds understood by the binder.
enum class ElementType
{
    Int8,
    Int16,
    Int32,
    Int64,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Float16,
    BFloat16,
    Float32,
    Float64,
};

/// @brief Static properties of an element kind.
struct ElementInfo
{
    std::string_view name;  ///< Schema spelling, e.g. "int32".
    std::string_view cName; ///< C spelling, e.g. "int32_t".
    std::size_t size;       ///< Size in bytes.
    bool isSigned;          ///< Two's-complement or IEEE sign bit present.
    bool isFloat;           ///< Floating-point encoding.
};

/// @brief Look up the static properties of @p type.
[[nodiscard]] const ElementInfo &elementInfo(ElementType type) noexcept;

/// @brief Byte size of one element of @p type.
[[nodiscard]] inline std::size_t elementSize(ElementType type) noexcept
{
    return elementInfo(type).size;
}

/// @brief True for the integer kinds, signed or unsigned.
[[nodiscard]] inline bool isInteger(ElementType type) noexcept
{
    return !elementInfo(type).isFloat;
}

/// @brief Schema spelling of @p type.
[[nodiscard]] std::string_view toString(ElementType type) noexcept;

/// @brief Parse either the schema spelling or the C spelling of an element kind.
/// @return Matching kind, or empty when @p text names no known kind.
[[nodiscard]] std::optional<ElementType> parseElementType(std::string_view text) noexcept;

} // namespace hat::schema

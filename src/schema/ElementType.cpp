//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/ElementType.cpp
// Purpose: Implement the element kind table and its name parser.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Table-driven description of the primitive numeric element kinds.
/// @details Package metadata spells element kinds either the way the schema
///          does ("float32") or the way the generated C header does
///          ("float"), so the table stores both and the parser accepts
///          either.

#include "schema/ElementType.hpp"

#include <array>

namespace hat::schema
{
namespace
{

constexpr std::array<ElementInfo, 12> kElementTable = {{
    {"int8", "int8_t", 1, true, false},
    {"int16", "int16_t", 2, true, false},
    {"int32", "int32_t", 4, true, false},
    {"int64", "int64_t", 8, true, false},
    {"uint8", "uint8_t", 1, false, false},
    {"uint16", "uint16_t", 2, false, false},
    {"uint32", "uint32_t", 4, false, false},
    {"uint64", "uint64_t", 8, false, false},
    {"float16", "float16_t", 2, true, true},
    {"bfloat16", "bfloat16_t", 2, true, true},
    {"float32", "float", 4, true, true},
    {"float64", "double", 8, true, true},
}};

constexpr std::array<ElementType, 12> kElementOrder = {
    ElementType::Int8,    ElementType::Int16,    ElementType::Int32,   ElementType::Int64,
    ElementType::UInt8,   ElementType::UInt16,   ElementType::UInt32,  ElementType::UInt64,
    ElementType::Float16, ElementType::BFloat16, ElementType::Float32, ElementType::Float64,
};

} // namespace

/// @brief Look up the static properties of @p type.
/// @details The table is indexed by the enumerator value; the enum is dense
///          and declared in table order.
const ElementInfo &elementInfo(ElementType type) noexcept
{
    return kElementTable[static_cast<std::size_t>(type)];
}

std::string_view toString(ElementType type) noexcept
{
    return elementInfo(type).name;
}

/// @brief Parse an element kind name.
/// @details Accepts the schema spelling, the C spelling, and the legacy
///          "float32_t"/"float64_t" aliases some generators emit.
/// @param text Name to parse; matched case-sensitively.
/// @return Matching kind or std::nullopt.
std::optional<ElementType> parseElementType(std::string_view text) noexcept
{
    for (std::size_t i = 0; i < kElementTable.size(); ++i)
    {
        if (kElementTable[i].name == text || kElementTable[i].cName == text)
            return kElementOrder[i];
    }
    if (text == "float32_t")
        return ElementType::Float32;
    if (text == "float64_t")
        return ElementType::Float64;
    return std::nullopt;
}

} // namespace hat::schema

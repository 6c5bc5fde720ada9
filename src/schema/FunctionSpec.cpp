//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/FunctionSpec.cpp
// Purpose: Helpers deriving call-level facts from parameter records and the
//          textual spellings used by package metadata.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements passing-mode derivation and enum spellings for schema
///        records.

#include "schema/FunctionSpec.hpp"

namespace hat::schema
{

/// @brief Derive the native argument form for @p param.
/// @details Arrays are always passed as a base pointer except callee-allocated
///          outputs, which receive the address of a pointer slot.  Element
///          inputs travel by value; element outputs need somewhere to write.
/// @param param Parameter to classify.
/// @return Native argument form.
PassingMode passingMode(const ParameterSpec &param) noexcept
{
    switch (param.logicalType)
    {
        case LogicalType::AffineArray:
            return PassingMode::BufferPointer;
        case LogicalType::RuntimeArray:
            return param.usage == Usage::Output ? PassingMode::OutputPointer
                                                : PassingMode::BufferPointer;
        case LogicalType::Element:
            return param.usage == Usage::Input ? PassingMode::ByValue
                                               : PassingMode::ElementPointer;
        case LogicalType::Void:
            return PassingMode::None;
    }
    return PassingMode::None;
}

bool isCalleeAllocated(const ParameterSpec &param) noexcept
{
    return passingMode(param) == PassingMode::OutputPointer;
}

/// @brief Row-major strides for @p shape.
/// @details Computed right to left; a zero extent contributes a factor of one
///          so strides stay meaningful for empty arrays.
std::vector<std::int64_t> rowMajorStrides(const std::vector<std::int64_t> &shape)
{
    std::vector<std::int64_t> strides(shape.size(), 1);
    std::int64_t running = 1;
    for (std::size_t i = shape.size(); i-- > 0;)
    {
        strides[i] = running;
        running *= shape[i] > 0 ? shape[i] : 1;
    }
    return strides;
}

std::vector<std::int64_t> effectiveStrides(const ParameterSpec &param)
{
    if (!param.affineMap.empty())
        return param.affineMap;
    return rowMajorStrides(param.shape);
}

std::optional<std::size_t> findArgument(const FunctionSpec &fn, std::string_view name) noexcept
{
    for (std::size_t i = 0; i < fn.arguments.size(); ++i)
    {
        if (fn.arguments[i].name == name)
            return i;
    }
    return std::nullopt;
}

std::string_view toString(LogicalType type) noexcept
{
    switch (type)
    {
        case LogicalType::AffineArray:
            return "affine_array";
        case LogicalType::RuntimeArray:
            return "runtime_array";
        case LogicalType::Element:
            return "element";
        case LogicalType::Void:
            return "void";
    }
    return "";
}

std::string_view toString(Usage usage) noexcept
{
    switch (usage)
    {
        case Usage::Input:
            return "input";
        case Usage::Output:
            return "output";
        case Usage::InputOutput:
            return "input_output";
    }
    return "";
}

std::string_view toString(CallingConvention cc) noexcept
{
    switch (cc)
    {
        case CallingConvention::StdCall:
            return "stdcall";
        case CallingConvention::CDecl:
            return "cdecl";
        case CallingConvention::FastCall:
            return "fastcall";
        case CallingConvention::VectorCall:
            return "vectorcall";
        case CallingConvention::DeviceCall:
            return "devicecall";
    }
    return "";
}

std::optional<LogicalType> parseLogicalType(std::string_view text) noexcept
{
    for (auto type : {LogicalType::AffineArray,
                      LogicalType::RuntimeArray,
                      LogicalType::Element,
                      LogicalType::Void})
    {
        if (toString(type) == text)
            return type;
    }
    return std::nullopt;
}

std::optional<Usage> parseUsage(std::string_view text) noexcept
{
    for (auto usage : {Usage::Input, Usage::Output, Usage::InputOutput})
    {
        if (toString(usage) == text)
            return usage;
    }
    return std::nullopt;
}

std::optional<CallingConvention> parseCallingConvention(std::string_view text) noexcept
{
    for (auto cc : {CallingConvention::StdCall,
                    CallingConvention::CDecl,
                    CallingConvention::FastCall,
                    CallingConvention::VectorCall,
                    CallingConvention::DeviceCall})
    {
        if (toString(cc) == text)
            return cc;
    }
    return std::nullopt;
}

} // namespace hat::schema

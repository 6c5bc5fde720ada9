//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/FunctionSpec.hpp
// Purpose: Declares the in-memory records describing one packaged native
//          function: its parameters, return value and calling convention.
// Key invariants: Records are built once from parsed package metadata and are
//                 treated as immutable while sessions use them.
// Ownership/Lifetime: Plain values; a FunctionSpec owns its ParameterSpecs.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/ElementType.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hat::schema
{

/// @brief How a parameter's storage is described.
enum class LogicalType
{
    AffineArray,  ///< Fixed shape with stride map and base offset.
    RuntimeArray, ///< Length given by a size expression.
    Element,      ///< Single scalar value.
    Void,         ///< No storage; only valid as a return value.
};

/// @brief Direction of data flow through a parameter.
enum class Usage
{
    Input,
    Output,
    InputOutput,
};

/// @brief Declared native calling convention.
enum class CallingConvention
{
    StdCall,
    CDecl,
    FastCall,
    VectorCall,
    DeviceCall,
};

/// @brief Native argument form implied by a parameter's logical type and usage.
enum class PassingMode
{
    BufferPointer,  ///< T* to caller-owned storage.
    OutputPointer,  ///< T** slot the callee fills with a buffer it allocated.
    ByValue,        ///< Scalar passed in a register.
    ElementPointer, ///< T* to a one-element buffer.
    None,           ///< No native argument.
};

/// @brief One declared argument or return value.
struct ParameterSpec
{
    /// Parameter name; unique within the owning function's argument list.
    std::string name;

    /// Free-text description carried from the package; never interpreted.
    std::string description = {};

    LogicalType logicalType = LogicalType::Element;
    ElementType elementType = ElementType::Float32;
    Usage usage = Usage::Input;

    /// Extent per dimension; affine arrays only. Empty means unshaped.
    std::vector<std::int64_t> shape = {};

    /// Element strides per dimension; empty means C-contiguous.
    std::vector<std::int64_t> affineMap = {};

    /// Element offset of the first datum; unset means 0.
    std::optional<std::int64_t> affineOffset = std::nullopt;

    /// Arithmetic formula giving a runtime array's element count.
    std::string sizeExpression = {};
};

/// @brief One native function exported by a package.
struct FunctionSpec
{
    /// Symbol name; unique within the package.
    std::string name;

    std::string description = {};

    CallingConvention callingConvention = CallingConvention::CDecl;

    /// Arguments in native call order.
    std::vector<ParameterSpec> arguments = {};

    /// Return value; LogicalType::Void when the function returns nothing.
    ParameterSpec returnValue = {"", "", LogicalType::Void};

    /// Release convention for callee-allocated outputs: "free" for the C
    /// runtime, any other name for a `void name(void*)` exported by the same
    /// package, empty when the package does not declare one.
    std::optional<std::string> outputRelease = std::nullopt;

    /// Package-level key/value metadata; the harness records timings here.
    std::map<std::string, std::string> auxiliary = {};
};

/// @brief Release name meaning the C runtime allocator.
inline constexpr std::string_view kReleaseWithFree = "free";

/// @brief Derive the native argument form for @p param.
[[nodiscard]] PassingMode passingMode(const ParameterSpec &param) noexcept;

/// @brief True for output runtime arrays, whose buffer the callee allocates.
[[nodiscard]] bool isCalleeAllocated(const ParameterSpec &param) noexcept;

/// @brief Row-major strides for @p shape; the last dimension has stride 1.
[[nodiscard]] std::vector<std::int64_t> rowMajorStrides(const std::vector<std::int64_t> &shape);

/// @brief Effective stride map: the declared map, or row-major when absent.
[[nodiscard]] std::vector<std::int64_t> effectiveStrides(const ParameterSpec &param);

/// @brief Find an argument by name.
/// @return Index into FunctionSpec::arguments, or empty.
[[nodiscard]] std::optional<std::size_t> findArgument(const FunctionSpec &fn,
                                                      std::string_view name) noexcept;

[[nodiscard]] std::string_view toString(LogicalType type) noexcept;
[[nodiscard]] std::string_view toString(Usage usage) noexcept;
[[nodiscard]] std::string_view toString(CallingConvention cc) noexcept;

/// @brief Parse package spellings ("affine_array", "runtime_array", ...).
[[nodiscard]] std::optional<LogicalType> parseLogicalType(std::string_view text) noexcept;

/// @brief Parse package spellings ("input", "output", "input_output").
[[nodiscard]] std::optional<Usage> parseUsage(std::string_view text) noexcept;

/// @brief Parse package spellings ("stdcall", "cdecl", ..., "devicecall").
[[nodiscard]] std::optional<CallingConvention> parseCallingConvention(
    std::string_view text) noexcept;

} // namespace hat::schema

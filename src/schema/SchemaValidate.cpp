//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/SchemaValidate.cpp
// Purpose: Implement structural validation of function metadata.
// Key invariants: Validation stops at the first violated rule.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Structural validation for FunctionSpec records.
/// @details The checks mirror what the binder later relies on, so failures
///          surface when a package is assembled instead of in the middle of a
///          benchmark session.

#include "schema/SchemaValidate.hpp"

#include "schema/SizeExpr.hpp"

#include <set>
#include <string>

namespace hat::schema
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

namespace
{

/// @brief True when @p param can supply an integer to a size expression.
bool isSizeSource(const ParameterSpec &param)
{
    if (!isInteger(param.elementType))
        return false;
    if (param.logicalType == LogicalType::Element)
        return true;
    return param.logicalType == LogicalType::AffineArray && param.shape.empty();
}

Expected<void> validateSizeExpression(const FunctionSpec &fn,
                                      const ParameterSpec &param,
                                      std::size_t position)
{
    auto parsed = SizeExpr::parse(param.sizeExpression);
    if (!parsed)
    {
        auto diag = parsed.takeError();
        diag.function = fn.name;
        diag.parameter = param.name;
        return diag;
    }

    const bool sizedAfterCall = isCalleeAllocated(param);
    for (const auto &ref : parsed.value().references())
    {
        const auto index = findArgument(fn, ref);
        if (!index)
            return makeError(ErrorKind::InvalidSchema,
                             "size expression names unknown parameter '" + ref + "'",
                             fn.name,
                             param.name);
        if (*index == position)
            return makeError(ErrorKind::InvalidSchema,
                             "size expression refers to its own parameter",
                             fn.name,
                             param.name);
        if (!sizedAfterCall && *index > position)
            return makeError(ErrorKind::InvalidSchema,
                             "size expression refers to later parameter '" + ref + "'",
                             fn.name,
                             param.name);
        if (!isSizeSource(fn.arguments[*index]))
            return makeError(ErrorKind::InvalidSchema,
                             "size expression parameter '" + ref + "' is not an integer scalar",
                             fn.name,
                             param.name);
    }
    return {};
}

} // namespace

/// @brief Validate a single parameter in isolation.
/// @details Rules applied:
///          - arguments need a name and may not be void;
///          - shapes are affine-only and non-negative;
///          - a declared affine map matches the shape rank and is non-negative;
///          - a declared offset is non-negative;
///          - runtime arrays, and only runtime arrays, carry a size expression.
Expected<void> validateParameter(const FunctionSpec &fn, const ParameterSpec &param, bool isReturn)
{
    auto fail = [&](std::string message)
    { return makeError(ErrorKind::InvalidSchema, std::move(message), fn.name, param.name); };

    if (!isReturn && param.name.empty())
        return fail("argument has no name");
    if (!isReturn && param.logicalType == LogicalType::Void)
        return fail("void is only valid as a return type");

    if (param.logicalType != LogicalType::AffineArray)
    {
        if (!param.shape.empty() || !param.affineMap.empty())
            return fail("only affine arrays may declare a shape or affine map");
    }

    for (const auto extent : param.shape)
    {
        if (extent < 0)
            return fail("shape extent " + std::to_string(extent) + " is negative");
    }

    if (!param.affineMap.empty())
    {
        if (param.affineMap.size() != param.shape.size())
            return fail("affine map has " + std::to_string(param.affineMap.size()) +
                        " entries but shape has " + std::to_string(param.shape.size()));
        for (const auto stride : param.affineMap)
        {
            if (stride < 0)
                return fail("affine map stride " + std::to_string(stride) + " is negative");
        }
    }

    if (param.affineOffset && *param.affineOffset < 0)
        return fail("affine offset " + std::to_string(*param.affineOffset) + " is negative");

    const bool isRuntime = param.logicalType == LogicalType::RuntimeArray;
    if (isRuntime && param.sizeExpression.empty())
        return fail("runtime array has no size expression");
    if (!isRuntime && !param.sizeExpression.empty())
        return fail("only runtime arrays may declare a size expression");

    return {};
}

/// @brief Validate @p fn and all of its parameters.
Expected<void> validateFunction(const FunctionSpec &fn)
{
    if (fn.name.empty())
        return makeError(ErrorKind::InvalidSchema, "function has no name");

    std::set<std::string, std::less<>> seen;
    for (std::size_t i = 0; i < fn.arguments.size(); ++i)
    {
        const auto &param = fn.arguments[i];
        if (auto ok = validateParameter(fn, param, false); !ok)
            return ok;
        if (!seen.insert(param.name).second)
            return makeError(
                ErrorKind::InvalidSchema, "duplicate argument name", fn.name, param.name);
    }

    if (auto ok = validateParameter(fn, fn.returnValue, true); !ok)
        return ok;
    if (fn.returnValue.logicalType == LogicalType::RuntimeArray)
        return makeError(ErrorKind::InvalidSchema,
                         "a runtime array cannot be returned by value",
                         fn.name,
                         fn.returnValue.name);

    for (std::size_t i = 0; i < fn.arguments.size(); ++i)
    {
        const auto &param = fn.arguments[i];
        if (param.logicalType != LogicalType::RuntimeArray)
            continue;
        if (auto ok = validateSizeExpression(fn, param, i); !ok)
            return ok;
    }

    if (fn.outputRelease && fn.outputRelease->empty())
        return makeError(ErrorKind::InvalidSchema, "output release name is empty", fn.name);

    return {};
}

} // namespace hat::schema

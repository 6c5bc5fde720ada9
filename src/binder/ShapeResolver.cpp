//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/ShapeResolver.cpp
// Purpose: Implement layout resolution for affine, runtime and scalar
//          parameters.
// Key invariants: All size arithmetic is overflow checked.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Layout resolution shared by the argument binder and the harness.
/// @details Affine arrays are sized by the storage their stride map actually
///          touches, which equals the element count for C-contiguous maps
///          and zero offset.  Runtime arrays take their count from a size
///          expression; the count is also their storage size.

#include "binder/ShapeResolver.hpp"

#include "common/IntegerHelpers.hpp"

#include <utility>

namespace hat::binder
{

using schema::LogicalType;
using schema::ParameterSpec;
using support::ErrorKind;
using support::Expected;
using support::makeError;

namespace integer = common::integer;

std::optional<std::size_t> affineStorageSpan(const std::vector<std::int64_t> &extents,
                                             const std::vector<std::int64_t> &strides,
                                             std::int64_t offset)
{
    integer::Value last = offset;
    for (std::size_t d = 0; d < extents.size(); ++d)
    {
        if (extents[d] == 0)
            return std::size_t{0};
        const auto step = integer::checkedMul(extents[d] - 1, strides[d]);
        if (!step)
            return std::nullopt;
        const auto next = integer::checkedAdd(last, *step);
        if (!next)
            return std::nullopt;
        last = *next;
    }
    const auto span = integer::checkedAdd(last, 1);
    if (!span)
        return std::nullopt;
    return static_cast<std::size_t>(*span);
}

Expected<ShapeResolver> ShapeResolver::create(const schema::FunctionSpec &fn)
{
    ShapeResolver resolver(fn);
    resolver.exprs_.reserve(fn.arguments.size());
    for (const auto &param : fn.arguments)
    {
        if (param.logicalType != LogicalType::RuntimeArray)
        {
            resolver.exprs_.emplace_back(std::nullopt);
            continue;
        }
        auto parsed = schema::SizeExpr::parse(param.sizeExpression);
        if (!parsed)
        {
            auto diag = parsed.takeError();
            diag.function = fn.name;
            diag.parameter = param.name;
            return diag;
        }
        resolver.exprs_.emplace_back(std::move(parsed.value()));
    }
    return resolver;
}

/// @brief Resolve one parameter's layout.
/// @details Per logical type:
///          - element: one element, no strides;
///          - affine array: product of extents, declared or row-major strides,
///            storage span per affineStorageSpan();
///          - runtime array: size expression result, which must be
///            non-negative;
///          - void: nothing.
Expected<ResolvedShape> ShapeResolver::resolveParameter(const ParameterSpec &param,
                                                        const schema::SizeExpr *expr,
                                                        const schema::SizeEnvironment &env,
                                                        bool afterCall) const
{
    auto fail = [&](ErrorKind kind, std::string message)
    { return makeError(kind, std::move(message), fn_->name, param.name); };

    const std::size_t elemSize = schema::elementSize(param.elementType);
    ResolvedShape shape;

    switch (param.logicalType)
    {
        case LogicalType::Void:
            return shape;

        case LogicalType::Element:
            shape.count = 1;
            shape.storageElements = 1;
            shape.bytes = elemSize;
            return shape;

        case LogicalType::AffineArray:
        {
            shape.extents = param.shape;
            shape.strides = schema::effectiveStrides(param);
            shape.offset = param.affineOffset.value_or(0);

            integer::Value count = 1;
            for (const auto extent : shape.extents)
            {
                const auto next = integer::checkedMul(count, extent);
                if (!next)
                    return fail(ErrorKind::InvalidSchema, "element count overflows");
                count = *next;
            }
            const auto span = affineStorageSpan(shape.extents, shape.strides, shape.offset);
            if (!span)
                return fail(ErrorKind::InvalidSchema, "storage span overflows");
            shape.count = static_cast<std::size_t>(count);
            shape.storageElements = *span;
            break;
        }

        case LogicalType::RuntimeArray:
        {
            if (schema::isCalleeAllocated(param) && !afterCall)
            {
                shape.deferred = true;
                return shape;
            }
            if (!expr)
                return fail(ErrorKind::InvalidSizeExpression, "runtime array has no size expression");

            auto value = expr->evaluate(env);
            if (!value)
            {
                auto diag = value.takeError();
                diag.function = fn_->name;
                diag.parameter = param.name;
                return diag;
            }
            if (value.value() < 0)
                return fail(ErrorKind::InvalidSizeExpression,
                            "size expression '" + expr->text() + "' is negative (" +
                                std::to_string(value.value()) + ")");
            shape.count = static_cast<std::size_t>(value.value());
            shape.extents = {value.value()};
            shape.strides = {1};
            shape.storageElements = shape.count;
            break;
        }
    }

    const auto bytes = integer::checkedMulSize(shape.storageElements, elemSize);
    if (!bytes)
        return fail(ErrorKind::InvalidSchema, "byte size overflows");
    shape.bytes = *bytes;
    return shape;
}

Expected<ResolvedShape> ShapeResolver::resolve(std::size_t index,
                                               const schema::SizeEnvironment &env) const
{
    const auto &expr = exprs_[index];
    return resolveParameter(fn_->arguments[index], expr ? &*expr : nullptr, env, false);
}

Expected<ResolvedShape> ShapeResolver::resolveReturn() const
{
    return resolveParameter(fn_->returnValue, nullptr, {}, false);
}

Expected<ResolvedShape> ShapeResolver::resolveAfterCall(std::size_t index,
                                                        const schema::SizeEnvironment &env) const
{
    const auto &expr = exprs_[index];
    return resolveParameter(fn_->arguments[index], expr ? &*expr : nullptr, env, true);
}

/// @brief Resolve every argument in call order, then the return value.
/// @details @p env must already hold every value the input size expressions
///          use; this entry point does not bind anything itself.
Expected<std::vector<ResolvedShape>> ShapeResolver::resolveAll(
    const schema::SizeEnvironment &env) const
{
    std::vector<ResolvedShape> shapes;
    shapes.reserve(fn_->arguments.size() + 1);
    for (std::size_t i = 0; i < fn_->arguments.size(); ++i)
    {
        auto shape = resolve(i, env);
        if (!shape)
            return shape.takeError();
        shapes.push_back(std::move(shape.value()));
    }
    auto ret = resolveReturn();
    if (!ret)
        return ret.takeError();
    shapes.push_back(std::move(ret.value()));
    return shapes;
}

} // namespace hat::binder

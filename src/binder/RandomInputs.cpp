//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/RandomInputs.cpp
// Purpose: Implement random input generation for benchmark replicas.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#include "binder/RandomInputs.hpp"

#include "schema/SizeExpr.hpp"

#include <utility>

namespace hat::binder
{

using schema::LogicalType;
using schema::Usage;
using support::Expected;

RandomInputs::RandomInputs(std::uint64_t seed, std::vector<long long> dimensionChoices)
    : engine_(seed ? seed : std::random_device{}()), dimensionChoices_(std::move(dimensionChoices))
{
    if (dimensionChoices_.empty())
        dimensionChoices_ = kDefaultDimensionChoices;
}

/// @brief True when @p name sizes an input runtime array of @p fn.
/// @details The set is rebuilt whenever a different function is bound, so a
///          provider can serve several functions in turn.
bool RandomInputs::isDimension(const schema::FunctionSpec &fn, const std::string &name)
{
    if (cachedFor_ != &fn || cachedName_ != fn.name)
    {
        cachedFor_ = &fn;
        cachedName_ = fn.name;
        dimensions_.clear();
        for (const auto &param : fn.arguments)
        {
            if (param.logicalType != LogicalType::RuntimeArray || schema::isCalleeAllocated(param))
                continue;
            auto expr = schema::SizeExpr::parse(param.sizeExpression);
            if (!expr)
                continue;
            for (const auto &ref : expr.value().references())
                dimensions_.insert(ref);
        }
    }
    return dimensions_.find(name) != dimensions_.end();
}

ScalarValue RandomInputs::randomScalar(schema::ElementType type, bool dimension)
{
    if (!schema::isInteger(type))
    {
        // Narrow types can round a draw just below 1 up to 1; redraw those.
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        ScalarValue value = ScalarValue::fromReal(type, dist(engine_));
        while (value.toReal() >= 1.0)
            value = ScalarValue::fromReal(type, dist(engine_));
        return value;
    }
    if (dimension)
    {
        std::uniform_int_distribution<std::size_t> pick(0, dimensionChoices_.size() - 1);
        return ScalarValue::fromInteger(type, dimensionChoices_[pick(engine_)]);
    }
    std::uniform_int_distribution<long long> dist(0, kIntegerBound - 1);
    return ScalarValue::fromInteger(type, dist(engine_));
}

/// @brief Fill the scratch buffer with one random value per storage element.
/// @details A shapeless integer array that sizes another parameter is a
///          dimension passed by pointer and gets a dimension value.
Expected<InputView> RandomInputs::arrayInput(const schema::FunctionSpec &fn,
                                             const schema::ParameterSpec &param,
                                             const ResolvedShape &shape)
{
    const std::size_t elemSize = schema::elementSize(param.elementType);
    const bool dimension = schema::isInteger(param.elementType) && isDimension(fn, param.name);
    scratch_.assign(shape.bytes, std::byte{0});
    for (std::size_t i = 0; i < shape.storageElements; ++i)
        storeBits(scratch_.data() + i * elemSize,
                  param.elementType,
                  randomScalar(param.elementType, dimension).bits);
    return InputView{param.elementType, scratch_.data(), shape.storageElements};
}

Expected<ScalarValue> RandomInputs::scalarInput(const schema::FunctionSpec &fn,
                                                const schema::ParameterSpec &param)
{
    const bool dimension = schema::isInteger(param.elementType) && isDimension(fn, param.name);
    return randomScalar(param.elementType, dimension);
}

} // namespace hat::binder

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/SuppliedInputs.cpp
// Purpose: Fixture-backed InputProvider used by verification and tests.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#include "binder/InputProvider.hpp"

#include <utility>

namespace hat::binder
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

void SuppliedInputs::setArrayBytes(std::string name,
                                   schema::ElementType type,
                                   std::vector<std::byte> bytes,
                                   std::size_t elements)
{
    arrays_.insert_or_assign(std::move(name), ArrayFixture{type, std::move(bytes), elements});
}

void SuppliedInputs::setScalar(std::string name, ScalarValue value)
{
    scalars_.insert_or_assign(std::move(name), value);
}

Expected<InputView> SuppliedInputs::arrayInput(const schema::FunctionSpec &fn,
                                               const schema::ParameterSpec &param,
                                               const ResolvedShape &)
{
    const auto it = arrays_.find(param.name);
    if (it == arrays_.end())
        return makeError(ErrorKind::ShapeMismatch, "no input data supplied", fn.name, param.name);
    const ArrayFixture &fixture = it->second;
    return InputView{fixture.type, fixture.bytes.data(), fixture.elements};
}

/// @brief Value for an element parameter.
/// @details A scalar input may also be supplied as a one-element array, which
///          is how fixtures captured from array-typed call sites arrive.
Expected<ScalarValue> SuppliedInputs::scalarInput(const schema::FunctionSpec &fn,
                                                  const schema::ParameterSpec &param)
{
    if (const auto it = scalars_.find(param.name); it != scalars_.end())
        return it->second;
    if (const auto it = arrays_.find(param.name); it != arrays_.end() && it->second.elements == 1)
        return loadScalar(it->second.bytes.data(), it->second.type);
    return makeError(ErrorKind::ShapeMismatch, "no scalar value supplied", fn.name, param.name);
}

} // namespace hat::binder

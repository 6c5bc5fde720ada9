//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/SchemaValidate.hpp
// Purpose: Structural checks applied to a FunctionSpec before it is used.
// Key invariants: A function accepted here can be shape-resolved without
//                 forward references among its input size expressions.
// Ownership/Lifetime: Stateless; diagnostics are returned by value.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/FunctionSpec.hpp"
#include "support/diag_expected.hpp"

namespace hat::schema
{

/// @brief Validate a single parameter in isolation.
/// @param fn Owning function, used for diagnostics.
/// @param param Parameter to check.
/// @param isReturn True when @p param is the return value.
support::Expected<void> validateParameter(const FunctionSpec &fn,
                                          const ParameterSpec &param,
                                          bool isReturn);

/// @brief Validate @p fn and all of its parameters.
/// @details Checks name uniqueness, shape/map agreement, stride signs,
///          size-expression placement and syntax, and that every name a size
///          expression uses refers to an integer scalar.  Input runtime arrays
///          may only reference earlier arguments; output runtime arrays are
///          sized after the call and may reference any argument.
/// @return Success or the first InvalidSchema / InvalidSizeExpression found.
support::Expected<void> validateFunction(const FunctionSpec &fn);

} // namespace hat::schema

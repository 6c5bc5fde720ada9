//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/SizeExpr.hpp
// Purpose: Declares the parsed form of a runtime array's size expression.
// Key invariants: A SizeExpr always holds a well-formed tree; parse failures
//                 are reported and never produce an object.
// Ownership/Lifetime: Copies share the immutable tree.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Integer arithmetic over named parameter values.
/// @details Grammar, loosest binding first:
///            expr    := expr ('+' | '-') expr | expr ('*' | '/') expr
///                     | '-' expr | '(' expr ')' | integer | identifier
///          '*' and '/' bind tighter than '+' and '-'; all binary operators
///          are left associative and '/' truncates toward zero.

#pragma once

#include "common/IntegerHelpers.hpp"
#include "support/diag_expected.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hat::schema
{

/// @brief Bound integer values visible to a size expression.
using SizeEnvironment = std::map<std::string, common::integer::Value, std::less<>>;

/// @brief Parsed size expression that can be evaluated many times.
class SizeExpr
{
  public:
    using Value = common::integer::Value;

    /// @brief Parse @p text into an expression tree.
    /// @return Parsed expression or an InvalidSizeExpression diagnostic.
    static support::Expected<SizeExpr> parse(std::string_view text);

    /// @brief Evaluate against @p env.
    /// @return Value, UnresolvedSizeReference for a name missing from @p env,
    ///         or InvalidSizeExpression on division by zero or overflow.
    [[nodiscard]] support::Expected<Value> evaluate(const SizeEnvironment &env) const;

    /// @brief Identifiers referenced by the expression, in first-use order.
    [[nodiscard]] const std::vector<std::string> &references() const noexcept
    {
        return references_;
    }

    /// @brief Source text the expression was parsed from.
    [[nodiscard]] const std::string &text() const noexcept
    {
        return text_;
    }

    /// @brief Tree node; defined alongside the parser.
    struct Node;

  private:
    SizeExpr() = default;

    std::shared_ptr<const Node> root_;
    std::vector<std::string> references_;
    std::string text_;

    friend class SizeExprParser;
};

} // namespace hat::schema

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/SizeExpr.cpp
// Purpose: Pratt parser and checked evaluator for size expressions.
// Key invariants: Evaluation never wraps; any overflow is reported.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

#include "schema/SizeExpr.hpp"

#include "hat/parse/Cursor.h"

#include <algorithm>
#include <array>
#include <charconv>
#include <optional>
#include <system_error>

namespace hat::schema
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

struct SizeExpr::Node
{
    enum class Kind
    {
        Literal,
        Name,
        Negate,
        Add,
        Sub,
        Mul,
        Div,
    };

    Kind kind = Kind::Literal;
    Value value = 0;
    std::string name;
    std::unique_ptr<Node> lhs;
    std::unique_ptr<Node> rhs;
};

namespace
{

using Node = SizeExpr::Node;
using NodePtr = std::unique_ptr<Node>;

struct InfixParselet
{
    char token;
    Node::Kind kind;
    int lbp;
};

/// Binding power of unary minus; binds tighter than every infix operator.
constexpr int kNegateRbp = 3;

constexpr std::array<InfixParselet, 4> infixParselets{
    InfixParselet{'*', Node::Kind::Mul, 2},
    InfixParselet{'/', Node::Kind::Div, 2},
    InfixParselet{'+', Node::Kind::Add, 1},
    InfixParselet{'-', Node::Kind::Sub, 1},
};

inline const InfixParselet *findInfix(char token)
{
    const auto it =
        std::find_if(infixParselets.begin(),
                     infixParselets.end(),
                     [token](const InfixParselet &parselet) { return parselet.token == token; });
    return it == infixParselets.end() ? nullptr : &*it;
}

} // namespace

/// @brief Recursive-descent front end producing SizeExpr trees.
class SizeExprParser
{
  public:
    explicit SizeExprParser(std::string_view text) : text_(text), cur_(text) {}

    Expected<SizeExpr> run()
    {
        auto root = parseExpression(0);
        if (!root)
            return fail();
        cur_.skipWs();
        if (!cur_.atEnd())
        {
            setError("unexpected '" + std::string(1, cur_.peek()) + "'");
            return fail();
        }

        SizeExpr expr;
        expr.root_ = std::shared_ptr<const Node>(std::move(root));
        expr.references_ = std::move(references_);
        expr.text_ = std::string(text_);
        return expr;
    }

  private:
    NodePtr parseExpression(int minPrec)
    {
        auto lhs = parseUnary();
        if (!lhs)
            return nullptr;

        for (;;)
        {
            cur_.skipWs();
            const InfixParselet *infix = findInfix(cur_.peek());
            if (!infix || infix->lbp <= minPrec)
                break;
            cur_.advance();

            auto rhs = parseExpression(infix->lbp);
            if (!rhs)
                return nullptr;

            auto node = std::make_unique<Node>();
            node->kind = infix->kind;
            node->lhs = std::move(lhs);
            node->rhs = std::move(rhs);
            lhs = std::move(node);
        }
        return lhs;
    }

    NodePtr parseUnary()
    {
        cur_.skipWs();
        if (cur_.consumeIf('-'))
        {
            auto operand = parseExpression(kNegateRbp);
            if (!operand)
                return nullptr;
            auto node = std::make_unique<Node>();
            node->kind = Node::Kind::Negate;
            node->lhs = std::move(operand);
            return node;
        }
        return parsePrimary();
    }

    NodePtr parsePrimary()
    {
        cur_.skipWs();
        if (cur_.consumeIf('('))
        {
            auto inner = parseExpression(0);
            if (!inner)
                return nullptr;
            cur_.skipWs();
            if (!cur_.consumeIf(')'))
            {
                setError("expected ')'");
                return nullptr;
            }
            return inner;
        }

        std::string_view token;
        if (cur_.consumeNumber(token))
        {
            SizeExpr::Value value = 0;
            const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec != std::errc() || ptr != token.data() + token.size())
            {
                setError("integer literal '" + std::string(token) + "' out of range");
                return nullptr;
            }
            auto node = std::make_unique<Node>();
            node->kind = Node::Kind::Literal;
            node->value = value;
            return node;
        }

        if (cur_.consumeIdent(token))
        {
            auto node = std::make_unique<Node>();
            node->kind = Node::Kind::Name;
            node->name = std::string(token);
            if (std::find(references_.begin(), references_.end(), node->name) == references_.end())
                references_.push_back(node->name);
            return node;
        }

        if (cur_.atEnd())
            setError("unexpected end of expression");
        else
            setError("unexpected '" + std::string(1, cur_.peek()) + "'");
        return nullptr;
    }

    void setError(std::string what)
    {
        if (error_.empty())
            error_ = std::move(what) + " at column " + std::to_string(cur_.offset() + 1);
    }

    support::Diag fail() const
    {
        return makeError(ErrorKind::InvalidSizeExpression,
                         "cannot parse size expression '" + std::string(text_) + "': " + error_);
    }

    std::string_view text_;
    parse::Cursor cur_;
    std::vector<std::string> references_;
    std::string error_;
};

namespace
{

Expected<SizeExpr::Value> evalNode(const Node &node,
                                   const SizeEnvironment &env,
                                   const std::string &text)
{
    namespace integer = common::integer;

    auto overflow = [&text]()
    { return makeError(ErrorKind::InvalidSizeExpression, "overflow evaluating '" + text + "'"); };

    switch (node.kind)
    {
        case Node::Kind::Literal:
            return node.value;
        case Node::Kind::Name:
        {
            const auto it = env.find(node.name);
            if (it == env.end())
                return makeError(ErrorKind::UnresolvedSizeReference,
                                 "'" + node.name + "' is not bound when evaluating '" + text +
                                     "'");
            return it->second;
        }
        case Node::Kind::Negate:
        {
            auto operand = evalNode(*node.lhs, env, text);
            if (!operand)
                return operand;
            auto result = integer::checkedSub(0, operand.value());
            if (!result)
                return overflow();
            return *result;
        }
        default:
            break;
    }

    auto lhs = evalNode(*node.lhs, env, text);
    if (!lhs)
        return lhs;
    auto rhs = evalNode(*node.rhs, env, text);
    if (!rhs)
        return rhs;

    std::optional<SizeExpr::Value> result;
    switch (node.kind)
    {
        case Node::Kind::Add:
            result = integer::checkedAdd(lhs.value(), rhs.value());
            break;
        case Node::Kind::Sub:
            result = integer::checkedSub(lhs.value(), rhs.value());
            break;
        case Node::Kind::Mul:
            result = integer::checkedMul(lhs.value(), rhs.value());
            break;
        case Node::Kind::Div:
            if (rhs.value() == 0)
                return makeError(ErrorKind::InvalidSizeExpression,
                                 "division by zero evaluating '" + text + "'");
            result = integer::checkedDiv(lhs.value(), rhs.value());
            break;
        default:
            break;
    }
    if (!result)
        return overflow();
    return *result;
}

} // namespace

/// @brief Parse @p text into an expression tree.
/// @details The whole text must form one expression; trailing tokens are an
///          error.  Whitespace between tokens is ignored.
Expected<SizeExpr> SizeExpr::parse(std::string_view text)
{
    return SizeExprParser(text).run();
}

/// @brief Evaluate against @p env.
/// @details Intermediate results may be negative; callers decide whether a
///          negative final value is acceptable.
Expected<SizeExpr::Value> SizeExpr::evaluate(const SizeEnvironment &env) const
{
    return evalNode(*root_, env, text_);
}

} // namespace hat::schema

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/hat/parse/Cursor.h
// Purpose: Declare a lightweight text cursor for metadata expression parsers.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines a reusable cursor helper for metadata text parsing.
/// @details The cursor provides zero-allocation scanning primitives used by
///          the size-expression parser.  Expressions are single-line, so the
///          cursor tracks a byte offset only; diagnostics quote it as a column.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace hat::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Lightweight cursor for scanning expression text.
class Cursor
{
  public:
    /// @brief Construct a cursor over @p text.
    explicit Cursor(std::string_view text) noexcept;

    /// @brief Return the backing view observed by the cursor.
    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief View the unconsumed suffix.
    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(index_);
    }

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the current character without consuming it.
    [[nodiscard]] char peek() const noexcept;

    /// @brief Retrieve the absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Skip leading whitespace characters.
    void skipWs() noexcept;

    /// @brief Consume @p c if present at the cursor.
    bool consumeIf(char c) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Consume a C identifier token.
    bool consumeIdent(std::string_view &out) noexcept;

    /// @brief Consume an unsigned decimal literal.
    bool consumeNumber(std::string_view &out) noexcept;

    /// @brief Advance by a single character if not already at end.
    void advance() noexcept;

  private:
    std::string_view text_;
    std::size_t index_ = 0;
};

} // namespace hat::parse

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: Failed consumption leaves the cursor where it was.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the lightweight parsing cursor shared by metadata parsers.

#include "hat/parse/Cursor.h"

#include <cctype>

namespace hat::parse
{

/// @brief Construct a cursor over the provided source buffer.
/// @param text Source text to traverse.
Cursor::Cursor(std::string_view text) noexcept : text_(text), index_(0) {}

/// @brief Inspect the current character without advancing.
/// @details Returns '\0' when the cursor is at the end to simplify callers that
///          expect a sentinel terminator.
/// @return Character at the current cursor position or '\0' at end.
char Cursor::peek() const noexcept
{
    return atEnd() ? '\0' : text_[index_];
}

/// @brief Consume the current character.
/// @details Safely returns when already at end-of-input.
void Cursor::advance() noexcept
{
    if (!atEnd())
        ++index_;
}

/// @brief Advance past ASCII whitespace characters.
void Cursor::skipWs() noexcept
{
    consumeWhile([](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
}

/// @brief Conditionally consume @p c and report success.
/// @details Does not skip whitespace; callers decide where blanks are legal.
/// @param c Character to consume.
/// @return True when @p c was consumed.
bool Cursor::consumeIf(char c) noexcept
{
    if (atEnd() || peek() != c)
        return false;
    advance();
    return true;
}

/// @brief Consume an identifier token from the stream.
/// @details Skips leading whitespace, then reads a leading alphabetic or '_'
///          character followed by alphanumerics or '_'. Parameter names in
///          package metadata are C identifiers, so nothing else is accepted.
/// @param[out] out View that will reference the consumed identifier.
/// @return True when an identifier was consumed.
bool Cursor::consumeIdent(std::string_view &out) noexcept
{
    skipWs();
    const unsigned char first = static_cast<unsigned char>(peek());
    if (atEnd() || !(std::isalpha(first) || first == '_'))
        return false;

    out = consumeWhile([](char ch)
                       {
                           const auto uch = static_cast<unsigned char>(ch);
                           return std::isalnum(uch) || uch == '_';
                       });
    return true;
}

/// @brief Consume an unsigned integer literal.
/// @details Signs are operators in size expressions, so only digits are
///          consumed here.
/// @param[out] out View that references the consumed number literal.
/// @return True when a number literal was consumed.
bool Cursor::consumeNumber(std::string_view &out) noexcept
{
    skipWs();
    if (atEnd() || !std::isdigit(static_cast<unsigned char>(peek())))
        return false;

    out = consumeWhile([](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
    return true;
}

} // namespace hat::parse

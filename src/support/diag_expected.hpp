//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Expected owns both its value and its diagnostic.
// Links: docs/codemap.md#support
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace hat::support
{
using Diag = Diagnostic;

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected until the standard type becomes
///       universally available on our toolchain.
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @param value Value produced by a successful computation.
    /// @details Enabled only when the provided value decays to neither Diag
    ///          nor Expected, so the diagnostic and copy constructors win.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    /// @param diag Diagnostic to return to the caller.
    Expected(Diag diag) : error_(std::move(diag)) {}

    /// @brief Check whether a value is present.
    /// @return True when the Expected stores a value.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

    /// @brief Move the diagnostic out, typically to forward it to a caller.
    Diag takeError()
    {
        return std::move(*error_);
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    /// @param diag Diagnostic describing the failure.
    Expected(Diag diag);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

    /// @brief Move the diagnostic out, typically to forward it to a caller.
    Diag takeError();

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic.
/// @param kind Violated contract.
/// @param msg Human-readable diagnostic message.
/// @param function Function the error concerns, if any.
/// @param parameter Parameter the error concerns, if any.
/// @return Diagnostic marked as an error severity.
Diag makeError(ErrorKind kind,
               std::string msg,
               std::string function = {},
               std::string parameter = {});

/// @brief Create a warning diagnostic; arguments mirror makeError().
Diag makeWarning(ErrorKind kind,
                 std::string msg,
                 std::string function = {},
                 std::string parameter = {});

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @note Follows DiagnosticEngine::printAll formatting for consistency.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace hat::support

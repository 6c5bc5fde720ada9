//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the binder,
// invoker and harness.  The utilities defined here wrap structured diagnostics
// around an Expected<void> type, provide consistent severity-to-string mapping,
// and print diagnostics with their function and parameter context.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.
/// @details Binding failures are ordinary, recoverable outcomes (a malformed
///          size expression aborts one function, not the package run), so every
///          layer reports them through `Expected`.  This translation unit
///          gathers the constructors, severity conversions and printers.

#include "diag_expected.hpp"

namespace hat::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
///
/// @return Reference to the stored diagnostic payload.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

Diag Expected<void>::takeError()
{
    return std::move(*error_);
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
/// @param severity Severity enumeration value to translate.
/// @return Null-terminated string naming the severity level.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(ErrorKind kind, std::string msg, std::string function, std::string parameter)
{
    return Diag{Severity::Error, kind, std::move(msg), std::move(function), std::move(parameter)};
}

Diag makeWarning(ErrorKind kind, std::string msg, std::string function, std::string parameter)
{
    return Diag{
        Severity::Warning, kind, std::move(msg), std::move(function), std::move(parameter)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details Produces `<severity>: <function>: <parameter>: <message> [<kind>]`,
///          omitting the function and parameter fields when they are empty and
///          the kind suffix for ErrorKind::None.  Always emits a trailing
///          newline so multiple diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity) << ": ";
    if (!diag.function.empty())
        os << diag.function << ": ";
    if (!diag.parameter.empty())
        os << diag.parameter << ": ";
    os << diag.message;
    if (diag.kind != ErrorKind::None)
        os << " [" << toString(diag.kind) << ']';
    os << '\n';
}
} // namespace hat::support

/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The diagnostic engine aggregates messages emitted while binding and
 *     benchmarking package functions and keeps track of severity counts.
 *     Diagnostics are stored until callers explicitly print or inspect them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"

#include <algorithm>

namespace hat::support
{

/// @brief Map an error kind to the name printed after a diagnostic.
/// @param kind Error classification.
/// @return Stable CamelCase identifier for @p kind.
std::string_view toString(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::None:
            return "None";
        case ErrorKind::UnresolvedSizeReference:
            return "UnresolvedSizeReference";
        case ErrorKind::InvalidSizeExpression:
            return "InvalidSizeExpression";
        case ErrorKind::ShapeMismatch:
            return "ShapeMismatch";
        case ErrorKind::ElementTypeMismatch:
            return "ElementTypeMismatch";
        case ErrorKind::UnspecifiedOwnership:
            return "UnspecifiedOwnership";
        case ErrorKind::UnsupportedSignature:
            return "UnsupportedSignature";
        case ErrorKind::InvalidSchema:
            return "InvalidSchema";
        case ErrorKind::DuplicateFunction:
            return "DuplicateFunction";
        case ErrorKind::UnknownFunction:
            return "UnknownFunction";
        case ErrorKind::InvalidOption:
            return "InvalidOption";
        case ErrorKind::SymbolNotFound:
            return "SymbolNotFound";
        case ErrorKind::LibraryLoadFailed:
            return "LibraryLoadFailed";
        case ErrorKind::IsolationFailed:
            return "IsolationFailed";
        case ErrorKind::IOError:
            return "IOError";
        case ErrorKind::IncompleteRun:
            return "IncompleteRun";
    }
    return "None";
}

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * The diagnostic is appended to the internal vector for later inspection.  The
 * method increments the error or warning counter depending on the diagnostic's
 * severity, leaving notes unchanged.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output and one-off
 * diagnostics printed by callers look the same.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

/**
 * @brief Returns the number of error-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Error`.
 */
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/**
 * @brief Returns the number of warning-severity diagnostics recorded so far.
 *
 * @return Number of stored diagnostics with severity `Warning`.
 */
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

bool DiagnosticEngine::contains(ErrorKind kind) const
{
    return std::any_of(
        diags_.begin(), diags_.end(), [kind](const Diagnostic &d) { return d.kind == kind; });
}
} // namespace hat::support

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic records and the engine that collects them.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

/// @brief Records diagnostics and prints them later.
/// @invariant Counts reflect reported diagnostics.
/// @ownership Owns stored diagnostic messages.
namespace hat::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Classifies the contract a diagnostic reports as violated.
enum class ErrorKind
{
    None,                    ///< Informational diagnostics.
    UnresolvedSizeReference, ///< Size expression names a parameter that is not bound yet.
    InvalidSizeExpression,   ///< Size expression failed to parse or evaluate.
    ShapeMismatch,           ///< Supplied buffer does not match the resolved shape.
    ElementTypeMismatch,     ///< Supplied value has a different element kind.
    UnspecifiedOwnership,    ///< Callee-allocated output without a release convention.
    UnsupportedSignature,    ///< Host invoker cannot express the declared signature.
    InvalidSchema,           ///< Metadata violates a structural invariant.
    DuplicateFunction,       ///< Package already holds a function with that name.
    UnknownFunction,         ///< Lookup of a function name failed.
    InvalidOption,           ///< Benchmark option outside its documented range.
    SymbolNotFound,          ///< Native symbol could not be resolved.
    LibraryLoadFailed,       ///< Shared library could not be opened.
    IsolationFailed,         ///< Child process for an isolated run failed to start.
    IOError,                 ///< Report or stream output failed.
    IncompleteRun,           ///< Session ended before a usable measurement.
};

/// @brief Stable name for @p kind used in printed diagnostics.
[[nodiscard]] std::string_view toString(ErrorKind kind) noexcept;

/// @brief Single diagnostic message with the function/parameter it concerns.
struct Diagnostic
{
    Severity severity;         ///< Message severity
    ErrorKind kind;            ///< Violated contract
    std::string message;       ///< Human-readable text
    std::string function = {}; ///< Function name, empty when not tied to one
    std::string parameter = {}; ///< Parameter name, empty when not tied to one
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    void printAll(std::ostream &os) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    /// @brief Recorded diagnostics in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Check whether a diagnostic of @p kind has been reported.
    [[nodiscard]] bool contains(ErrorKind kind) const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};
} // namespace hat::support

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/Package.hpp
// Purpose: Declares the ordered collection of functions exported by a package.
// Key invariants: Function names are unique; every stored function passed
//                 validateFunction().
// Ownership/Lifetime: The package owns its FunctionSpecs by value.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/FunctionSpec.hpp"
#include "support/diag_expected.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hat::schema
{

/// @brief Auxiliary key the benchmark harness records mean timings under.
inline constexpr std::string_view kMeanDurationKey = "mean_duration_in_sec";

/// @brief Ordered set of functions with their auxiliary metadata.
/// @details Only auxiliary metadata may change after a function is added;
///          parameter records stay as validated.
class Package
{
  public:
    Package() = default;

    /// @brief Create an empty package called @p name.
    explicit Package(std::string name);

    /// @brief Package name, used in reports.
    [[nodiscard]] const std::string &name() const noexcept
    {
        return name_;
    }

    /// @brief Validate and append @p fn.
    /// @return DuplicateFunction when the name is taken, or the validation
    ///         diagnostic when @p fn is malformed.
    support::Expected<void> add(FunctionSpec fn);

    /// @brief Find a function by name; nullptr when absent.
    [[nodiscard]] const FunctionSpec *find(std::string_view name) const;

    /// @brief All functions in insertion order.
    [[nodiscard]] const std::vector<FunctionSpec> &functions() const noexcept
    {
        return functions_;
    }

    /// @brief Set auxiliary metadata @p key of function @p function to @p value.
    /// @return UnknownFunction when no such function exists.
    support::Expected<void> setAuxiliary(std::string_view function,
                                         const std::string &key,
                                         std::string value);

    /// @brief Auxiliary metadata of @p function.
    /// @return UnknownFunction when no such function exists.
    support::Expected<std::map<std::string, std::string>> auxiliary(
        std::string_view function) const;

  private:
    FunctionSpec *findMutable(std::string_view name);

    std::string name_;
    std::vector<FunctionSpec> functions_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace hat::schema

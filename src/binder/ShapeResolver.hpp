//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/ShapeResolver.hpp
// Purpose: Compute concrete element counts, strides and byte sizes for the
//          parameters of one function.
// Key invariants: Arguments resolve left to right, then the return value;
//                 callee-allocated outputs resolve only after the call.
// Ownership/Lifetime: Borrows the FunctionSpec, which must outlive the resolver.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#pragma once

#include "schema/FunctionSpec.hpp"
#include "schema/SizeExpr.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace hat::binder
{

/// @brief Concrete layout of one parameter.
struct ResolvedShape
{
    std::vector<std::int64_t> extents; ///< Shape; {count} for runtime arrays.
    std::vector<std::int64_t> strides; ///< Element strides per extent.
    std::int64_t offset = 0;           ///< Element offset of the first datum.
    std::size_t count = 0;             ///< Logical element count.
    std::size_t storageElements = 0;   ///< Elements the buffer must hold.
    std::size_t bytes = 0;             ///< storageElements * element size.
    bool deferred = false;             ///< Known only after the native call.
};

/// @brief Elements spanned by an affine layout.
/// @details offset + sum((extent - 1) * stride) + 1, or 0 when any extent is 0.
/// @return Empty on overflow.
[[nodiscard]] std::optional<std::size_t> affineStorageSpan(const std::vector<std::int64_t> &extents,
                                                           const std::vector<std::int64_t> &strides,
                                                           std::int64_t offset);

/// @brief Resolves parameter layouts of one function against bound values.
class ShapeResolver
{
  public:
    /// @brief Prepare a resolver for @p fn, parsing its size expressions once.
    /// @return Resolver, or the parse diagnostic of the first bad expression.
    static support::Expected<ShapeResolver> create(const schema::FunctionSpec &fn);

    /// @brief Resolve argument @p index against @p env.
    /// @details Callee-allocated outputs come back with deferred set and a
    ///          zero count.
    [[nodiscard]] support::Expected<ResolvedShape> resolve(std::size_t index,
                                                           const schema::SizeEnvironment &env) const;

    /// @brief Resolve the return value.
    [[nodiscard]] support::Expected<ResolvedShape> resolveReturn() const;

    /// @brief Resolve every argument in call order, then the return value.
    [[nodiscard]] support::Expected<std::vector<ResolvedShape>> resolveAll(
        const schema::SizeEnvironment &env) const;

    /// @brief Post-call resolution of a callee-allocated output.
    /// @param env Environment extended with the values the callee wrote.
    [[nodiscard]] support::Expected<ResolvedShape> resolveAfterCall(
        std::size_t index, const schema::SizeEnvironment &env) const;

    /// @brief Function the resolver describes.
    [[nodiscard]] const schema::FunctionSpec &function() const noexcept
    {
        return *fn_;
    }

  private:
    explicit ShapeResolver(const schema::FunctionSpec &fn) : fn_(&fn) {}

    support::Expected<ResolvedShape> resolveParameter(const schema::ParameterSpec &param,
                                                      const schema::SizeExpr *expr,
                                                      const schema::SizeEnvironment &env,
                                                      bool afterCall) const;

    const schema::FunctionSpec *fn_;
    std::vector<std::optional<schema::SizeExpr>> exprs_;
};

} // namespace hat::binder

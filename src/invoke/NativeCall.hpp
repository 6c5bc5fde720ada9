//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/invoke/NativeCall.hpp
// Purpose: Call a native function pointer with bound argument words.
// Key invariants: Calls are synchronous; faults inside the callee are not
//                 intercepted.
// Ownership/Lifetime: The invoker owns nothing; symbols and argument storage
//                     belong to the caller.
// Links: docs/codemap.md#invoke
//
//===----------------------------------------------------------------------===//

#pragma once

#include "binder/ArgumentBinder.hpp"
#include "schema/FunctionSpec.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <span>

namespace hat::invoke
{

/// @brief Register class the callee returns its value in.
enum class ReturnClass
{
    Void,
    Integer, ///< General-purpose register; narrowed by the caller.
    Float32,
    Float64,
};

/// @brief A resolved native function and its paired release function.
struct NativeFunction
{
    void *symbol = nullptr;
    binder::ReleaseFn release = nullptr;
};

/// @brief Classify the return value of @p fn.
[[nodiscard]] ReturnClass returnClassOf(const schema::FunctionSpec &fn) noexcept;

/// @brief Call @p symbol with @p words, every word in an integer argument slot.
/// @param symbol Function address.
/// @param words Argument words; at most binder::kMaxNativeArguments.
/// @param rc Register class of the return value.
/// @return Raw bit image of the return value; 0 for void.
std::uint64_t callWords(void *symbol, std::span<const std::uint64_t> words, ReturnClass rc);

/// @brief Perform one call of @p fn with the words of @p args.
/// @details Records the return value in @p args.  Output harvesting is a
///          separate step (ArgumentSet::harvest) so timing loops can keep it
///          out of the measured region.
/// @return UnsupportedSignature for too many words, SymbolNotFound for a
///         null symbol.
support::Expected<void> call(const NativeFunction &fn, binder::ArgumentSet &args);

/// @brief call() followed by ArgumentSet::harvest().
support::Expected<void> callAndHarvest(const NativeFunction &fn, binder::ArgumentSet &args);

} // namespace hat::invoke

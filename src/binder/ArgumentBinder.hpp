//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/ArgumentBinder.hpp
// Purpose: Turn a FunctionSpec plus input values into native argument words
//          and owned argument storage.
// Key invariants: Binding errors are detected before any native call; every
//                 bound argument lives in storage that does not move until
//                 its ArgumentSet is destroyed.
// Ownership/Lifetime: An ArgumentSet owns the callee-allocated buffers it has
//                     harvested and releases them when recycled or destroyed.
//                     Buffers it allocated itself belong to the arena it was
//                     bound into.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#pragma once

#include "binder/ElementCodec.hpp"
#include "binder/InputProvider.hpp"
#include "binder/ShapeResolver.hpp"
#include "schema/FunctionSpec.hpp"
#include "schema/SizeExpr.hpp"
#include "support/arena.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hat::binder
{

/// @brief Maximum number of native argument words a call may carry.
inline constexpr std::size_t kMaxNativeArguments = 16;

/// @brief Release function for callee-allocated buffers.
using ReleaseFn = void (*)(void *);

/// @brief What to do with callee-allocated outputs whose owner is undeclared.
enum class OwnershipPolicy
{
    Leak,   ///< Warn and never free them.
    Reject, ///< Refuse to bind the function.
};

/// @brief Knobs applied to every set a binder produces.
struct BinderOptions
{
    OwnershipPolicy unspecifiedOwnership = OwnershipPolicy::Leak;
    /// Paired release function resolved from the package; "free" needs none.
    ReleaseFn release = nullptr;
    /// Receives UnspecifiedOwnership warnings; may be null.
    support::DiagnosticEngine *diags = nullptr;
};

/// @brief Storage the binder owns and passes by address.
struct PreBound
{
    std::byte *data = nullptr;
    std::size_t bytes = 0;
};

/// @brief Output the callee allocates; the pointer slot is filled by the call.
struct PendingCalleeAllocated
{
    void **slot = nullptr;  ///< Address passed as the T** argument.
    bool harvested = false; ///< Set once the count and pointer were recorded.
};

/// @brief Scalar passed by value.
struct Scalar
{
    ScalarValue value;
};

using BindingState = std::variant<PreBound, PendingCalleeAllocated, Scalar>;

/// @brief A parameter paired with its resolved layout and binding state.
struct BoundArgument
{
    const schema::ParameterSpec *param = nullptr;
    ResolvedShape shape;
    BindingState state;
};

class ArgumentBinder;

/// @brief Fully bound arguments for one native call.
class ArgumentSet
{
  public:
    ArgumentSet(ArgumentSet &&other) noexcept;
    ArgumentSet &operator=(ArgumentSet &&other) noexcept;
    ArgumentSet(const ArgumentSet &) = delete;
    ArgumentSet &operator=(const ArgumentSet &) = delete;

    /// @brief Releases harvested callee buffers according to the release convention.
    ~ArgumentSet();

    [[nodiscard]] const schema::FunctionSpec &function() const noexcept
    {
        return resolver_->function();
    }

    /// @brief Bound arguments in call order.
    [[nodiscard]] const std::vector<BoundArgument> &arguments() const noexcept
    {
        return arguments_;
    }

    /// @brief Look up a bound argument by parameter name.
    [[nodiscard]] const BoundArgument *find(std::string_view name) const;

    /// @brief Native argument words in call order; void parameters are skipped.
    [[nodiscard]] std::span<const std::uint64_t> words() const noexcept
    {
        return words_;
    }

    /// @brief Bytes of binder-owned argument storage.
    [[nodiscard]] std::size_t footprint() const noexcept;

    /// @brief Integer values known before the call.
    [[nodiscard]] const schema::SizeEnvironment &inputEnvironment() const noexcept
    {
        return inputEnv_;
    }

    /// @brief Integer values known after the last harvest().
    [[nodiscard]] const schema::SizeEnvironment &environment() const noexcept
    {
        return callEnv_;
    }

    /// @brief Bytes of argument @p name: its storage, or the harvested buffer.
    /// @return Empty span for scalars, unharvested outputs and unknown names.
    [[nodiscard]] std::span<const std::byte> bytes(std::string_view name) const;

    /// @brief Typed view of argument @p name; see bytes().
    template <class T> [[nodiscard]] std::span<const T> view(std::string_view name) const
    {
        const auto raw = bytes(name);
        return {reinterpret_cast<const T *>(raw.data()), raw.size() / sizeof(T)};
    }

    /// @brief Record the raw return register of the last call.
    void setReturnBits(std::uint64_t raw) noexcept;

    /// @brief Value returned by the last call; empty for void functions.
    [[nodiscard]] const std::optional<ScalarValue> &returnValue() const noexcept
    {
        return returnValue_;
    }

    /// @brief Post-call phase: record callee-written counts and buffers.
    /// @details Extends the input environment with integer outputs the
    ///          callee wrote, resolves every callee-allocated output against
    ///          it and takes ownership of the returned buffers.
    support::Expected<void> harvest();

    /// @brief Release callee-allocated outputs and clear their slots so the
    ///        set can be passed to the native function again.
    void recycle() noexcept;

  private:
    friend class ArgumentBinder;

    ArgumentSet(std::shared_ptr<const ShapeResolver> resolver, ReleaseFn release);

    void rebuildWords();

    std::shared_ptr<const ShapeResolver> resolver_;
    ReleaseFn release_ = nullptr;
    std::unique_ptr<support::Arena> ownedArena_;
    std::vector<BoundArgument> arguments_;
    std::vector<std::uint64_t> words_;
    schema::SizeEnvironment inputEnv_;
    schema::SizeEnvironment callEnv_;
    std::optional<ScalarValue> returnValue_;
};

/// @brief Binds arguments for one function.
/// @details Created once per function; bind() may then be called any number
///          of times, e.g. once per working-set replica.
class ArgumentBinder
{
  public:
    /// @brief Prepare binding for @p fn.
    /// @details Rejects signatures the native invoker cannot express and
    ///          settles the ownership convention of callee-allocated outputs.
    /// @return UnsupportedSignature, UnspecifiedOwnership (Reject policy),
    ///         SymbolNotFound (declared release function not resolved), or a
    ///         size-expression parse diagnostic.
    static support::Expected<ArgumentBinder> create(const schema::FunctionSpec &fn,
                                                    BinderOptions options = {});

    /// @brief Bind into an arena owned by the returned set.
    support::Expected<ArgumentSet> bind(InputProvider &inputs) const;

    /// @brief Bind into @p arena, which must outlive the returned set.
    support::Expected<ArgumentSet> bind(InputProvider &inputs, support::Arena &arena) const;

    [[nodiscard]] const schema::FunctionSpec &function() const noexcept
    {
        return resolver_->function();
    }

    [[nodiscard]] const ShapeResolver &resolver() const noexcept
    {
        return *resolver_;
    }

    /// @brief Release function applied to harvested buffers; null means leak.
    [[nodiscard]] ReleaseFn release() const noexcept
    {
        return release_;
    }

  private:
    ArgumentBinder(std::shared_ptr<const ShapeResolver> resolver, ReleaseFn release)
        : resolver_(std::move(resolver)), release_(release)
    {
    }

    support::Expected<void> bindInto(ArgumentSet &set,
                                     InputProvider &inputs,
                                     support::Arena &arena) const;

    std::shared_ptr<const ShapeResolver> resolver_;
    ReleaseFn release_ = nullptr;
};

/// @brief Reject signatures the native invoker cannot express.
/// @details Unsupported: devicecall, more than kMaxNativeArguments words,
///          floating element inputs passed by value, and non-element returns
///          or 16-bit float returns.
support::Expected<void> checkNativeSignature(const schema::FunctionSpec &fn);

/// @brief Render @p arg for verification output, showing up to @p limit elements.
[[nodiscard]] std::string formatArgument(const ArgumentSet &set,
                                         const BoundArgument &arg,
                                         std::size_t limit = 8);

} // namespace hat::binder

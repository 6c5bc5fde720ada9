//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/invoke/NativeCall.cpp
// Purpose: Typed dispatch table translating argument words into native calls.
// Key invariants: Every argument occupies one integer register or stack slot.
// Links: docs/codemap.md#invoke
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Native call dispatch without a foreign-function library.
/// @details Every argument the binder produces is pointer-sized and belongs
///          to the integer class: buffer addresses, pointer slots and integer
///          scalars widened to 64 bits.  Such a call is fully described by
///          its arity and the register class of its return value, so a table
///          of function-pointer casts covering arity 0..16 and four return
///          classes reaches every signature the binder accepts.  On x86-64
///          and AArch64 the cdecl, stdcall, fastcall and vectorcall
///          conventions all collapse to the platform ABI.

#include "invoke/NativeCall.hpp"

#include <array>
#include <cstring>
#include <type_traits>
#include <utility>

namespace hat::invoke
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

namespace
{

using Thunk = std::uint64_t (*)(void *, const std::uint64_t *);

template <class R, std::size_t... I>
R callWith(void *symbol, const std::uint64_t *words, std::index_sequence<I...>)
{
    using Fn = R (*)(decltype((void)I, std::uint64_t{})...);
    return reinterpret_cast<Fn>(symbol)(words[I]...);
}

template <class R, std::size_t N> std::uint64_t thunk(void *symbol, const std::uint64_t *words)
{
    if constexpr (std::is_void_v<R>)
    {
        callWith<void>(symbol, words, std::make_index_sequence<N>{});
        return 0;
    }
    else
    {
        const R result = callWith<R>(symbol, words, std::make_index_sequence<N>{});
        std::uint64_t bits = 0;
        std::memcpy(&bits, &result, sizeof(R));
        return bits;
    }
}

template <class R, std::size_t... N>
constexpr std::array<Thunk, sizeof...(N)> makeTable(std::index_sequence<N...>)
{
    return {&thunk<R, N>...};
}

constexpr std::size_t kArities = binder::kMaxNativeArguments + 1;

constexpr auto kVoidTable = makeTable<void>(std::make_index_sequence<kArities>{});
constexpr auto kIntegerTable = makeTable<std::uint64_t>(std::make_index_sequence<kArities>{});
constexpr auto kFloat32Table = makeTable<float>(std::make_index_sequence<kArities>{});
constexpr auto kFloat64Table = makeTable<double>(std::make_index_sequence<kArities>{});

} // namespace

ReturnClass returnClassOf(const schema::FunctionSpec &fn) noexcept
{
    const schema::ParameterSpec &ret = fn.returnValue;
    if (ret.logicalType == schema::LogicalType::Void)
        return ReturnClass::Void;
    switch (ret.elementType)
    {
        case schema::ElementType::Float32:
            return ReturnClass::Float32;
        case schema::ElementType::Float64:
            return ReturnClass::Float64;
        default:
            return ReturnClass::Integer;
    }
}

std::uint64_t callWords(void *symbol, std::span<const std::uint64_t> words, ReturnClass rc)
{
    const std::size_t arity = words.size();
    switch (rc)
    {
        case ReturnClass::Void:
            return kVoidTable[arity](symbol, words.data());
        case ReturnClass::Integer:
            return kIntegerTable[arity](symbol, words.data());
        case ReturnClass::Float32:
            return kFloat32Table[arity](symbol, words.data());
        case ReturnClass::Float64:
            return kFloat64Table[arity](symbol, words.data());
    }
    return 0;
}

Expected<void> call(const NativeFunction &fn, binder::ArgumentSet &args)
{
    const schema::FunctionSpec &spec = args.function();
    if (!fn.symbol)
        return makeError(ErrorKind::SymbolNotFound, "native symbol is null", spec.name);
    const auto words = args.words();
    if (words.size() > binder::kMaxNativeArguments)
        return makeError(ErrorKind::UnsupportedSignature,
                         "too many native arguments (" + std::to_string(words.size()) + ")",
                         spec.name);

    args.setReturnBits(callWords(fn.symbol, words, returnClassOf(spec)));
    return {};
}

Expected<void> callAndHarvest(const NativeFunction &fn, binder::ArgumentSet &args)
{
    if (auto ok = call(fn, args); !ok)
        return ok;
    return args.harvest();
}

} // namespace hat::invoke

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/ArgumentBinder.cpp
// Purpose: Implement argument binding, including the two-phase protocol for
//          outputs the callee allocates.
// Key invariants: Arguments bind left to right so size expressions only see
//                 values bound before them.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument binding for native calls.
/// @details Each parameter's passing mode decides its storage:
///          - buffer pointer: arena storage sized to the resolved span, filled
///            from the provider unless the parameter is output-only;
///          - output pointer: a zeroed pointer slot the callee fills;
///          - by value: a scalar from the provider;
///          - element pointer: one element of arena storage.
///          Integer scalars (elements, and affine arrays with an empty shape)
///          are recorded in the environment size expressions evaluate in.

#include "binder/ArgumentBinder.hpp"

#include "common/IntegerHelpers.hpp"
#include "schema/SchemaValidate.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <utility>

namespace hat::binder
{

using schema::LogicalType;
using schema::ParameterSpec;
using schema::PassingMode;
using schema::Usage;
using support::ErrorKind;
using support::Expected;
using support::makeError;
using support::makeWarning;

namespace
{

/// Initial block size of arenas owned by standalone argument sets.
constexpr std::size_t kStandaloneArenaBytes = 64 * 1024;

/// @brief True when @p param's value can feed a size expression.
bool recordsSize(const ParameterSpec &param)
{
    if (!schema::isInteger(param.elementType))
        return false;
    return param.logicalType == LogicalType::Element ||
           (param.logicalType == LogicalType::AffineArray && param.shape.empty());
}

/// @brief Pointer to the first datum of a PreBound argument.
const std::byte *firstElement(const BoundArgument &arg, const PreBound &bound)
{
    const auto offset = static_cast<std::size_t>(arg.shape.offset);
    return bound.data + offset * schema::elementSize(arg.param->elementType);
}

} // namespace

//===----------------------------------------------------------------------===//
// Signature checks
//===----------------------------------------------------------------------===//

Expected<void> checkNativeSignature(const schema::FunctionSpec &fn)
{
    auto unsupported = [&fn](std::string message, std::string parameter = {})
    {
        return makeError(
            ErrorKind::UnsupportedSignature, std::move(message), fn.name, std::move(parameter));
    };

    if (fn.callingConvention == schema::CallingConvention::DeviceCall)
        return unsupported("devicecall functions cannot be invoked on the host");

    std::size_t words = 0;
    for (const auto &param : fn.arguments)
    {
        const PassingMode mode = schema::passingMode(param);
        if (mode == PassingMode::None)
            continue;
        ++words;
        if (mode == PassingMode::ByValue && !schema::isInteger(param.elementType))
            return unsupported("floating-point scalars cannot be passed by value", param.name);
    }
    if (words > kMaxNativeArguments)
        return unsupported("function takes " + std::to_string(words) +
                           " native arguments; at most " + std::to_string(kMaxNativeArguments) +
                           " are supported");

    const ParameterSpec &ret = fn.returnValue;
    if (ret.logicalType == LogicalType::Void)
        return {};
    if (ret.logicalType != LogicalType::Element)
        return unsupported("only scalar values can be returned", ret.name);
    if (ret.elementType == schema::ElementType::Float16 ||
        ret.elementType == schema::ElementType::BFloat16)
        return unsupported("16-bit floating-point returns are not supported", ret.name);
    return {};
}

//===----------------------------------------------------------------------===//
// ArgumentSet
//===----------------------------------------------------------------------===//

ArgumentSet::ArgumentSet(std::shared_ptr<const ShapeResolver> resolver, ReleaseFn release)
    : resolver_(std::move(resolver)), release_(release)
{
}

ArgumentSet::ArgumentSet(ArgumentSet &&other) noexcept
    : resolver_(std::move(other.resolver_)),
      release_(other.release_),
      ownedArena_(std::move(other.ownedArena_)),
      arguments_(std::move(other.arguments_)),
      words_(std::move(other.words_)),
      inputEnv_(std::move(other.inputEnv_)),
      callEnv_(std::move(other.callEnv_)),
      returnValue_(other.returnValue_)
{
    other.arguments_.clear();
}

ArgumentSet &ArgumentSet::operator=(ArgumentSet &&other) noexcept
{
    if (this == &other)
        return *this;
    recycle();
    resolver_ = std::move(other.resolver_);
    release_ = other.release_;
    ownedArena_ = std::move(other.ownedArena_);
    arguments_ = std::move(other.arguments_);
    words_ = std::move(other.words_);
    inputEnv_ = std::move(other.inputEnv_);
    callEnv_ = std::move(other.callEnv_);
    returnValue_ = other.returnValue_;
    other.arguments_.clear();
    return *this;
}

ArgumentSet::~ArgumentSet()
{
    recycle();
}

const BoundArgument *ArgumentSet::find(std::string_view name) const
{
    const auto it = std::find_if(arguments_.begin(),
                                 arguments_.end(),
                                 [name](const BoundArgument &arg) { return arg.param->name == name; });
    return it == arguments_.end() ? nullptr : &*it;
}

std::size_t ArgumentSet::footprint() const noexcept
{
    std::size_t total = 0;
    for (const auto &arg : arguments_)
    {
        if (const auto *bound = std::get_if<PreBound>(&arg.state))
            total += bound->bytes;
    }
    return total;
}

std::span<const std::byte> ArgumentSet::bytes(std::string_view name) const
{
    const BoundArgument *arg = find(name);
    if (!arg)
        return {};
    if (const auto *bound = std::get_if<PreBound>(&arg->state))
        return {bound->data, bound->bytes};
    if (const auto *pending = std::get_if<PendingCalleeAllocated>(&arg->state))
    {
        if (!pending->harvested || *pending->slot == nullptr)
            return {};
        return {static_cast<const std::byte *>(*pending->slot), arg->shape.bytes};
    }
    return {};
}

void ArgumentSet::rebuildWords()
{
    words_.clear();
    for (const auto &arg : arguments_)
    {
        if (const auto *bound = std::get_if<PreBound>(&arg.state))
            words_.push_back(reinterpret_cast<std::uintptr_t>(bound->data));
        else if (const auto *pending = std::get_if<PendingCalleeAllocated>(&arg.state))
            words_.push_back(reinterpret_cast<std::uintptr_t>(pending->slot));
        else if (const auto *scalar = std::get_if<Scalar>(&arg.state))
            words_.push_back(scalar->value.registerWord());
    }
}

void ArgumentSet::setReturnBits(std::uint64_t raw) noexcept
{
    const ParameterSpec &ret = function().returnValue;
    if (ret.logicalType == LogicalType::Void)
    {
        returnValue_.reset();
        return;
    }
    const auto width = static_cast<int>(schema::elementSize(ret.elementType) * 8);
    returnValue_ = ScalarValue{ret.elementType, raw & common::integer::detail::mask_for(width)};
}

Expected<void> ArgumentSet::harvest()
{
    schema::SizeEnvironment env = inputEnv_;
    for (const auto &arg : arguments_)
    {
        if (arg.param->usage == Usage::Input || !recordsSize(*arg.param))
            continue;
        if (const auto *bound = std::get_if<PreBound>(&arg.state))
            env.insert_or_assign(arg.param->name,
                                 loadScalar(firstElement(arg, *bound), arg.param->elementType)
                                     .toInteger());
    }

    for (std::size_t i = 0; i < arguments_.size(); ++i)
    {
        BoundArgument &arg = arguments_[i];
        auto *pending = std::get_if<PendingCalleeAllocated>(&arg.state);
        if (!pending)
            continue;

        auto shape = resolver_->resolveAfterCall(i, env);
        if (!shape)
            return shape.takeError();
        if (*pending->slot == nullptr && shape.value().count > 0)
            return makeError(ErrorKind::ShapeMismatch,
                             "callee reported " + std::to_string(shape.value().count) +
                                 " elements but returned no buffer",
                             function().name,
                             arg.param->name);
        arg.shape = std::move(shape.value());
        pending->harvested = true;
    }

    callEnv_ = std::move(env);
    return {};
}

/// @brief Release callee-allocated outputs and clear their slots.
/// @details Without a release function the buffers are leaked, which is the
///          documented Leak policy for undeclared ownership.
void ArgumentSet::recycle() noexcept
{
    for (auto &arg : arguments_)
    {
        auto *pending = std::get_if<PendingCalleeAllocated>(&arg.state);
        if (!pending)
            continue;
        if (*pending->slot != nullptr && release_)
            release_(*pending->slot);
        *pending->slot = nullptr;
        pending->harvested = false;
        arg.shape = ResolvedShape{};
        arg.shape.deferred = true;
    }
    returnValue_.reset();
}

//===----------------------------------------------------------------------===//
// ArgumentBinder
//===----------------------------------------------------------------------===//

Expected<ArgumentBinder> ArgumentBinder::create(const schema::FunctionSpec &fn,
                                                BinderOptions options)
{
    if (auto valid = schema::validateFunction(fn); !valid)
        return valid.takeError();
    if (auto ok = checkNativeSignature(fn); !ok)
        return ok.takeError();

    auto resolver = ShapeResolver::create(fn);
    if (!resolver)
        return resolver.takeError();

    const auto callee =
        std::find_if(fn.arguments.begin(), fn.arguments.end(), schema::isCalleeAllocated);
    ReleaseFn release = options.release;
    if (callee != fn.arguments.end())
    {
        if (fn.outputRelease)
        {
            if (*fn.outputRelease == schema::kReleaseWithFree && !release)
                release = &std::free;
            else if (!release)
                return makeError(ErrorKind::SymbolNotFound,
                                 "release function '" + *fn.outputRelease + "' was not resolved",
                                 fn.name,
                                 callee->name);
        }
        else
        {
            auto diag = makeWarning(ErrorKind::UnspecifiedOwnership,
                                    "package declares no release convention for callee-allocated "
                                    "output; buffers will not be freed",
                                    fn.name,
                                    callee->name);
            if (options.unspecifiedOwnership == OwnershipPolicy::Reject)
            {
                diag.severity = support::Severity::Error;
                diag.message = "package declares no release convention for callee-allocated "
                               "output";
                return diag;
            }
            if (options.diags)
                options.diags->report(std::move(diag));
            release = nullptr;
        }
    }

    return ArgumentBinder(
        std::make_shared<const ShapeResolver>(std::move(resolver.value())), release);
}

Expected<ArgumentSet> ArgumentBinder::bind(InputProvider &inputs) const
{
    ArgumentSet set(resolver_, release_);
    set.ownedArena_ = std::make_unique<support::Arena>(kStandaloneArenaBytes);
    if (auto ok = bindInto(set, inputs, *set.ownedArena_); !ok)
        return ok.takeError();
    return std::move(set);
}

Expected<ArgumentSet> ArgumentBinder::bind(InputProvider &inputs, support::Arena &arena) const
{
    ArgumentSet set(resolver_, release_);
    if (auto ok = bindInto(set, inputs, arena); !ok)
        return ok.takeError();
    return std::move(set);
}

/// @brief Pre-call phase of binding.
/// @details Resolves and binds each argument in call order.  Supplied arrays
///          must match the parameter's element type and cover exactly the
///          resolved storage span.
Expected<void> ArgumentBinder::bindInto(ArgumentSet &set,
                                        InputProvider &inputs,
                                        support::Arena &arena) const
{
    const schema::FunctionSpec &fn = resolver_->function();
    schema::SizeEnvironment &env = set.inputEnv_;
    set.arguments_.reserve(fn.arguments.size());

    auto allocate = [&](const ParameterSpec &param, std::size_t bytes, std::size_t align)
        -> Expected<std::byte *>
    {
        std::byte *data = arena.allocate(bytes, align);
        if (!data)
            return makeError(ErrorKind::InvalidSchema,
                             "cannot allocate " + std::to_string(bytes) + " bytes",
                             fn.name,
                             param.name);
        return data;
    };

    auto takeScalar = [&](const ParameterSpec &param) -> Expected<ScalarValue>
    {
        auto value = inputs.scalarInput(fn, param);
        if (!value)
            return value;
        if (value.value().type != param.elementType)
            return makeError(ErrorKind::ElementTypeMismatch,
                             "supplied " + std::string(schema::toString(value.value().type)) +
                                 " value for a " + std::string(schema::toString(param.elementType)) +
                                 " parameter",
                             fn.name,
                             param.name);
        return value;
    };

    for (std::size_t i = 0; i < fn.arguments.size(); ++i)
    {
        const ParameterSpec &param = fn.arguments[i];
        auto resolved = resolver_->resolve(i, env);
        if (!resolved)
            return resolved.takeError();

        BoundArgument arg;
        arg.param = &param;
        arg.shape = std::move(resolved.value());

        switch (schema::passingMode(param))
        {
            case PassingMode::BufferPointer:
            {
                auto data = allocate(param, arg.shape.bytes, support::kBufferAlignment);
                if (!data)
                    return data.takeError();
                PreBound bound{data.value(), arg.shape.bytes};

                if (param.usage != Usage::Output)
                {
                    auto view = inputs.arrayInput(fn, param, arg.shape);
                    if (!view)
                        return view.takeError();
                    const InputView &in = view.value();
                    if (in.type != param.elementType)
                        return makeError(ErrorKind::ElementTypeMismatch,
                                         "supplied " + std::string(schema::toString(in.type)) +
                                             " data for a " +
                                             std::string(schema::toString(param.elementType)) +
                                             " parameter",
                                         fn.name,
                                         param.name);
                    if (in.elements != arg.shape.storageElements)
                        return makeError(ErrorKind::ShapeMismatch,
                                         "supplied " + std::to_string(in.elements) +
                                             " elements but the resolved shape needs " +
                                             std::to_string(arg.shape.storageElements),
                                         fn.name,
                                         param.name);
                    if (arg.shape.bytes)
                        std::memcpy(bound.data, in.data, arg.shape.bytes);

                    if (recordsSize(param) && arg.shape.storageElements > 0)
                        env.insert_or_assign(
                            param.name,
                            loadScalar(firstElement(arg, bound), param.elementType).toInteger());
                }
                arg.state = bound;
                break;
            }

            case PassingMode::OutputPointer:
            {
                auto slot = allocate(param, sizeof(void *), alignof(void *));
                if (!slot)
                    return slot.takeError();
                arg.state = PendingCalleeAllocated{reinterpret_cast<void **>(slot.value()), false};
                break;
            }

            case PassingMode::ByValue:
            {
                auto value = takeScalar(param);
                if (!value)
                    return value.takeError();
                if (recordsSize(param))
                    env.insert_or_assign(param.name, value.value().toInteger());
                arg.state = Scalar{value.value()};
                break;
            }

            case PassingMode::ElementPointer:
            {
                auto data = allocate(param, arg.shape.bytes, support::kBufferAlignment);
                if (!data)
                    return data.takeError();
                if (param.usage == Usage::InputOutput)
                {
                    auto value = takeScalar(param);
                    if (!value)
                        return value.takeError();
                    storeBits(data.value(), param.elementType, value.value().bits);
                    if (recordsSize(param))
                        env.insert_or_assign(param.name, value.value().toInteger());
                }
                arg.state = PreBound{data.value(), arg.shape.bytes};
                break;
            }

            case PassingMode::None:
                continue;
        }

        set.arguments_.push_back(std::move(arg));
    }

    set.callEnv_ = env;
    set.rebuildWords();
    return {};
}

//===----------------------------------------------------------------------===//
// Rendering
//===----------------------------------------------------------------------===//

std::string formatArgument(const ArgumentSet &set, const BoundArgument &arg, std::size_t limit)
{
    const ParameterSpec &param = *arg.param;
    std::ostringstream os;
    os << param.name << " (" << schema::toString(param.usage) << ' '
       << schema::toString(param.elementType);

    if (const auto *scalar = std::get_if<Scalar>(&arg.state))
    {
        os << "): " << formatScalar(scalar->value);
        return os.str();
    }

    const auto raw = set.bytes(param.name);
    const std::size_t elemSize = schema::elementSize(param.elementType);
    const std::size_t total = raw.size() / elemSize;
    if (std::holds_alternative<PendingCalleeAllocated>(arg.state) &&
        !std::get<PendingCalleeAllocated>(arg.state).harvested)
    {
        os << "): <pending>";
        return os.str();
    }

    os << '[' << total << "]): [";
    const std::size_t shown = std::min(total, limit);
    for (std::size_t i = 0; i < shown; ++i)
    {
        if (i)
            os << ", ";
        os << formatScalar(loadScalar(raw.data() + i * elemSize, param.elementType));
    }
    if (shown < total)
        os << ", ...";
    os << ']';
    return os.str();
}

} // namespace hat::binder

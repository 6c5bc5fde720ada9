//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/InputProvider.hpp
// Purpose: Declares the source of input values the argument binder consumes.
// Key invariants: Views returned by a provider stay valid until the next call
//                 into the same provider.
// Ownership/Lifetime: Providers own the data behind the views they return;
//                     the binder copies it into argument storage.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#pragma once

#include "binder/ElementCodec.hpp"
#include "binder/ShapeResolver.hpp"
#include "schema/FunctionSpec.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace hat::binder
{

/// @brief Borrowed view of supplied array contents.
struct InputView
{
    schema::ElementType type = schema::ElementType::Float32;
    const std::byte *data = nullptr;
    std::size_t elements = 0; ///< Element count, compared against the storage span.
};

/// @brief Supplies input and input_output values to the argument binder.
/// @details The binder asks once per parameter, in call order.  It never
///          invents input values itself.
class InputProvider
{
  public:
    virtual ~InputProvider() = default;

    /// @brief Contents for an input or input_output array parameter.
    /// @param fn Function being bound.
    /// @param param Parameter being bound.
    /// @param shape Resolved layout the data must cover.
    virtual support::Expected<InputView> arrayInput(const schema::FunctionSpec &fn,
                                                    const schema::ParameterSpec &param,
                                                    const ResolvedShape &shape) = 0;

    /// @brief Value for an input or input_output element parameter.
    virtual support::Expected<ScalarValue> scalarInput(const schema::FunctionSpec &fn,
                                                       const schema::ParameterSpec &param) = 0;
};

/// @brief Provider backed by caller-supplied fixtures keyed by parameter name.
/// @details Missing fixtures are a ShapeMismatch naming the parameter, since
///          no data of any shape was supplied.
class SuppliedInputs final : public InputProvider
{
  public:
    /// @brief Register array contents for parameter @p name.
    template <class T> void setArray(std::string name, const std::vector<T> &values);

    /// @brief Register raw array contents of @p type for parameter @p name.
    void setArrayBytes(std::string name,
                       schema::ElementType type,
                       std::vector<std::byte> bytes,
                       std::size_t elements);

    /// @brief Register a scalar for parameter @p name.
    void setScalar(std::string name, ScalarValue value);

    support::Expected<InputView> arrayInput(const schema::FunctionSpec &fn,
                                            const schema::ParameterSpec &param,
                                            const ResolvedShape &shape) override;

    support::Expected<ScalarValue> scalarInput(const schema::FunctionSpec &fn,
                                               const schema::ParameterSpec &param) override;

  private:
    struct ArrayFixture
    {
        schema::ElementType type;
        std::vector<std::byte> bytes;
        std::size_t elements;
    };

    std::map<std::string, ArrayFixture, std::less<>> arrays_;
    std::map<std::string, ScalarValue, std::less<>> scalars_;
};

namespace detail
{
template <class T> constexpr schema::ElementType elementTypeOf();
template <> constexpr schema::ElementType elementTypeOf<std::int8_t>()
{
    return schema::ElementType::Int8;
}
template <> constexpr schema::ElementType elementTypeOf<std::int16_t>()
{
    return schema::ElementType::Int16;
}
template <> constexpr schema::ElementType elementTypeOf<std::int32_t>()
{
    return schema::ElementType::Int32;
}
template <> constexpr schema::ElementType elementTypeOf<std::int64_t>()
{
    return schema::ElementType::Int64;
}
template <> constexpr schema::ElementType elementTypeOf<std::uint8_t>()
{
    return schema::ElementType::UInt8;
}
template <> constexpr schema::ElementType elementTypeOf<std::uint16_t>()
{
    return schema::ElementType::UInt16;
}
template <> constexpr schema::ElementType elementTypeOf<std::uint32_t>()
{
    return schema::ElementType::UInt32;
}
template <> constexpr schema::ElementType elementTypeOf<std::uint64_t>()
{
    return schema::ElementType::UInt64;
}
template <> constexpr schema::ElementType elementTypeOf<float>()
{
    return schema::ElementType::Float32;
}
template <> constexpr schema::ElementType elementTypeOf<double>()
{
    return schema::ElementType::Float64;
}
} // namespace detail

template <class T> void SuppliedInputs::setArray(std::string name, const std::vector<T> &values)
{
    std::vector<std::byte> bytes(values.size() * sizeof(T));
    if (!values.empty())
        std::memcpy(bytes.data(), values.data(), bytes.size());
    setArrayBytes(std::move(name), detail::elementTypeOf<T>(), std::move(bytes), values.size());
}

} // namespace hat::binder

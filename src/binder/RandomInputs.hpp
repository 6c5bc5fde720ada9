//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/binder/RandomInputs.hpp
// Purpose: InputProvider that fabricates finite random inputs for benchmarks.
// Key invariants: Floating values lie in [0, 1); never NaN or infinity.
// Ownership/Lifetime: Views point into a scratch buffer reused by the next call.
// Links: docs/codemap.md#binder
//
//===----------------------------------------------------------------------===//

#pragma once

#include "binder/InputProvider.hpp"

#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace hat::binder
{

/// @brief Default values drawn for dimension parameters.
inline const std::vector<long long> kDefaultDimensionChoices = {128, 256, 1234};

/// @brief Random input generator used to fill working-set replicas.
/// @details Integer scalars that size an input runtime array are dimensions
///          and are drawn from a small set of choices; other integers are
///          small and non-negative; floating values are uniform in [0, 1).
class RandomInputs final : public InputProvider
{
  public:
    /// @brief Seed the generator; 0 draws a seed from std::random_device.
    explicit RandomInputs(std::uint64_t seed = 0,
                          std::vector<long long> dimensionChoices = kDefaultDimensionChoices);

    support::Expected<InputView> arrayInput(const schema::FunctionSpec &fn,
                                            const schema::ParameterSpec &param,
                                            const ResolvedShape &shape) override;

    support::Expected<ScalarValue> scalarInput(const schema::FunctionSpec &fn,
                                               const schema::ParameterSpec &param) override;

    /// @brief Exclusive upper bound of non-dimension integers.
    static constexpr long long kIntegerBound = 8;

  private:
    /// @brief True when @p name sizes an input runtime array of @p fn.
    bool isDimension(const schema::FunctionSpec &fn, const std::string &name);

    /// @brief Draw one value of @p type; @p dimension selects the dimension choices.
    ScalarValue randomScalar(schema::ElementType type, bool dimension);

    std::mt19937_64 engine_;
    std::vector<long long> dimensionChoices_;
    std::vector<std::byte> scratch_;

    const schema::FunctionSpec *cachedFor_ = nullptr;
    std::string cachedName_;
    std::set<std::string, std::less<>> dimensions_;
};

} // namespace hat::binder

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/WorkingSet.cpp
// Purpose: Size and bind the working set of argument replicas.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include "bench/WorkingSet.hpp"

#include "common/IntegerHelpers.hpp"

#include <utility>
#include <variant>

namespace hat::bench
{

using support::ErrorKind;
using support::Expected;

namespace
{

/// @brief Arena bytes one replica shaped like @p set needs.
std::size_t reservationFor(const binder::ArgumentSet &set)
{
    std::size_t total = 0;
    for (const auto &arg : set.arguments())
    {
        if (const auto *bound = std::get_if<binder::PreBound>(&arg.state))
            total += support::Arena::reservationFor(bound->bytes);
        else if (std::holds_alternative<binder::PendingCalleeAllocated>(arg.state))
            total += support::Arena::reservationFor(sizeof(void *), alignof(void *));
    }
    return total;
}

} // namespace

std::size_t replicaCountFor(std::size_t workingSetBytes, std::size_t footprint) noexcept
{
    if (workingSetBytes == 0 || footprint == 0)
        return 1;
    return workingSetBytes / footprint + (workingSetBytes % footprint != 0 ? 1 : 0);
}

WorkingSet &WorkingSet::operator=(WorkingSet &&other) noexcept
{
    if (this != &other)
    {
        slots_.clear();
        arena_ = std::move(other.arena_);
        footprint_ = other.footprint_;
        slots_ = std::move(other.slots_);
    }
    return *this;
}

Expected<WorkingSet> WorkingSet::build(const binder::ArgumentBinder &binder,
                                       binder::InputProvider &inputs,
                                       std::size_t workingSetBytes)
{
    std::size_t footprint = 0;
    std::size_t perReplica = 0;
    {
        auto trial = binder.bind(inputs);
        if (!trial)
            return trial.takeError();
        footprint = trial.value().footprint();
        perReplica = reservationFor(trial.value());
    }

    const std::size_t count = replicaCountFor(workingSetBytes, footprint);
    const auto arenaBytes = common::integer::checkedMulSize(count, perReplica);
    if (!arenaBytes)
        return support::makeError(ErrorKind::InvalidOption,
                                  "working set of " + std::to_string(count) +
                                      " replicas does not fit in memory",
                                  binder.function().name);

    WorkingSet ws(support::Arena(*arenaBytes), footprint);
    ws.slots_.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        auto set = binder.bind(inputs, ws.arena_);
        if (!set)
            return set.takeError();
        ws.slots_.push_back(std::move(set.value()));
    }
    return std::move(ws);
}

} // namespace hat::bench

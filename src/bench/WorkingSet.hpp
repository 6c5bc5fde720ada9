//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/WorkingSet.hpp
// Purpose: Declares the rotating set of argument replicas a session calls
//          the native function with.
// Key invariants: Slot k of a call sequence is slots[k mod replicaCount()];
//                 with more than one replica no slot is used twice in a row.
// Ownership/Lifetime: Owns one arena holding every replica's buffers and the
//                     argument sets that view it; exclusive to one session.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#pragma once

#include "binder/ArgumentBinder.hpp"
#include "binder/InputProvider.hpp"
#include "support/arena.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace hat::bench
{

/// @brief Number of replicas needed so their combined footprint reaches
///        @p workingSetBytes; at least 1, and 1 when either size is 0.
[[nodiscard]] std::size_t replicaCountFor(std::size_t workingSetBytes,
                                          std::size_t footprint) noexcept;

/// @brief Arena of fully bound argument sets used in rotation.
/// @details Replicas are bound up front so the measured loop never
///          allocates; rotating through more data than the caches hold keeps
///          each call from hitting lines a previous call left warm.
class WorkingSet
{
  public:
    /// @brief Bind enough replicas to cover @p workingSetBytes.
    /// @details A trial binding determines the per-call footprint and the
    ///          arena reservation; the trial set is then discarded and every
    ///          replica is bound with fresh inputs into one arena.
    static support::Expected<WorkingSet> build(const binder::ArgumentBinder &binder,
                                               binder::InputProvider &inputs,
                                               std::size_t workingSetBytes);

    WorkingSet(WorkingSet &&) noexcept = default;
    /// @brief Release this set's pending callee buffers before its arena goes.
    WorkingSet &operator=(WorkingSet &&other) noexcept;
    WorkingSet(const WorkingSet &) = delete;
    WorkingSet &operator=(const WorkingSet &) = delete;

    [[nodiscard]] std::size_t replicaCount() const noexcept
    {
        return slots_.size();
    }

    /// @brief Footprint of the trial binding in bytes.
    [[nodiscard]] std::size_t footprint() const noexcept
    {
        return footprint_;
    }

    /// @brief Replica used by call number @p sequence.
    binder::ArgumentSet &slot(std::uint64_t sequence) noexcept
    {
        return slots_[static_cast<std::size_t>(sequence % slots_.size())];
    }

    /// @brief Arena holding the replicas' buffers.
    [[nodiscard]] const support::Arena &arena() const noexcept
    {
        return arena_;
    }

  private:
    WorkingSet(support::Arena arena, std::size_t footprint)
        : arena_(std::move(arena)), footprint_(footprint)
    {
    }

    // slots_ points into arena_ and must be destroyed first.
    support::Arena arena_;
    std::size_t footprint_ = 0;
    std::vector<binder::ArgumentSet> slots_;
};

} // namespace hat::bench

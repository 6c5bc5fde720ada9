// File: src/support/arena.cpp
// License: GNU GPL v3 (c) The Hatrun Project Authors. See LICENSE in the
//          project root for details.
// Purpose: Implement the bump-pointer arena that backs bound argument buffers
//          and benchmark replicas.
// Key invariants: Allocation cursors never exceed block bounds and alignment
//                 requests must be non-zero powers of two.
// Ownership/Lifetime: Arena owns its blocks; allocations stay valid until the
//                     arena is destroyed.
// Links: docs/codemap.md#support

/// @file
/// @brief Defines the `hat::support::Arena` bump allocator implementation.
/// @details A working set allocates every replica's buffers up front and
///          keeps them for the whole session, so value-initialised blocks
///          with a bump cursor are all the allocator needs.  Working sets
///          size the first block to hold every replica; other users start
///          small and let the arena append blocks.  No allocation happens
///          inside the measured loop.

#include "support/arena.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace hat::support
{
/// @brief Construct an arena whose first block has @p size bytes.
///
/// @details Blocks are value-initialised, so every allocation starts out
///          zero-filled.  Output buffers therefore hold defined contents even
///          before a native call writes them.
///
/// @param size Number of bytes reserved for the first block.
Arena::Arena(std::size_t size) : blockSize_(size)
{
    if (size)
        addBlock(size);
}

void Arena::addBlock(std::size_t size)
{
    Block block;
    block.data = std::make_unique<std::byte[]>(size);
    block.size = size;
    blocks_.push_back(std::move(block));
}

/// @brief Carve an aligned slice out of one block.
///
/// @details Allocation proceeds in a handful of steps:
///          1. Compute the aligned pointer relative to the block's base while
///             guarding every arithmetic operation against overflow.
///          2. Ensure the new allocation fits inside the block.
///          3. Advance the bump pointer and return the aligned slice.
///          Failure at any stage returns @c nullptr without mutating state.
std::byte *Arena::allocateIn(Block &block, std::size_t size, std::size_t align)
{
    const std::size_t current = block.offset;
    const std::uintptr_t base = reinterpret_cast<std::uintptr_t>(block.data.get());
    if (current > std::numeric_limits<std::uintptr_t>::max() - base)
        return nullptr;

    const std::uintptr_t current_ptr = base + current;
    const std::uintptr_t mask = static_cast<std::uintptr_t>(align - 1);

    if (current_ptr > std::numeric_limits<std::uintptr_t>::max() - mask)
        return nullptr;

    const std::uintptr_t aligned_ptr = (current_ptr + mask) & ~mask;
    const std::size_t adjustment = static_cast<std::size_t>(aligned_ptr - current_ptr);

    if (adjustment > std::numeric_limits<std::size_t>::max() - current)
        return nullptr;

    const std::size_t aligned_offset = current + adjustment;

    if (aligned_offset > block.size || size > block.size - aligned_offset)
        return nullptr;

    block.offset = aligned_offset + size;
    return block.data.get() + aligned_offset;
}

/// @brief Allocate memory from the arena honoring the requested alignment.
///
/// @details The newest block is tried first.  When it cannot hold the
///          request a block of at least the configured block size, and large
///          enough for @p size at worst-case alignment, is appended.  A
///          zero-byte request succeeds and returns an aligned pointer that
///          must not be dereferenced.
///
/// @param size Number of bytes to allocate from the arena.
/// @param align Alignment requirement in bytes; must be a non-zero power of two.
/// @return Pointer to aligned memory on success, or nullptr on failure.
std::byte *Arena::allocate(std::size_t size, std::size_t align)
{
    if (align == 0 || (align & (align - 1)) != 0)
        return nullptr;

    if (!blocks_.empty())
    {
        if (std::byte *ptr = allocateIn(blocks_.back(), size, align))
            return ptr;
    }

    if (size > std::numeric_limits<std::size_t>::max() - align)
        return nullptr;
    addBlock(std::max(blockSize_, reservationFor(size, align)));
    return allocateIn(blocks_.back(), size, align);
}

std::size_t Arena::capacity() const noexcept
{
    std::size_t total = 0;
    for (const auto &block : blocks_)
        total += block.size;
    return total;
}

std::size_t Arena::used() const noexcept
{
    std::size_t total = 0;
    for (const auto &block : blocks_)
        total += block.offset;
    return total;
}

/// @brief Upper bound on the bytes needed to serve one request of @p size.
/// @details Adds the worst-case alignment padding so callers can size an
///          arena by summing reservations of every buffer it will hold.
std::size_t Arena::reservationFor(std::size_t size, std::size_t align) noexcept
{
    return size + align;
}
} // namespace hat::support

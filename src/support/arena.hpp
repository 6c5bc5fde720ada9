//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/arena.hpp
// Purpose: Declares the bump allocator that backs argument and replica buffers.
// Key invariants: Allocations never move and are zero-filled on first use.
//                 Blocks are only added, never reallocated.
// Ownership/Lifetime: Arena owns all allocated memory.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace hat::support
{

/// @brief Alignment used for every argument buffer handed to native code.
/// @details One cache line; also satisfies every SIMD load the kernels we
///          benchmark are compiled for.
inline constexpr std::size_t kBufferAlignment = 64;

/// @brief Simple bump allocator for argument buffers.
///
/// Uses contiguous blocks and a bump-pointer strategy to satisfy allocation
/// requests. Each call to allocate() advances the current position in the
/// newest block by the requested size and alignment; when the block is full a
/// new one is appended, so earlier allocations never move. Individual
/// allocations cannot be freed; the storage is released when the arena is
/// destroyed.
/// @invariant Allocations are not individually freed.
/// @ownership Owns its internal blocks.
class Arena
{
  public:
    /// @brief Create arena whose first block holds @p size bytes.
    /// @param size Capacity of the first block and minimum size of later ones.
    explicit Arena(std::size_t size);

    Arena(const Arena &) = delete;
    Arena &operator=(const Arena &) = delete;
    Arena(Arena &&) noexcept = default;
    Arena &operator=(Arena &&) noexcept = default;

    /// @brief Allocate @p size bytes with alignment @p align.
    /// @param size Number of bytes to allocate.
    /// @param align Alignment requirement.
    /// @return Pointer to allocated memory or nullptr on failure.
    /// @notes Fails if @p align is zero or not a power of two, or if a new
    ///        block cannot be sized without overflow.
    std::byte *allocate(std::size_t size, std::size_t align = kBufferAlignment);

    /// @brief Total bytes owned by the arena.
    [[nodiscard]] std::size_t capacity() const noexcept;

    /// @brief Bytes consumed so far, including alignment padding.
    [[nodiscard]] std::size_t used() const noexcept;

    /// @brief Number of blocks; 1 while the first block has sufficed.
    [[nodiscard]] std::size_t blockCount() const noexcept
    {
        return blocks_.size();
    }

    /// @brief Bytes an arena needs to serve @p size bytes at worst-case alignment.
    [[nodiscard]] static std::size_t reservationFor(std::size_t size,
                                                    std::size_t align = kBufferAlignment) noexcept;

  private:
    struct Block
    {
        /// Backing storage; owned by the arena.
        std::unique_ptr<std::byte[]> data;
        /// Capacity of data in bytes.
        std::size_t size = 0;
        /// Offset within data for the next allocation.
        std::size_t offset = 0;
    };

    /// @brief Try to carve @p size bytes out of @p block.
    static std::byte *allocateIn(Block &block, std::size_t size, std::size_t align);

    /// @brief Append a zero-filled block of @p size bytes.
    void addBlock(std::size_t size);

    std::vector<Block> blocks_;
    /// Minimum size of blocks appended after the first.
    std::size_t blockSize_ = 0;
};
} // namespace hat::support

//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/NativeKernels.hpp
// Purpose: Declare the C kernels compiled into the shared test library.
// Key invariants: Every kernel has C linkage and a signature expressible by
//                 package metadata.
// Ownership/Lifetime: Buffers returned through T** are malloc'd; Range
//                     variants document their release convention.
// Links: docs/codemap.md#tests
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

extern "C"
{
    /// @brief Leaves @p data untouched; an input_output identity.
    void identity_f32(std::int64_t n, float *data);

    /// @brief Doubles every element of @p data in place.
    void scale_f32(std::int64_t n, float *data);

    /// @brief Copies @p n floats from @p in to @p out.
    void copy_f32(std::int64_t n, const float *in, float *out);

    /// @brief Records the address of @p data; see touched_count().
    void touch_f32(const float *data);

    std::size_t touched_count();
    const void *touched_address(std::size_t index);
    void touched_reset();

    /// @brief Sleeps for one millisecond.
    void sleep_1ms();

    /// @brief Returns a + b.
    std::int32_t add_i32(std::int32_t a, std::int32_t b);

    /// @brief Returns the sum of @p n int64 values.
    std::int64_t sum_i64(std::int64_t n, const std::int64_t *data);

    /// @brief Returns the mean of @p n floats.
    float mean_f32(std::int64_t n, const float *data);

    /// @brief Returns the dot product of two double vectors.
    double dot_f64(std::int64_t n, const double *a, const double *b);

    /// @brief Writes n * n into @p square.
    void square_i64(std::int64_t n, std::int64_t *square);

    /// @brief C = A * B for row-major 64x64 float matrices.
    void matmul_64_f32(const float *a, const float *b, float *c);

    /// @brief Allocates [start, limit) stepping by delta with malloc.
    /// @details Guards random inputs: a zero delta becomes 1 and an empty
    ///          range becomes 25 elements.
    void Range(const std::int32_t *start,
               const std::int32_t *limit,
               const std::int32_t *delta,
               std::int32_t **output,
               std::uint32_t *output_dim);

    /// @brief Range whose buffer must be released with release_buffer().
    void RangePaired(const std::int32_t *start,
                     const std::int32_t *limit,
                     const std::int32_t *delta,
                     std::int32_t **output,
                     std::uint32_t *output_dim);

    void release_buffer(void *buffer);
    std::size_t released_count();
    void released_reset();

    /// @brief Returns a 1 x output_dim0 copy of @p data.
    void Unsqueeze(std::int64_t output_dim0,
                   const std::int64_t *data,
                   std::int64_t **expanded,
                   std::int64_t *dim0,
                   std::int64_t *dim1);

    /// @brief Terminates the process with SIGSEGV.
    void crash_now();
}

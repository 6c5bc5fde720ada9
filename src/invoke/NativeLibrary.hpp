//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/invoke/NativeLibrary.hpp
// Purpose: RAII handle over a dynamically loaded package library.
// Key invariants: A NativeLibrary either holds an open handle or is empty;
//                 symbols it returned are invalid once it closes.
// Ownership/Lifetime: Move-only; closes the handle on destruction.
// Links: docs/codemap.md#invoke
//
//===----------------------------------------------------------------------===//

#pragma once

#include "invoke/NativeCall.hpp"
#include "schema/FunctionSpec.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace hat::invoke
{

/// @brief Loaded shared library exporting package functions.
class NativeLibrary
{
  public:
    /// @brief Open the library at @p path.
    /// @return LibraryLoadFailed carrying the loader's message on failure.
    static support::Expected<NativeLibrary> open(const std::string &path);

    NativeLibrary(NativeLibrary &&other) noexcept;
    NativeLibrary &operator=(NativeLibrary &&other) noexcept;
    NativeLibrary(const NativeLibrary &) = delete;
    NativeLibrary &operator=(const NativeLibrary &) = delete;
    ~NativeLibrary();

    /// @brief Resolve @p name.
    /// @return SymbolNotFound carrying the loader's message on failure.
    [[nodiscard]] support::Expected<void *> symbol(const std::string &name) const;

    /// @brief Resolve @p fn's symbol and, when it names one, its release function.
    /// @details "free" needs no lookup; the binder maps it to the C runtime.
    [[nodiscard]] support::Expected<NativeFunction> resolve(const schema::FunctionSpec &fn) const;

    [[nodiscard]] const std::string &path() const noexcept
    {
        return path_;
    }

  private:
    NativeLibrary(void *handle, std::string path) : handle_(handle), path_(std::move(path)) {}

    void close() noexcept;

    void *handle_ = nullptr;
    std::string path_;
};

} // namespace hat::invoke

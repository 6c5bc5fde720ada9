//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/invoke/NativeLibrary.cpp
// Purpose: dlopen/dlsym wrapper used to resolve package functions.
// Links: docs/codemap.md#invoke
//
//===----------------------------------------------------------------------===//

#include "invoke/NativeLibrary.hpp"

#include <dlfcn.h>

#include <utility>

namespace hat::invoke
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

namespace
{

std::string loaderMessage(const char *fallback)
{
    const char *err = dlerror();
    return err ? err : fallback;
}

} // namespace

Expected<NativeLibrary> NativeLibrary::open(const std::string &path)
{
    dlerror();
    void *handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle)
        return makeError(ErrorKind::LibraryLoadFailed,
                         "cannot open '" + path + "': " + loaderMessage("dlopen failed"));
    return NativeLibrary(handle, path);
}

NativeLibrary::NativeLibrary(NativeLibrary &&other) noexcept
    : handle_(std::exchange(other.handle_, nullptr)), path_(std::move(other.path_))
{
}

NativeLibrary &NativeLibrary::operator=(NativeLibrary &&other) noexcept
{
    if (this != &other)
    {
        close();
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

NativeLibrary::~NativeLibrary()
{
    close();
}

void NativeLibrary::close() noexcept
{
    if (handle_)
    {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

/// @brief Resolve @p name.
/// @details A symbol may legitimately resolve to null, so failure is judged
///          by dlerror() rather than by the returned address.
Expected<void *> NativeLibrary::symbol(const std::string &name) const
{
    if (!handle_)
        return makeError(ErrorKind::SymbolNotFound, "library is not open", name);
    dlerror();
    void *sym = dlsym(handle_, name.c_str());
    if (const char *err = dlerror())
        return makeError(ErrorKind::SymbolNotFound, std::string(err), name);
    if (!sym)
        return makeError(ErrorKind::SymbolNotFound, "symbol resolved to null", name);
    return sym;
}

Expected<NativeFunction> NativeLibrary::resolve(const schema::FunctionSpec &fn) const
{
    auto sym = symbol(fn.name);
    if (!sym)
        return sym.takeError();

    NativeFunction native;
    native.symbol = sym.value();
    if (fn.outputRelease && *fn.outputRelease != schema::kReleaseWithFree)
    {
        auto release = symbol(*fn.outputRelease);
        if (!release)
        {
            auto diag = release.takeError();
            diag.function = fn.name;
            return diag;
        }
        native.release = reinterpret_cast<binder::ReleaseFn>(release.value());
    }
    return native;
}

} // namespace hat::invoke

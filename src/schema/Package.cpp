//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/schema/Package.cpp
// Purpose: Implement the package function table and its auxiliary update path.
// Links: docs/codemap.md#schema
//
//===----------------------------------------------------------------------===//

#include "schema/Package.hpp"

#include "schema/SchemaValidate.hpp"

#include <utility>

namespace hat::schema
{

using support::ErrorKind;
using support::Expected;
using support::makeError;

namespace
{

support::Diag unknownFunction(std::string_view name)
{
    return makeError(
        ErrorKind::UnknownFunction, "package has no function with this name", std::string(name));
}

} // namespace

Package::Package(std::string name) : name_(std::move(name)) {}

/// @brief Validate and append @p fn.
/// @details Functions keep their insertion order so reports list them the
///          way the package declares them.
Expected<void> Package::add(FunctionSpec fn)
{
    if (index_.find(fn.name) != index_.end())
        return makeError(ErrorKind::DuplicateFunction,
                         "package already contains a function with this name",
                         fn.name);
    if (auto ok = validateFunction(fn); !ok)
        return ok;

    index_.emplace(fn.name, functions_.size());
    functions_.push_back(std::move(fn));
    return {};
}

const FunctionSpec *Package::find(std::string_view name) const
{
    const auto it = index_.find(name);
    return it == index_.end() ? nullptr : &functions_[it->second];
}

FunctionSpec *Package::findMutable(std::string_view name)
{
    const auto it = index_.find(name);
    return it == index_.end() ? nullptr : &functions_[it->second];
}

Expected<void> Package::setAuxiliary(std::string_view function,
                                     const std::string &key,
                                     std::string value)
{
    FunctionSpec *fn = findMutable(function);
    if (!fn)
        return unknownFunction(function);
    fn->auxiliary[key] = std::move(value);
    return {};
}

Expected<std::map<std::string, std::string>> Package::auxiliary(std::string_view function) const
{
    const FunctionSpec *fn = find(function);
    if (!fn)
        return unknownFunction(function);
    return fn->auxiliary;
}

} // namespace hat::schema

//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/CatalogAssembler.cpp
// Purpose: Accumulate extracted entities into their destination collections.
// Key invariants: No cross-category validation is performed; a global function
//                 and a method may share a name.
// Ownership/Lifetime: See CatalogAssembler.hpp.
// Links: src/extract/CatalogAssembler.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/CatalogAssembler.hpp"

#include <utility>

namespace scour::extract
{

void CatalogAssembler::addGlobalFunction(model::Function fn)
{
    catalog_.globalFunctions_.push_back(std::move(fn));
}

void CatalogAssembler::addTypeMethod(model::Function fn)
{
    const std::string type = fn.typeName.value_or(std::string());
    catalog_.typeMethods_[type].push_back(std::move(fn));
    ++catalog_.typeMethodCounts_[type];
    ++catalog_.typeMethodTotal_;
}

void CatalogAssembler::addGlobalValue(model::GlobalVariable value)
{
    catalog_.globalValues_.push_back(std::move(value));
}

bool CatalogAssembler::addProperty(const std::string &owner, model::Property property)
{
    auto [it, created] = catalog_.datablocks_.try_emplace(owner);
    if (created)
        it->second.name = owner;
    std::string key = property.name;
    return it->second.properties.emplace(std::move(key), std::move(property)).second;
}

model::Catalog CatalogAssembler::finish()
{
    return std::exchange(catalog_, model::Catalog{});
}

} // namespace scour::extract

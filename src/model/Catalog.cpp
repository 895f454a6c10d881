//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/model/Catalog.cpp
// Purpose: Out-of-line lookups for the entity catalog.
// Key invariants: Lookups never insert.
// Ownership/Lifetime: Returned pointers alias catalog storage.
// Links: include/scour/model/Catalog.hpp
//
//===----------------------------------------------------------------------===//

#include "scour/model/Catalog.hpp"

namespace scour::model
{

const Property *Datablock::findProperty(std::string_view propertyName) const
{
    auto it = properties.find(std::string(propertyName));
    return it == properties.end() ? nullptr : &it->second;
}

std::size_t Catalog::typeMethodCount(std::string_view typeName) const
{
    auto it = typeMethodCounts_.find(std::string(typeName));
    return it == typeMethodCounts_.end() ? 0 : it->second;
}

const Datablock *Catalog::findDatablock(std::string_view typeName) const
{
    auto it = datablocks_.find(std::string(typeName));
    return it == datablocks_.end() ? nullptr : &it->second;
}

} // namespace scour::model

//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/CatalogAssembler.hpp
// Purpose: Declare the accumulator turning extracted records into a Catalog.
// Key invariants: Entities are never modified once added; the per-type method
//                 counts always sum to the method total.
// Ownership/Lifetime: Owns the catalog under construction until finish().
// Links: include/scour/model/Catalog.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "scour/model/Catalog.hpp"

#include <string>

namespace scour::extract
{

class CatalogAssembler
{
  public:
    /// @brief Append a global function in corpus order.
    void addGlobalFunction(model::Function fn);

    /// @brief Append a method under its typeName, creating the group on first use.
    void addTypeMethod(model::Function fn);

    /// @brief Append a global value in corpus order.
    void addGlobalValue(model::GlobalVariable value);

    /// @brief File @p property under datablock @p owner, creating it on first reference.
    /// @return False when @p owner already has a property of that name; the
    ///         earlier property is kept.
    bool addProperty(const std::string &owner, model::Property property);

    /// @brief Catalog built so far.
    [[nodiscard]] const model::Catalog &current() const
    {
        return catalog_;
    }

    /// @brief Hand over the finished catalog, leaving the assembler empty.
    [[nodiscard]] model::Catalog finish();

  private:
    model::Catalog catalog_;
};

} // namespace scour::extract

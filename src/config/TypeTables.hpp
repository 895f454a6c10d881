//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/TypeTables.hpp
// Purpose: Declare the static lookup tables supplied alongside a corpus.
// Key invariants: Owner table keys are bare uppercase hex addresses.
// Ownership/Lifetime: Value types owned by the Profile.
// Links: src/config/Profile.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace scour::config
{

/// Subroutine address -> datablock type name; several addresses may share a type.
using DatablockOwnerTable = std::map<std::string, std::string>;

/// Type name -> ancestor chain, most derived first.
using InheritanceTable = std::map<std::string, std::vector<std::string>>;

/// Primitive type code -> label, indexed by code.
using PrimitiveTypeLabels = std::vector<std::string>;

/// @brief Label for @p code, or "Unknown" when the code is not in @p labels.
[[nodiscard]] std::string_view primitiveLabel(const PrimitiveTypeLabels &labels, int code);

} // namespace scour::config

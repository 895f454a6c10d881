//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/Profile.hpp
// Purpose: Bundle every piece of corpus-specific configuration.
// Key invariants: A profile is complete on its own; loaders only refine it.
// Ownership/Lifetime: Value type owned by the driver.
// Links: src/config/ProfileLoader.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/PatternRegistry.hpp"
#include "config/TypeTables.hpp"

#include <cstddef>
#include <string>

namespace scour::config
{

/// @brief Registry, lookup tables and input settings for one corpus.
struct Profile
{
    PatternRegistry registry;
    DatablockOwnerTable owners;
    InheritanceTable inheritance;
    PrimitiveTypeLabels primitiveLabels;

    /// Leading corpus lines that hold declarations only and are never scanned.
    std::size_t skipLines = 0;

    /// Title of the rendered reference page.
    std::string title;
};

/// @brief Built-in profile for the Tribes 2 executable's decompiled listing.
[[nodiscard]] Profile makeTribes2Profile();

} // namespace scour::config

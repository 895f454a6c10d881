//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/DokuWikiRenderer.hpp
// Purpose: Declare the DokuWiki reference page writer for a finished Catalog.
// Key invariants: The renderer reads the catalog only; it never interprets
//                 corpus text.
// Ownership/Lifetime: Borrows the catalog and tables for the call duration.
// Links: include/scour/model/Catalog.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/TypeTables.hpp"
#include "scour/model/Catalog.hpp"

#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace scour::render
{

/// @brief Page level settings.
struct RenderOptions
{
    std::string title = "Engine Reference";
    std::string author; ///< Optional "Compiled by" line.
};

/// @brief Global functions split into the page's three listings.
struct GlobalFunctionGroups
{
    std::vector<const model::Function *> general;
    std::vector<const model::Function *> arithmetic;
    std::vector<const model::Function *> audio;
};

/// @brief Sort global functions into general, arithmetic and audio listings.
/// @details Arithmetic: name starts with 'm' or mentions Vector/Matrix.
///          Audio: name mentions alx, audio or getAudio.
[[nodiscard]] GlobalFunctionGroups groupGlobalFunctions(const model::Catalog &catalog);

/// @brief "A -> [[#B]] -> C" chain, linking names contained in @p documented.
[[nodiscard]] std::string inheritanceChain(const std::vector<std::string> &chain,
                                           const std::set<std::string> &documented);

/// @brief Write the whole reference page for @p catalog to @p os.
void renderDokuWiki(const model::Catalog &catalog,
                    const config::InheritanceTable &inheritance,
                    const config::PrimitiveTypeLabels &labels,
                    const RenderOptions &options,
                    std::ostream &os);

} // namespace scour::render

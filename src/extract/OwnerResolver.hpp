//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/OwnerResolver.hpp
// Purpose: Declare the resolver inferring which datablock type owns a property
//          registration from the subroutine that performs it.
// Key invariants: resolve() always yields a type name; unknown addresses are
//                 registered as their own synthetic type.
// Ownership/Lifetime: Owns a private copy of the owner table; the corpus is
//                     only viewed.
// Links: src/config/TypeTables.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Structural owner inference for datablock property registrations.
/// @details Property registrations never name their datablock.  They are made
///          from one registration subroutine per type, and the decompiler puts
///          a header comment such as
///          "//----- (0061E7A0) ------------" above every subroutine.  The
///          resolver looks backwards from the call for that header, reads the
///          address in its first parenthesised expression and maps it through
///          the owner table.  All lookups are position based over an
///          immutable buffer so independent scans can revisit any offset.

#pragma once

#include "config/PatternRegistry.hpp"
#include "config/TypeTables.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace scour::extract
{

/// @brief Type name used when no subroutine header precedes a property.
inline constexpr std::string_view kUnknownOwner = "<unknown>";

/// @brief Outcome of resolving one property registration.
struct OwnerResolution
{
    std::string typeName;                     ///< Datablock the property belongs to.
    std::optional<std::string> callerAddress; ///< Registering subroutine, when found.
    bool known = false;           ///< Address was in the table before this run.
    bool newlyRegistered = false; ///< Address was added as a synthetic type by this call.
};

class OwnerResolver
{
  public:
    OwnerResolver(config::DatablockOwnerTable table, config::HeaderMarkers markers);

    /// @brief Address of the subroutine enclosing @p offset, uppercase hex.
    [[nodiscard]] std::optional<std::string> callerAddress(std::string_view text,
                                                           std::size_t offset) const;

    /// @brief Resolve the owner of the registration at @p offset.
    OwnerResolution resolve(std::string_view text, std::size_t offset);

    /// @brief Owner table including synthetic entries added so far.
    [[nodiscard]] const config::DatablockOwnerTable &table() const
    {
        return table_;
    }

  private:
    config::DatablockOwnerTable table_;
    config::HeaderMarkers markers_;
};

} // namespace scour::extract

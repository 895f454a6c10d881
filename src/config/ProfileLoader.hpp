//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/ProfileLoader.hpp
// Purpose: Declare the INI-style loader refining a Profile from a file.
// Key invariants: Recognised sections are [scan], [registry], [layout.<category>],
//                 [datablock_owners], [inheritance], [primitive_types] and
//                 [name_patches]; unknown sections are ignored.
// Ownership/Lifetime: The loader does not retain the file or the profile.
// Links: src/config/Profile.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/Profile.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <istream>
#include <string>

namespace scour::config
{

/// @brief Apply the settings in the profile file at @p path on top of @p profile.
/// @param path Profile file to read.
/// @param profile Profile receiving the overrides.
/// @param diags Receives a warning for every malformed entry, which is skipped.
/// @param sm Registers @p path so warnings carry "file:line" locations.
/// @return Error diagnostic when the file cannot be opened.
support::Expected<void> loadProfileFromFile(const std::string &path,
                                            Profile &profile,
                                            support::DiagnosticEngine &diags,
                                            support::SourceManager &sm);

/// @brief Apply profile settings read from @p in.
/// @param fileId Identifier attached to warning locations, 0 when unknown.
void applyProfileStream(std::istream &in,
                        Profile &profile,
                        support::DiagnosticEngine &diags,
                        uint32_t fileId = 0);

} // namespace scour::config

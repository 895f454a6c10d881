//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the command-line settings of the scour driver.
// Key invariants: Unset optionals keep the profile's value.
// Ownership/Lifetime: Caller owns option values.
// Links: src/tools/scour/driver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace scour::support
{

/// @brief Settings gathered from the command line.
/// @invariant corpusPath is non-empty once parsing succeeded.
struct Options
{
    /// @brief Print notes, per-category statistics and timing to stderr.
    bool trace = false;

    /// @brief Decompiled listing to scrape.
    std::string corpusPath;

    /// @brief Optional profile file refining the built-in profile.
    std::string profilePath;

    /// @brief Page destination; stdout when empty.
    std::string outputPath;

    /// @brief Overrides the profile's leading line skip.
    std::optional<std::size_t> skipLines;

    /// @brief Overrides the profile's page title.
    std::optional<std::string> title;

    /// @brief Optional author line on the page.
    std::string author;
};
} // namespace scour::support

//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/CallSiteMatcher.hpp
// Purpose: Declare the boundary matcher locating registration calls of one
//          entity category in a masked corpus.
// Key invariants: Matches are non-overlapping and reported in corpus order.
// Ownership/Lifetime: CallSite views alias the scanned buffer.
// Links: src/extract/QuoteMask.hpp, src/config/PatternRegistry.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Second phase of the two-phase lexer.
/// @details A call site is the call prefix followed by one of the category's
///          routine addresses, a non-empty run of bytes that are neither ';'
///          nor a brace, the terminating ';' and one byte that is not '"'.
///          This is a statement boundary detector, not a grammar: it relies on
///          the literal mask so the first ';' seen is the statement's own.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scour::extract
{

/// @brief One registration statement located in the corpus.
struct CallSite
{
    std::size_t offset = 0; ///< Offset of the call prefix in the corpus.
    std::string_view text;  ///< Whole statement including the byte after ';'.
    std::string_view routine; ///< Address as spelled in the corpus.
};

/// @brief Case-insensitive matcher for one category's registration calls.
class CallSiteMatcher
{
  public:
    /// @param callPrefix Literal preceding the routine address ("sub_").
    /// @param addresses Routine addresses, tried in order at each position.
    CallSiteMatcher(std::string callPrefix, std::vector<std::string> addresses);

    /// @brief Try to match a call site starting exactly at @p pos.
    [[nodiscard]] std::optional<CallSite> matchAt(std::string_view text, std::size_t pos) const;

    /// @brief Collect every call site in @p text, leftmost first.
    [[nodiscard]] std::vector<CallSite> findAll(std::string_view text) const;

  private:
    /// @brief Offset of the next case-insensitive prefix occurrence at or after @p from.
    std::size_t findPrefix(std::string_view text, std::size_t from) const;

    std::string prefix_;
    std::vector<std::string> addresses_;
};

} // namespace scour::extract

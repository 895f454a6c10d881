//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/QuoteMask.hpp
// Purpose: Declare the literal-aware pre-pass that hides semicolons inside
//          quoted strings from the statement boundary matcher.
// Key invariants: Masking never changes the buffer length nor any byte outside
//                 a closed string literal.
// Ownership/Lifetime: Operates on caller-owned buffers in place.
// Links: src/extract/CallSiteMatcher.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief First phase of the two-phase lexer used by the scraper.
/// @details The decompiled listing ends statements with ';' but descriptions
///          routinely contain ';' as well.  Replacing in-literal semicolons by
///          a sentinel lets the coarse boundary matcher treat the first ';' it
///          meets as the end of the call.  The sentinel is mapped back when a
///          literal is extracted.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace scour::extract
{

/// @brief Closed string literal, both offsets pointing at the quotes.
struct LiteralSpan
{
    std::size_t open = 0;
    std::size_t close = 0;
};

/// @brief Locate every closed double-quoted literal in @p text.
/// @details Backslash escapes are honoured, a literal never spans a newline, and
///          character constants such as '"' outside literals are skipped.
[[nodiscard]] std::vector<LiteralSpan> findLiteralSpans(std::string_view text);

/// @brief Replace every ';' inside a literal of @p buffer with @p sentinel.
/// @return Number of semicolons replaced.
std::size_t maskLiteralSemicolons(std::string &buffer, char sentinel);

/// @brief Map sentinels in @p text back to ';'.
void restoreSentinels(std::string &text, char sentinel);

} // namespace scour::extract

//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Load a decompiled corpus into memory ready for scraping.
// Key invariants: The returned text uses '\n' line endings only and starts at
//                 the first line after the skipped prefix.
// Ownership/Lifetime: The caller owns the returned CorpusText.
// Links: src/extract/Scraper.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "extract/Scraper.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <string>

namespace scour::tools::common
{

/// @brief Largest corpus accepted, in bytes.
inline constexpr std::size_t kMaxCorpusSize = 256ULL * 1024 * 1024;

/// @brief Convert "\r\n" and lone '\r' line endings to '\n' in place.
void normalizeNewlines(std::string &text);

/// @brief Drop the first @p lines lines of @p text in place.
/// @return Number of lines actually dropped.
std::size_t skipLeadingLines(std::string &text, std::size_t lines);

/// @brief Read the corpus at @p path, normalize newlines and skip the prefix.
///
/// The path is registered with @p sm so diagnostics can name it, and the
/// returned CorpusText records the original line number of its first line.
///
/// @param path Filesystem path to the decompiled listing.
/// @param skipLines Leading lines that are never scanned.
/// @param sm Source manager tracking file identifiers for diagnostics.
/// @return Prepared corpus, or an error when the file cannot be read.
support::Expected<extract::CorpusText> loadCorpus(const std::string &path,
                                                  std::size_t skipLines,
                                                  support::SourceManager &sm);

} // namespace scour::tools::common

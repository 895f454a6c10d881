//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/Scraper.hpp
// Purpose: Declare the extraction pipeline from corpus text to Catalog.
// Key invariants: Categories are scanned in kScanOrder; a discarded statement
//                 never affects another statement or category.
// Ownership/Lifetime: The scraper owns its registry and owner table; diagnostics
//                     go to a caller-owned engine.
// Links: src/extract/QuoteMask.hpp, src/extract/CallSiteMatcher.hpp,
//        src/extract/OwnerResolver.hpp, src/extract/CatalogAssembler.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Batch pipeline: mask literals, match each category, build, assemble.
/// @details The corpus is masked once in place.  Every category then runs an
///          independent, sequential scan over the same read-only buffer.
///          Malformed statements are dropped with a note diagnostic; owner
///          lookups that fall back to a synthetic type are reported once per
///          address so the owner table can be curated.

#pragma once

#include "config/PatternRegistry.hpp"
#include "config/TypeTables.hpp"
#include "extract/OwnerResolver.hpp"
#include "scour/model/Catalog.hpp"
#include "support/diagnostics.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace scour::extract
{

class CatalogAssembler;

/// @brief Corpus buffer prepared for scanning.
struct CorpusText
{
    std::string text;        ///< Newline-normalized text after the skipped prefix.
    uint32_t fileId = 0;     ///< SourceManager identifier, 0 when not registered.
    uint32_t firstLine = 1;  ///< Line number of the first line of @ref text.
};

/// @brief Counters for one category scan.
struct CategoryStats
{
    std::size_t matched = 0;
    std::size_t accepted = 0;
    std::size_t discarded = 0;
};

/// @brief Counters for a whole run.
struct ScrapeStats
{
    std::array<CategoryStats, 4> categories{};
    std::size_t maskedSemicolons = 0;
    std::size_t syntheticOwners = 0;
    std::size_t duplicateProperties = 0;

    [[nodiscard]] const CategoryStats &of(config::Category category) const
    {
        return categories[static_cast<std::size_t>(category)];
    }

    [[nodiscard]] CategoryStats &of(config::Category category)
    {
        return categories[static_cast<std::size_t>(category)];
    }
};

class Scraper
{
  public:
    /// @param registry Registration routines and layouts per category.
    /// @param owners Known datablock owner table; copied, never written back.
    /// @param diags Receives notes for discarded statements and synthetic owners.
    Scraper(config::PatternRegistry registry,
            config::DatablockOwnerTable owners,
            support::DiagnosticEngine &diags);

    /// @brief Run the full pipeline over @p corpus.
    /// @details The text is masked in place, so it is taken by value.
    [[nodiscard]] model::Catalog run(CorpusText corpus);

    /// @brief Counters of the last run.
    [[nodiscard]] const ScrapeStats &stats() const
    {
        return stats_;
    }

    /// @brief Owner table including synthetic entries registered by the last run.
    [[nodiscard]] const config::DatablockOwnerTable &ownerTable() const
    {
        return resolver_.table();
    }

  private:
    struct ScanContext;

    void scanCategory(const ScanContext &ctx, config::Category category, CatalogAssembler &out);
    void addProperty(const ScanContext &ctx,
                     std::size_t offset,
                     model::Property property,
                     CatalogAssembler &out);

    config::PatternRegistry registry_;
    config::DatablockOwnerTable initialOwners_;
    OwnerResolver resolver_;
    support::DiagnosticEngine &diags_;
    ScrapeStats stats_;
};

} // namespace scour::extract

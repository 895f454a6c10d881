//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/Scraper.cpp
// Purpose: Drives masking, matching, record building and assembly.
// Key invariants: The masked buffer is not modified after masking.
// Ownership/Lifetime: See Scraper.hpp.
// Links: src/extract/Scraper.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/Scraper.hpp"

#include "extract/CallSiteMatcher.hpp"
#include "extract/CatalogAssembler.hpp"
#include "extract/QuoteMask.hpp"
#include "extract/RecordBuilder.hpp"
#include "support/source_location.hpp"

#include <string_view>
#include <utility>

namespace scour::extract
{

using config::Category;

/// Read-only state shared by the category scans of one run.
struct Scraper::ScanContext
{
    std::string_view text;
    uint32_t fileId;
    support::LineIndex lines;

    [[nodiscard]] support::SourceLoc locate(std::size_t offset) const
    {
        return lines.locate(fileId, offset);
    }
};

Scraper::Scraper(config::PatternRegistry registry,
                 config::DatablockOwnerTable owners,
                 support::DiagnosticEngine &diags)
    : registry_(std::move(registry)),
      initialOwners_(owners),
      resolver_(std::move(owners), registry_.headers),
      diags_(diags)
{
}

model::Catalog Scraper::run(CorpusText corpus)
{
    stats_ = ScrapeStats{};
    resolver_ = OwnerResolver(initialOwners_, registry_.headers);

    stats_.maskedSemicolons = maskLiteralSemicolons(corpus.text, registry_.sentinel);

    const ScanContext ctx{corpus.text, corpus.fileId, support::LineIndex(corpus.text, corpus.firstLine)};
    CatalogAssembler assembler;
    for (Category category : config::kScanOrder)
        scanCategory(ctx, category, assembler);
    return assembler.finish();
}

void Scraper::scanCategory(const ScanContext &ctx, Category category, CatalogAssembler &out)
{
    const config::CategoryPattern &pattern = registry_.pattern(category);
    if (pattern.addresses.empty())
        return;

    CategoryStats &counters = stats_.of(category);
    const CallSiteMatcher matcher(registry_.callPrefix, pattern.addresses);

    auto dropped = [&](const CallSite &site, const support::Diag &why)
    {
        ++counters.discarded;
        diags_.note(ctx.locate(site.offset),
                    "discarded " + std::string(config::categoryName(category)) + ": " +
                        why.message);
    };

    for (const CallSite &site : matcher.findAll(ctx.text))
    {
        ++counters.matched;
        switch (category)
        {
            case Category::GlobalFunction:
            case Category::TypeMethod:
            {
                auto fn = buildFunction(site.text, pattern, registry_);
                if (!fn)
                {
                    dropped(site, fn.error());
                    continue;
                }
                if (category == Category::TypeMethod)
                    out.addTypeMethod(std::move(fn.value()));
                else
                    out.addGlobalFunction(std::move(fn.value()));
                break;
            }
            case Category::GlobalValue:
            {
                auto value = buildGlobalValue(site.text, pattern, registry_);
                if (!value)
                {
                    dropped(site, value.error());
                    continue;
                }
                out.addGlobalValue(std::move(value.value()));
                break;
            }
            case Category::DatablockProperty:
            {
                auto property = buildProperty(site.text, pattern, registry_);
                if (!property)
                {
                    dropped(site, property.error());
                    continue;
                }
                addProperty(ctx, site.offset, std::move(property.value()), out);
                break;
            }
        }
        ++counters.accepted;
    }
}

void Scraper::addProperty(const ScanContext &ctx,
                          std::size_t offset,
                          model::Property property,
                          CatalogAssembler &out)
{
    const OwnerResolution owner = resolver_.resolve(ctx.text, offset);
    if (!owner.callerAddress)
    {
        diags_.warning(ctx.locate(offset),
                       "no subroutine header above datablock field '" + property.name +
                           "'; filed under " + owner.typeName);
    }
    else if (owner.newlyRegistered)
    {
        ++stats_.syntheticOwners;
        diags_.note(ctx.locate(offset),
                    "unresolved datablock owner " + *owner.callerAddress +
                        "; using the address as type name");
    }

    const std::string name = property.name;
    if (!out.addProperty(owner.typeName, std::move(property)))
    {
        ++stats_.duplicateProperties;
        diags_.note(ctx.locate(offset),
                    "duplicate field '" + name + "' on " + owner.typeName + "; keeping the first");
    }
}

} // namespace scour::extract

//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the `scour` driver: build the profile, load the corpus, scrape it
// and write the DokuWiki reference page.  Configuration is layered as built-in
// Tribes 2 profile, then the profile file, then command-line overrides.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Argument parsing and pipeline wiring for the `scour` executable.

#include "tools/scour/driver.hpp"

#include "config/Profile.hpp"
#include "config/ProfileLoader.hpp"
#include "extract/Scraper.hpp"
#include "render/DokuWikiRenderer.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "support/text.hpp"
#include "tools/common/source_loader.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <string>

namespace scour::tools
{

namespace
{

constexpr std::string_view kVersion = "scour 0.3.0";

void printUsage(std::ostream &os)
{
    os << "Usage: scour [options] <corpus>\n"
          "  --config <file>     refine the built-in profile with an INI profile\n"
          "  --skip-lines <n>    leading corpus lines to ignore\n"
          "  --output <file>     write the page to <file> instead of stdout\n"
          "  --title <text>      page title\n"
          "  --author <name>     add a \"Compiled by\" line\n"
          "  --trace             print notes, statistics and timing\n"
          "  --version           print the version and exit\n"
          "  --help              print this message and exit\n";
}

void printStats(const extract::ScrapeStats &stats, std::ostream &err)
{
    err << "masked " << stats.maskedSemicolons << " in-literal semicolons\n";
    for (config::Category category : config::kScanOrder)
    {
        const extract::CategoryStats &c = stats.of(category);
        err << config::categoryName(category) << ": " << c.matched << " matched, " << c.accepted
            << " accepted, " << c.discarded << " discarded\n";
    }
    err << "synthetic datablock owners: " << stats.syntheticOwners << "\n";
}

} // namespace

ParseStatus parseArgs(const std::vector<std::string_view> &args,
                      support::Options &opts,
                      std::ostream &out,
                      std::ostream &err)
{
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];
        auto needValue = [&](std::string_view &value) -> bool
        {
            if (i + 1 >= args.size())
            {
                err << "error: " << arg << " requires a value\n";
                return false;
            }
            value = args[++i];
            return true;
        };

        std::string_view value;
        if (arg == "--help" || arg == "-h")
        {
            printUsage(out);
            return ParseStatus::Exit;
        }
        if (arg == "--version")
        {
            out << kVersion << "\n";
            return ParseStatus::Exit;
        }
        if (arg == "--trace")
        {
            opts.trace = true;
        }
        else if (arg == "--config")
        {
            if (!needValue(value))
                return ParseStatus::Invalid;
            opts.profilePath = std::string(value);
        }
        else if (arg == "--output" || arg == "-o")
        {
            if (!needValue(value))
                return ParseStatus::Invalid;
            opts.outputPath = std::string(value);
        }
        else if (arg == "--title")
        {
            if (!needValue(value))
                return ParseStatus::Invalid;
            opts.title = std::string(value);
        }
        else if (arg == "--author")
        {
            if (!needValue(value))
                return ParseStatus::Invalid;
            opts.author = std::string(value);
        }
        else if (arg == "--skip-lines")
        {
            if (!needValue(value))
                return ParseStatus::Invalid;
            auto lines = support::parseDecimal(value);
            if (!lines || *lines < 0)
            {
                err << "error: invalid --skip-lines value '" << value << "'\n";
                return ParseStatus::Invalid;
            }
            opts.skipLines = static_cast<std::size_t>(*lines);
        }
        else if (!arg.empty() && arg.front() == '-')
        {
            err << "error: unknown option " << arg << "\n";
            printUsage(err);
            return ParseStatus::Invalid;
        }
        else if (opts.corpusPath.empty())
        {
            opts.corpusPath = std::string(arg);
        }
        else
        {
            err << "error: more than one corpus given\n";
            return ParseStatus::Invalid;
        }
    }

    if (opts.corpusPath.empty())
    {
        printUsage(err);
        return ParseStatus::Invalid;
    }
    return ParseStatus::Run;
}

int runScour(const support::Options &opts, std::ostream &out, std::ostream &err)
{
    const auto started = std::chrono::steady_clock::now();
    support::SourceManager sm;
    support::DiagnosticEngine diags;
    const support::Severity shown = opts.trace ? support::Severity::Note : support::Severity::Warning;

    config::Profile profile = config::makeTribes2Profile();
    if (!opts.profilePath.empty())
    {
        auto loaded = config::loadProfileFromFile(opts.profilePath, profile, diags, sm);
        if (!loaded)
        {
            support::printDiag(loaded.error(), err);
            return kExitFailure;
        }
    }
    if (opts.skipLines)
        profile.skipLines = *opts.skipLines;
    if (opts.title)
        profile.title = *opts.title;

    auto corpus = common::loadCorpus(opts.corpusPath, profile.skipLines, sm);
    if (!corpus)
    {
        diags.printAll(err, &sm, shown);
        support::printDiag(corpus.error(), err);
        return kExitFailure;
    }

    extract::Scraper scraper(profile.registry, profile.owners, diags);
    const model::Catalog catalog = scraper.run(std::move(corpus.value()));

    render::RenderOptions page;
    page.title = profile.title;
    page.author = opts.author;

    if (opts.outputPath.empty())
    {
        render::renderDokuWiki(catalog, profile.inheritance, profile.primitiveLabels, page, out);
    }
    else
    {
        std::ofstream file(opts.outputPath, std::ios::binary);
        if (!file)
        {
            diags.printAll(err, &sm, shown);
            support::printDiag(support::makeError({}, "unable to write " + opts.outputPath), err);
            return kExitFailure;
        }
        render::renderDokuWiki(catalog, profile.inheritance, profile.primitiveLabels, page, file);
        if (!file.flush())
        {
            support::printDiag(support::makeError({}, "write failed on " + opts.outputPath), err);
            return kExitFailure;
        }
    }

    diags.printAll(err, &sm, shown);
    if (opts.trace)
    {
        printStats(scraper.stats(), err);
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
        err << "Processed in " << std::fixed << std::setprecision(3) << elapsed.count()
            << " seconds\n";
    }
    return kExitOk;
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err)
{
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i)
        args.emplace_back(argv[i]);

    support::Options opts;
    switch (parseArgs(args, opts, out, err))
    {
        case ParseStatus::Exit:
            return kExitOk;
        case ParseStatus::Invalid:
            return kExitUsage;
        case ParseStatus::Run:
            break;
    }
    return runScour(opts, out, err);
}

} // namespace scour::tools

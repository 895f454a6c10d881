//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the reusable entry points behind the `scour` executable.  They are
// factored out of main so tests can drive the whole tool with injected streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Command-line parsing and the scrape-and-render pipeline of `scour`.

#pragma once

#include "support/options.hpp"

#include <iosfwd>
#include <string_view>
#include <vector>

namespace scour::tools
{

/// @brief Exit status of the driver.
enum ExitCode
{
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2,
};

/// @brief Outcome of command-line parsing.
enum class ParseStatus
{
    Run,     ///< Options are complete; run the pipeline.
    Exit,    ///< A --help or --version request was served.
    Invalid, ///< Bad usage; a message was written.
};

/// @brief Parse @p args (without the program name) into @p opts.
ParseStatus parseArgs(const std::vector<std::string_view> &args,
                      support::Options &opts,
                      std::ostream &out,
                      std::ostream &err);

/// @brief Run the scrape-and-render pipeline for parsed @p opts.
/// @return kExitOk on success, kExitFailure when an input cannot be read or
///         the page cannot be written.
int runScour(const support::Options &opts, std::ostream &out, std::ostream &err);

/// @brief Full CLI workflow with injectable streams.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err);

} // namespace scour::tools

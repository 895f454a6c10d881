//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the `scour` executable: scrape a decompiled engine listing into a
// DokuWiki reference of its console functions, globals and datablocks.
//
//===----------------------------------------------------------------------===//

#include "tools/scour/driver.hpp"

#include <iostream>

int main(int argc, char **argv)
{
    return scour::tools::runCLI(argc, argv, std::cout, std::cerr);
}

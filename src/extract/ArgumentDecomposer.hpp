//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/ArgumentDecomposer.hpp
// Purpose: Declare the splitter turning one registration statement into raw
//          argument fields plus its recovered description.
// Key invariants: Removing the description keeps the index of every other field.
// Ownership/Lifetime: DecomposedCall owns copies of the fields.
// Links: src/extract/FieldExtractors.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/PatternRegistry.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace scour::extract
{

/// @brief Raw fields of one registration call.
struct DecomposedCall
{
    /// Comma separated fields; the description slot keeps only its closing quote.
    std::vector<std::string> fields;

    /// Description text with sentinels restored, empty when absent.
    std::string description;

    /// Offset in the argument list where the description field starts, or -1
    /// when no separating comma was found.
    std::ptrdiff_t descriptionBegin = -1;

    /// True when the closing quote of a description was located.
    bool hasDescription = false;
};

/// @brief Text between the first '(' and the last ')' before the statement's ';'.
/// @return Empty view when the statement carries no parenthesised list.
[[nodiscard]] std::string_view argumentList(std::string_view statement);

/// @brief Split @p statement into fields according to @p layout.
/// @param statement Masked registration statement as found by the matcher.
/// @param layout Field positions of the statement's category.
/// @param registry Supplies the sentinel and the description cast prefixes.
[[nodiscard]] DecomposedCall decomposeCall(std::string_view statement,
                                           const config::FieldLayout &layout,
                                           const config::PatternRegistry &registry);

} // namespace scour::extract

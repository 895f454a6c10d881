//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/FieldExtractors.hpp
// Purpose: Declare converters from raw argument fields to names, addresses and
//          integers.
// Key invariants: Every extractor yields std::nullopt when the slot is absent
//                 or out of range, never throws.
// Ownership/Lifetime: Return owned strings.
// Links: src/extract/ArgumentDecomposer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/PatternRegistry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scour::extract
{

using Fields = std::vector<std::string>;

/// @brief Literal text of the quoted field at @p index.
/// @details Left-trims, keeps what follows the first '"', drops trailing quotes
///          and blanks, applies @p patches and maps @p sentinel back to ';'.
[[nodiscard]] std::optional<std::string> extractName(const Fields &fields,
                                                     std::optional<std::size_t> index,
                                                     const std::vector<config::NamePatch> &patches,
                                                     char sentinel);

/// @brief Bare uppercase hex address of the field at @p index.
/// @details Everything up to and including the first '_' is the decompiler's
///          symbol prefix ("sub_", "dword_", "off_") and is dropped.
[[nodiscard]] std::optional<std::string> extractAddress(const Fields &fields,
                                                        std::optional<std::size_t> index);

/// @brief Base-10 integer in the field at @p index.
[[nodiscard]] std::optional<int> extractInt(const Fields &fields, std::optional<std::size_t> index);

} // namespace scour::extract

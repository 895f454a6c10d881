//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/PatternRegistry.hpp
// Purpose: Declare the registry mapping each entity category to the
//          registration routines that mark it and to its argument layout.
// Key invariants: Exactly one CategoryPattern per Category, indexed by the enum.
// Ownership/Lifetime: Value type; copied into matchers and the scraper.
// Links: src/extract/CallSiteMatcher.hpp, src/extract/ArgumentDecomposer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scour::config
{

/// @brief Entity categories recognised in the corpus.
enum class Category
{
    GlobalFunction,
    TypeMethod,
    GlobalValue,
    DatablockProperty,
};

/// @brief Order in which categories are scanned.
inline constexpr std::array<Category, 4> kScanOrder = {Category::GlobalFunction,
                                                       Category::TypeMethod,
                                                       Category::GlobalValue,
                                                       Category::DatablockProperty};

/// @brief Human readable category name used in diagnostics.
[[nodiscard]] std::string_view categoryName(Category category);

/// @brief Parse a configuration key such as "type_methods" into a category.
[[nodiscard]] std::optional<Category> categoryFromKey(std::string_view key);

/// @brief Positions of the interesting fields in a registration call.
/// @details Indices refer to the comma separated argument list after the
///          description span has been cut out; the description keeps its slot.
struct FieldLayout
{
    std::optional<std::size_t> name;
    std::optional<std::size_t> typeName;
    std::optional<std::size_t> address;
    std::optional<std::size_t> description;
    std::optional<std::size_t> minArgs;
    std::optional<std::size_t> maxArgs;
    std::optional<std::size_t> typeCode;

    /// Number of top-level fields that follow the description.
    std::size_t fieldsAfterDescription = 0;
};

/// @brief Known registration routines and argument layout of one category.
struct CategoryPattern
{
    Category category = Category::GlobalFunction;
    std::vector<std::string> addresses; ///< Hex addresses following the call prefix.
    FieldLayout layout;
};

/// @brief Literal substitution applied to extracted names.
struct NamePatch
{
    std::string artifact;
    std::string replacement;
};

/// @brief Markers delimiting the decompiler's per-subroutine header comment.
struct HeaderMarkers
{
    std::string sectionMarker = "//----- "; ///< Starts the header line.
    char separator = '-';                   ///< Dash run closing the header.
};

/// @brief Complete scan configuration for one corpus.
struct PatternRegistry
{
    std::string callPrefix = "sub_";
    char sentinel = '\x1f';
    std::vector<NamePatch> namePatches;
    std::vector<std::string> descriptionCasts{"(int)"};
    HeaderMarkers headers;
    std::array<CategoryPattern, 4> patterns{CategoryPattern{Category::GlobalFunction, {}, {}},
                                            CategoryPattern{Category::TypeMethod, {}, {}},
                                            CategoryPattern{Category::GlobalValue, {}, {}},
                                            CategoryPattern{Category::DatablockProperty, {}, {}}};

    [[nodiscard]] CategoryPattern &pattern(Category category)
    {
        return patterns[static_cast<std::size_t>(category)];
    }

    [[nodiscard]] const CategoryPattern &pattern(Category category) const
    {
        return patterns[static_cast<std::size_t>(category)];
    }
};

} // namespace scour::config

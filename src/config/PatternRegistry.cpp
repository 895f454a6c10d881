//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/PatternRegistry.cpp
// Purpose: Category naming helpers for the pattern registry.
// Key invariants: categoryFromKey accepts the names used in profile files.
// Ownership/Lifetime: Stateless.
// Links: src/config/PatternRegistry.hpp
//
//===----------------------------------------------------------------------===//

#include "config/PatternRegistry.hpp"

namespace scour::config
{

std::string_view categoryName(Category category)
{
    switch (category)
    {
        case Category::GlobalFunction:
            return "global function";
        case Category::TypeMethod:
            return "type method";
        case Category::GlobalValue:
            return "global value";
        case Category::DatablockProperty:
            return "datablock property";
    }
    return "unknown";
}

std::optional<Category> categoryFromKey(std::string_view key)
{
    if (key == "global_functions")
        return Category::GlobalFunction;
    if (key == "type_methods")
        return Category::TypeMethod;
    if (key == "global_values")
        return Category::GlobalValue;
    if (key == "datablock_properties")
        return Category::DatablockProperty;
    return std::nullopt;
}

} // namespace scour::config

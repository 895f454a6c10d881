//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/RecordBuilder.hpp
// Purpose: Declare the per-category builders turning one registration
//          statement into a typed entity.
// Key invariants: A builder either yields a complete entity or a diagnostic
//                 explaining why the statement is discarded.
// Ownership/Lifetime: Results own their data.
// Links: src/extract/ArgumentDecomposer.hpp, src/extract/FieldExtractors.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "config/PatternRegistry.hpp"
#include "scour/model/Catalog.hpp"
#include "support/diag_expected.hpp"

#include <string_view>

namespace scour::extract
{

/// @brief Build a global function or, when @p pattern is a method pattern, a
///        type-bound method from @p statement.
/// @details Fails when the name or owning type is missing, when either argument
///          count is not an integer, or when minArgs exceeds maxArgs.
[[nodiscard]] support::Expected<model::Function> buildFunction(
    std::string_view statement,
    const config::CategoryPattern &pattern,
    const config::PatternRegistry &registry);

/// @brief Build a global value; fails when the type code is not an integer.
[[nodiscard]] support::Expected<model::GlobalVariable> buildGlobalValue(
    std::string_view statement,
    const config::CategoryPattern &pattern,
    const config::PatternRegistry &registry);

/// @brief Build a datablock property; its owner is resolved separately.
[[nodiscard]] support::Expected<model::Property> buildProperty(
    std::string_view statement,
    const config::CategoryPattern &pattern,
    const config::PatternRegistry &registry);

} // namespace scour::extract

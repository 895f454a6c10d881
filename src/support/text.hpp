//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/text.hpp
// Purpose: Small string helpers shared by the extractors and the profile loader.
// Key invariants: Helpers never throw and treat bytes as ASCII.
// Ownership/Lifetime: Views returned alias the caller's buffer.
// Links: src/extract/FieldExtractors.cpp, src/config/ProfileLoader.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scour::support
{

/// @brief Drop leading ASCII whitespace.
[[nodiscard]] std::string_view ltrim(std::string_view sv);

/// @brief Drop trailing ASCII whitespace.
[[nodiscard]] std::string_view rtrim(std::string_view sv);

/// @brief Drop leading and trailing ASCII whitespace.
[[nodiscard]] std::string_view trim(std::string_view sv);

/// @brief Drop trailing characters contained in @p set.
[[nodiscard]] std::string_view rstripAny(std::string_view sv, std::string_view set);

/// @brief Uppercase copy of @p sv.
[[nodiscard]] std::string toUpper(std::string_view sv);

/// @brief Lowercase copy of @p sv.
[[nodiscard]] std::string toLower(std::string_view sv);

/// @brief Split @p sv on every @p sep; empty pieces are kept.
[[nodiscard]] std::vector<std::string_view> split(std::string_view sv, char sep);

/// @brief Split a comma separated list, trimming items and dropping empty ones.
[[nodiscard]] std::vector<std::string> splitList(std::string_view sv);

/// @brief Replace every occurrence of @p from in @p text with @p to.
void replaceAll(std::string &text, std::string_view from, std::string_view to);

/// @brief Parse a base-10 integer, allowing surrounding whitespace and a sign.
[[nodiscard]] std::optional<long long> parseDecimal(std::string_view sv);

/// @brief Parse a base-16 integer, allowing surrounding whitespace and a 0x prefix.
[[nodiscard]] std::optional<unsigned long long> parseHex(std::string_view sv);

} // namespace scour::support

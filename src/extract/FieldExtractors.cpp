//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/FieldExtractors.cpp
// Purpose: Field level conversions used by the record builders.
// Key invariants: Addresses are uppercased; names are trimmed literal text.
// Ownership/Lifetime: Stateless.
// Links: src/extract/FieldExtractors.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/FieldExtractors.hpp"

#include "extract/QuoteMask.hpp"
#include "support/text.hpp"

#include <limits>

namespace scour::extract
{

namespace
{

const std::string *fieldAt(const Fields &fields, std::optional<std::size_t> index)
{
    if (!index || *index >= fields.size())
        return nullptr;
    return &fields[*index];
}

} // namespace

std::optional<std::string> extractName(const Fields &fields,
                                       std::optional<std::size_t> index,
                                       const std::vector<config::NamePatch> &patches,
                                       char sentinel)
{
    const std::string *field = fieldAt(fields, index);
    if (!field)
        return std::nullopt;

    std::string_view sv = support::ltrim(*field);
    const std::size_t quote = sv.find('"');
    if (quote != std::string_view::npos)
        sv.remove_prefix(quote + 1);
    sv = support::rstripAny(sv, "\" \t");

    std::string name(sv);
    for (const config::NamePatch &patch : patches)
        support::replaceAll(name, patch.artifact, patch.replacement);
    restoreSentinels(name, sentinel);
    return name;
}

std::optional<std::string> extractAddress(const Fields &fields, std::optional<std::size_t> index)
{
    const std::string *field = fieldAt(fields, index);
    if (!field)
        return std::nullopt;

    std::string_view sv = *field;
    const std::size_t underscore = sv.find('_');
    if (underscore != std::string_view::npos)
        sv.remove_prefix(underscore + 1);
    sv = support::ltrim(support::rstripAny(sv, "\" \t"));
    if (sv.empty())
        return std::nullopt;
    return support::toUpper(sv);
}

std::optional<int> extractInt(const Fields &fields, std::optional<std::size_t> index)
{
    const std::string *field = fieldAt(fields, index);
    if (!field)
        return std::nullopt;

    auto value = support::parseDecimal(*field);
    if (!value || *value < std::numeric_limits<int>::min() ||
        *value > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(*value);
}

} // namespace scour::extract

//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/ArgumentDecomposer.cpp
// Purpose: Argument list isolation and description recovery.
// Key invariants: Commas inside the quoted description never split fields.
// Ownership/Lifetime: Works on views of the masked corpus, returns copies.
// Links: src/extract/ArgumentDecomposer.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/ArgumentDecomposer.hpp"

#include "extract/QuoteMask.hpp"
#include "support/text.hpp"

namespace scour::extract
{

namespace
{

bool isQuoteAt(std::string_view text, std::size_t i)
{
    return text[i] == '"' && (i == 0 || text[i - 1] != '\\');
}

/// @brief End of the region holding the description.
/// @details Walks leftwards over @p trailing top-level fields; the description
///          is the last quoted field before them.  Returns 0 when the list has
///          fewer fields than that.
std::size_t descriptionLimit(std::string_view args, std::size_t trailing)
{
    if (trailing == 0)
        return args.size();
    bool inQuote = false;
    std::size_t seen = 0;
    for (std::size_t i = args.size(); i-- > 0;)
    {
        if (isQuoteAt(args, i))
        {
            inQuote = !inQuote;
        }
        else if (args[i] == ',' && !inQuote && ++seen == trailing)
        {
            return i;
        }
    }
    return 0;
}

/// @brief Offset where top-level field @p index starts.
/// @return npos when the list has fewer fields than that.
std::size_t fieldBegin(std::string_view args, std::size_t index)
{
    if (index == 0)
        return 0;
    bool inQuote = false;
    std::size_t seen = 0;
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        if (isQuoteAt(args, i))
        {
            inQuote = !inQuote;
        }
        else if (args[i] == ',' && !inQuote && ++seen == index)
        {
            return i + 1;
        }
    }
    return std::string_view::npos;
}

/// @brief Walk back from the closing quote to the comma that precedes the
///        opening quote, toggling on every quote crossed.
/// @details The walk stops at the separator in front of the description slot
///          starting at @p slot, so it never reaches into earlier fields.
std::ptrdiff_t findDescriptionBegin(std::string_view args, std::size_t slot, std::size_t closeQuote)
{
    const std::size_t floor = slot == 0 ? 0 : slot - 1;
    bool insideQuotation = true;
    for (std::size_t i = closeQuote; i > floor;)
    {
        --i;
        if (args[i] == ',' && !insideQuotation)
            return static_cast<std::ptrdiff_t>(i + 1);
        if (isQuoteAt(args, i))
            insideQuotation = !insideQuotation;
    }
    return -1;
}

std::string cleanDescription(std::string_view raw, const config::PatternRegistry &registry)
{
    raw = support::ltrim(raw);
    for (const std::string &cast : registry.descriptionCasts)
    {
        if (!cast.empty() && raw.substr(0, cast.size()) == cast)
        {
            raw = support::ltrim(raw.substr(cast.size()));
            break;
        }
    }
    if (!raw.empty() && raw.front() == '"')
        raw.remove_prefix(1);

    std::string text(raw);
    restoreSentinels(text, registry.sentinel);
    return text;
}

std::vector<std::string> splitFields(std::string_view text)
{
    std::vector<std::string> fields;
    for (std::string_view piece : support::split(text, ','))
        fields.emplace_back(piece);
    return fields;
}

} // namespace

std::string_view argumentList(std::string_view statement)
{
    const std::size_t open = statement.find('(');
    if (open == std::string_view::npos)
        return {};
    std::size_t semi = statement.rfind(';');
    if (semi == std::string_view::npos)
        semi = statement.size();
    const std::size_t close = statement.substr(0, semi).rfind(')');
    if (close == std::string_view::npos || close <= open)
        return {};
    return statement.substr(open + 1, close - open - 1);
}

DecomposedCall decomposeCall(std::string_view statement,
                             const config::FieldLayout &layout,
                             const config::PatternRegistry &registry)
{
    DecomposedCall call;
    const std::string_view args = argumentList(statement);

    if (!layout.description)
    {
        call.fields = splitFields(args);
        return call;
    }

    // The closing quote only counts when it lies inside the description slot;
    // an unquoted usage argument (a null string decompiles as 0) has none.
    const std::size_t slot = fieldBegin(args, *layout.description);
    const std::size_t limit = descriptionLimit(args, layout.fieldsAfterDescription);
    std::size_t closeQuote = std::string_view::npos;
    if (slot != std::string_view::npos && limit > slot)
    {
        closeQuote = args.substr(0, limit).rfind('"');
        if (closeQuote != std::string_view::npos && closeQuote < slot)
            closeQuote = std::string_view::npos;
    }
    if (closeQuote == std::string_view::npos)
    {
        call.fields = splitFields(args);
        return call;
    }

    call.hasDescription = true;
    call.descriptionBegin = findDescriptionBegin(args, slot, closeQuote);
    const std::size_t begin =
        call.descriptionBegin < 0 ? slot : static_cast<std::size_t>(call.descriptionBegin);
    call.description = cleanDescription(args.substr(begin, closeQuote - begin), registry);

    std::string remainder(args.substr(0, begin));
    remainder.append(args.substr(closeQuote));
    call.fields = splitFields(remainder);
    return call;
}

} // namespace scour::extract

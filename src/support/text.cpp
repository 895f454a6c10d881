//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/text.cpp
// Purpose: ASCII string helpers used by field extraction and configuration.
// Key invariants: Numeric parsers accept the whole trimmed input or nothing.
// Ownership/Lifetime: Stateless functions.
// Links: src/support/text.hpp
//
//===----------------------------------------------------------------------===//

#include "support/text.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace scour::support
{

std::string_view ltrim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
        sv.remove_prefix(1);
    return sv;
}

std::string_view rtrim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
        sv.remove_suffix(1);
    return sv;
}

std::string_view trim(std::string_view sv)
{
    return rtrim(ltrim(sv));
}

std::string_view rstripAny(std::string_view sv, std::string_view set)
{
    while (!sv.empty() && set.find(sv.back()) != std::string_view::npos)
        sv.remove_suffix(1);
    return sv;
}

std::string toUpper(std::string_view sv)
{
    std::string out(sv);
    std::transform(
        out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

std::string toLower(std::string_view sv)
{
    std::string out(sv);
    std::transform(
        out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::vector<std::string_view> split(std::string_view sv, char sep)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = sv.find(sep, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(sv.substr(start));
            break;
        }
        parts.push_back(sv.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> splitList(std::string_view sv)
{
    std::vector<std::string> items;
    for (std::string_view piece : split(sv, ','))
    {
        piece = trim(piece);
        if (!piece.empty())
            items.emplace_back(piece);
    }
    return items;
}

void replaceAll(std::string &text, std::string_view from, std::string_view to)
{
    if (from.empty())
        return;
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::optional<long long> parseDecimal(std::string_view sv)
{
    sv = trim(sv);
    if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);
    if (sv.empty())
        return std::nullopt;

    long long value = 0;
    const char *end = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(sv.data(), end, value, 10);
    if (ec != std::errc() || ptr != end)
        return std::nullopt;
    return value;
}

std::optional<unsigned long long> parseHex(std::string_view sv)
{
    sv = trim(sv);
    if (sv.size() > 2 && sv[0] == '0' && (sv[1] == 'x' || sv[1] == 'X'))
        sv.remove_prefix(2);
    if (sv.empty())
        return std::nullopt;

    unsigned long long value = 0;
    const char *end = sv.data() + sv.size();
    auto [ptr, ec] = std::from_chars(sv.data(), end, value, 16);
    if (ec != std::errc() || ptr != end)
        return std::nullopt;
    return value;
}

} // namespace scour::support

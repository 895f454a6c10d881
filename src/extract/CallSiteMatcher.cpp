//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/CallSiteMatcher.cpp
// Purpose: Implements the registration call boundary matcher.
// Key invariants: Scanning resumes after the end of each match.
// Ownership/Lifetime: Stateless beyond the configured prefix and addresses.
// Links: src/extract/CallSiteMatcher.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/CallSiteMatcher.hpp"

#include <cctype>

namespace scour::extract
{

namespace
{

bool iequalAt(std::string_view text, std::size_t pos, std::string_view word)
{
    if (pos + word.size() > text.size())
        return false;
    for (std::size_t i = 0; i < word.size(); ++i)
    {
        const auto a = static_cast<unsigned char>(text[pos + i]);
        const auto b = static_cast<unsigned char>(word[i]);
        if (std::tolower(a) != std::tolower(b))
            return false;
    }
    return true;
}

bool isStatementBreak(char ch)
{
    return ch == ';' || ch == '{' || ch == '}';
}

} // namespace

CallSiteMatcher::CallSiteMatcher(std::string callPrefix, std::vector<std::string> addresses)
    : prefix_(std::move(callPrefix)), addresses_(std::move(addresses))
{
}

std::size_t CallSiteMatcher::findPrefix(std::string_view text, std::size_t from) const
{
    if (prefix_.empty())
        return from < text.size() ? from : std::string_view::npos;
    const auto first = static_cast<unsigned char>(prefix_.front());
    const char lower = static_cast<char>(std::tolower(first));
    const char upper = static_cast<char>(std::toupper(first));
    for (std::size_t i = from; i < text.size(); ++i)
    {
        if ((text[i] == lower || text[i] == upper) && iequalAt(text, i, prefix_))
            return i;
    }
    return std::string_view::npos;
}

std::optional<CallSite> CallSiteMatcher::matchAt(std::string_view text, std::size_t pos) const
{
    if (!iequalAt(text, pos, prefix_))
        return std::nullopt;

    const std::size_t afterPrefix = pos + prefix_.size();
    for (const std::string &address : addresses_)
    {
        if (!iequalAt(text, afterPrefix, address))
            continue;

        const std::size_t runBegin = afterPrefix + address.size();
        std::size_t end = runBegin;
        while (end < text.size() && !isStatementBreak(text[end]))
            ++end;

        // Needs a non-empty run, a ';' terminator and one byte that is not '"'.
        if (end == runBegin || end + 1 >= text.size() || text[end] != ';' || text[end + 1] == '"')
            continue;

        CallSite site;
        site.offset = pos;
        site.text = text.substr(pos, end + 2 - pos);
        site.routine = text.substr(afterPrefix, address.size());
        return site;
    }
    return std::nullopt;
}

std::vector<CallSite> CallSiteMatcher::findAll(std::string_view text) const
{
    std::vector<CallSite> sites;
    std::size_t pos = findPrefix(text, 0);
    while (pos != std::string_view::npos)
    {
        if (auto site = matchAt(text, pos))
        {
            sites.push_back(*site);
            pos = findPrefix(text, pos + site->text.size());
        }
        else
        {
            pos = findPrefix(text, pos + 1);
        }
    }
    return sites;
}

} // namespace scour::extract

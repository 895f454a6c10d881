//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/QuoteMask.cpp
// Purpose: Single-pass literal scanner and in-place semicolon masking.
// Key invariants: Each byte of the buffer is visited a bounded number of times.
// Ownership/Lifetime: No allocations besides the optional span list.
// Links: src/extract/QuoteMask.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/QuoteMask.hpp"

#include <algorithm>

namespace scour::extract
{

namespace
{

/// Longest character constant skipped outside literals ('abcd' plus escapes).
constexpr std::size_t kMaxCharConstant = 8;

/// @brief Find the quote closing the literal opened at @p open.
/// @return Offset of the closing quote, or npos when the line ends first.
std::size_t findLiteralClose(std::string_view text, std::size_t open)
{
    for (std::size_t i = open + 1; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (ch == '\\')
        {
            ++i;
            continue;
        }
        if (ch == '"')
            return i;
        if (ch == '\n')
            return std::string_view::npos;
    }
    return std::string_view::npos;
}

/// @brief Skip a character constant starting at @p quote.
/// @return Offset just past the closing apostrophe, or @p quote + 1 when the
///         apostrophe does not start a plausible constant.
std::size_t skipCharConstant(std::string_view text, std::size_t quote)
{
    const std::size_t limit = std::min(text.size(), quote + 1 + kMaxCharConstant);
    for (std::size_t i = quote + 1; i < limit; ++i)
    {
        const char ch = text[i];
        if (ch == '\\')
        {
            ++i;
            continue;
        }
        if (ch == '\'')
            return i + 1;
        // A bare quote only belongs to the constant '"'; otherwise the
        // apostrophe is prose and the quote opens a literal.
        if (ch == '"' && !(i == quote + 1 && i + 1 < text.size() && text[i + 1] == '\''))
            break;
        if (ch == '\n')
            break;
    }
    return quote + 1;
}

/// @brief Drive the literal scan, calling @p onLiteral for every closed span.
template <class Fn> void scanLiterals(std::string_view text, Fn &&onLiteral)
{
    std::size_t i = 0;
    while (i < text.size())
    {
        const char ch = text[i];
        if (ch == '"')
        {
            const std::size_t close = findLiteralClose(text, i);
            if (close == std::string_view::npos)
            {
                ++i;
                continue;
            }
            onLiteral(LiteralSpan{i, close});
            i = close + 1;
        }
        else if (ch == '\'')
        {
            i = skipCharConstant(text, i);
        }
        else
        {
            ++i;
        }
    }
}

} // namespace

std::vector<LiteralSpan> findLiteralSpans(std::string_view text)
{
    std::vector<LiteralSpan> spans;
    scanLiterals(text, [&](LiteralSpan span) { spans.push_back(span); });
    return spans;
}

/// @details The buffer is mutated in place; the corpus is tens of megabytes, so
///          the pass must not build intermediate copies of it.
std::size_t maskLiteralSemicolons(std::string &buffer, char sentinel)
{
    std::size_t masked = 0;
    scanLiterals(buffer,
                 [&](LiteralSpan span)
                 {
                     for (std::size_t i = span.open + 1; i < span.close; ++i)
                     {
                         if (buffer[i] == ';')
                         {
                             buffer[i] = sentinel;
                             ++masked;
                         }
                     }
                 });
    return masked;
}

void restoreSentinels(std::string &text, char sentinel)
{
    std::replace(text.begin(), text.end(), sentinel, ';');
}

} // namespace scour::extract

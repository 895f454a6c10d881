//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Read the decompiled corpus into memory once.
// Key invariants: A missing or unreadable corpus is reported as an error; no
//                 partial buffer is ever returned.
// Ownership/Lifetime: The returned CorpusText owns its buffer.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides corpus loading for the scour driver and tests.
/// @details The corpus is read in one piece; newline normalization and the
///          prefix skip both work in place on that buffer.

#include "tools/common/source_loader.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <new>
#include <sstream>

namespace scour::tools::common
{

void normalizeNewlines(std::string &text)
{
    std::size_t out = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\r')
        {
            text[out++] = '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            continue;
        }
        text[out++] = text[i];
    }
    text.resize(out);
}

std::size_t skipLeadingLines(std::string &text, std::size_t lines)
{
    std::size_t pos = 0;
    std::size_t dropped = 0;
    while (dropped < lines && pos < text.size())
    {
        const std::size_t nl = text.find('\n', pos);
        pos = nl == std::string::npos ? text.size() : nl + 1;
        ++dropped;
    }
    text.erase(0, pos);
    return dropped;
}

support::Expected<extract::CorpusText> loadCorpus(const std::string &path,
                                                  std::size_t skipLines,
                                                  support::SourceManager &sm)
{
    using Result = support::Expected<extract::CorpusText>;

    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Result(support::makeError({}, "unable to open " + path));

    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<unsigned long long>(fileSize) > kMaxCorpusSize)
        return Result(support::makeError({}, "corpus too large: " + path + " (limit: 256 MB)"));

    extract::CorpusText corpus;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        corpus.text = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return Result(support::makeError({}, "out of memory reading " + path));
    }
    if (in.bad())
        return Result(support::makeError({}, "read error on " + path));

    normalizeNewlines(corpus.text);
    const std::size_t dropped = skipLeadingLines(corpus.text, skipLines);

    corpus.fileId = sm.addFile(path);
    if (corpus.fileId == 0)
        return Result(support::makeError({}, std::string(support::kSourceManagerFileIdOverflowMessage)));
    corpus.firstLine = static_cast<uint32_t>(
        std::min<std::size_t>(dropped + 1, std::numeric_limits<uint32_t>::max()));
    return Result(std::move(corpus));
}

} // namespace scour::tools::common

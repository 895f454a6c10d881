//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceLoc helpers and the offset-to-line index used to anchor
// extraction diagnostics in the original corpus.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

#include <algorithm>

namespace scour::support
{

/// @brief Report whether the location refers to a registered file.
/// @return True when a non-zero file identifier is present.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

LineIndex::LineIndex(std::string_view text, uint32_t firstLine) : firstLine_(firstLine)
{
    lineStarts_.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
            lineStarts_.push_back(i + 1);
    }
}

/// @brief Translate a byte offset into a 1-based line/column location.
/// @details Offsets past the end clamp to the last line.  The column counts
///          bytes from the start of the line, starting at one.
/// @param fileId Identifier attached to the returned location.
/// @param offset Byte offset into the indexed buffer.
/// @return Location carrying @p fileId, the line and the column.
SourceLoc LineIndex::locate(uint32_t fileId, std::size_t offset) const
{
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    const std::size_t lineIdx = static_cast<std::size_t>(it - lineStarts_.begin()) - 1;
    SourceLoc loc;
    loc.file_id = fileId;
    loc.line = firstLine_ + static_cast<uint32_t>(lineIdx);
    loc.column = static_cast<uint32_t>(offset - lineStarts_[lineIdx]) + 1;
    return loc;
}

} // namespace scour::support

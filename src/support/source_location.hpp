//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location POD used by diagnostics and the line
//          index that maps corpus byte offsets to line numbers.
// Key invariants: file_id == 0 denotes an invalid location; line numbers are 1-based.
// Ownership/Lifetime: SourceLoc is a value type; LineIndex owns only its offset table.
// Links: src/support/diagnostics.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace scour::support
{

/// @brief Represents a position within a corpus file.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a valid file entry.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

/// @brief Maps byte offsets of a text buffer to line/column pairs.
/// @details Built once per buffer with a single pass over the newlines.
///          Lookups are binary searches, so diagnostics can be positioned
///          cheaply even in corpora of tens of megabytes.
class LineIndex
{
  public:
    /// @brief Index the newlines of @p text.
    /// @param text Buffer to index; only scanned, never retained.
    /// @param firstLine Line number assigned to the first line of @p text.
    explicit LineIndex(std::string_view text, uint32_t firstLine = 1);

    /// @brief Build a location for byte @p offset inside file @p fileId.
    [[nodiscard]] SourceLoc locate(uint32_t fileId, std::size_t offset) const;

    /// @brief Number of lines in the indexed buffer.
    [[nodiscard]] std::size_t lineCount() const
    {
        return lineStarts_.size();
    }

  private:
    std::vector<std::size_t> lineStarts_;
    uint32_t firstLine_;
};

} // namespace scour::support

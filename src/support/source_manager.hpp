//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry of corpus files referenced by diagnostics.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings.
// Links: src/support/diag_expected.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace scour::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers and the corpus
/// paths they were loaded from.  The same path always yields the same id.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view, empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    std::size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Index corresponds to file identifier minus one; deque keeps views stable.
    std::deque<std::string> files_;

    /// Next identifier to assign; 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace scour::support

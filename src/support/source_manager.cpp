//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used to give corpus files stable identifiers so
// extraction diagnostics can print "path:line:" prefixes.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace scour::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
/// @details Paths are normalized so the same corpus reached through different
///          spellings shares one identifier.  Identifiers start at one.
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path, or 0 on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, std::string(kSourceManagerFileIdOverflowMessage)), std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace scour::support

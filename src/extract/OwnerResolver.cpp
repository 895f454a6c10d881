//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/extract/OwnerResolver.cpp
// Purpose: Backward header search and owner table lookup.
// Key invariants: Addresses are rendered without prefix or leading zeros.
// Ownership/Lifetime: See OwnerResolver.hpp.
// Links: src/extract/OwnerResolver.hpp
//
//===----------------------------------------------------------------------===//

#include "extract/OwnerResolver.hpp"

#include "support/text.hpp"

#include <algorithm>
#include <sstream>

namespace scour::extract
{

OwnerResolver::OwnerResolver(config::DatablockOwnerTable table, config::HeaderMarkers markers)
    : table_(std::move(table)), markers_(std::move(markers))
{
}

std::optional<std::string> OwnerResolver::callerAddress(std::string_view text,
                                                        std::size_t offset) const
{
    const std::string_view before = text.substr(0, std::min(offset, text.size()));
    const std::size_t header = before.rfind(markers_.sectionMarker);
    if (header == std::string_view::npos)
        return std::nullopt;

    // The dash run closing the header line bounds the slice.
    const std::size_t dash = before.rfind(markers_.separator);
    if (dash == std::string_view::npos || dash < header)
        return std::nullopt;
    const std::string_view slice = before.substr(header, dash - header);

    const std::size_t open = slice.find('(');
    if (open == std::string_view::npos)
        return std::nullopt;
    const std::size_t close = slice.find(')', open);
    if (close == std::string_view::npos)
        return std::nullopt;

    auto value = support::parseHex(slice.substr(open + 1, close - open - 1));
    if (!value)
        return std::nullopt;

    std::ostringstream os;
    os << std::uppercase << std::hex << *value;
    return os.str();
}

OwnerResolution OwnerResolver::resolve(std::string_view text, std::size_t offset)
{
    OwnerResolution result;
    result.callerAddress = callerAddress(text, offset);
    if (!result.callerAddress)
    {
        result.typeName = std::string(kUnknownOwner);
        return result;
    }

    auto [it, inserted] = table_.emplace(*result.callerAddress, *result.callerAddress);
    result.typeName = it->second;
    result.known = !inserted && it->second != it->first;
    result.newlyRegistered = inserted;
    return result;
}

} // namespace scour::extract

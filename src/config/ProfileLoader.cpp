//===----------------------------------------------------------------------===//
//
// Part of the Scour project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/ProfileLoader.cpp
// Purpose: INI-like profile loader.
// Key invariants: A malformed value never aborts loading; it is reported and
//                 the previous setting is kept.
// Ownership/Lifetime: Loader does not own external resources beyond file path.
// Links: src/config/ProfileLoader.hpp
//
//===----------------------------------------------------------------------===//

#include "config/ProfileLoader.hpp"

#include "support/text.hpp"

#include <fstream>

namespace scour::config
{

namespace
{

using support::DiagnosticEngine;
using support::SourceLoc;

bool isHexAddress(std::string_view sv)
{
    return !sv.empty() && sv.find_first_of("xX") == std::string_view::npos &&
           support::parseHex(sv).has_value();
}

/// The sentinel must not be a byte the literal scanner gives meaning to.
bool isUsableSentinel(unsigned long long code)
{
    constexpr std::string_view kReserved = ";\"'\\\n\r";
    return code != 0 && code <= 0x7f &&
           kReserved.find(static_cast<char>(code)) == std::string_view::npos;
}

/// Parses "none" as a cleared slot, otherwise a field index.
bool parseSlot(std::string_view value, std::optional<std::size_t> &slot)
{
    if (support::toLower(value) == "none")
    {
        slot.reset();
        return true;
    }
    auto parsed = support::parseDecimal(value);
    if (!parsed || *parsed < 0)
        return false;
    slot = static_cast<std::size_t>(*parsed);
    return true;
}

bool applyLayoutKey(FieldLayout &layout, const std::string &key, std::string_view value)
{
    if (key == "fields_after_description")
    {
        auto parsed = support::parseDecimal(value);
        if (!parsed || *parsed < 0)
            return false;
        layout.fieldsAfterDescription = static_cast<std::size_t>(*parsed);
        return true;
    }
    if (key == "name")
        return parseSlot(value, layout.name);
    if (key == "type_name")
        return parseSlot(value, layout.typeName);
    if (key == "address")
        return parseSlot(value, layout.address);
    if (key == "description")
        return parseSlot(value, layout.description);
    if (key == "min_args")
        return parseSlot(value, layout.minArgs);
    if (key == "max_args")
        return parseSlot(value, layout.maxArgs);
    if (key == "type_code")
        return parseSlot(value, layout.typeCode);
    return false;
}

bool applyScanKey(Profile &profile, const std::string &key, std::string_view value)
{
    if (key == "skip_lines")
    {
        auto parsed = support::parseDecimal(value);
        if (!parsed || *parsed < 0)
            return false;
        profile.skipLines = static_cast<std::size_t>(*parsed);
        return true;
    }
    if (key == "call_prefix")
    {
        if (value.empty())
            return false;
        profile.registry.callPrefix = std::string(value);
        return true;
    }
    if (key == "sentinel")
    {
        unsigned long long code = 0;
        if (value.size() == 1)
        {
            code = static_cast<unsigned char>(value.front());
        }
        else
        {
            auto parsed = support::parseHex(value);
            if (!parsed)
                return false;
            code = *parsed;
        }
        if (!isUsableSentinel(code))
            return false;
        profile.registry.sentinel = static_cast<char>(code);
        return true;
    }
    if (key == "title")
    {
        profile.title = std::string(value);
        return true;
    }
    return false;
}

bool applyRegistryKey(Profile &profile, const std::string &key, std::string_view value)
{
    auto category = categoryFromKey(key);
    if (!category)
        return false;
    std::vector<std::string> addresses;
    for (const std::string &item : support::splitList(value))
    {
        if (!isHexAddress(item))
            return false;
        addresses.push_back(support::toUpper(item));
    }
    profile.registry.pattern(*category).addresses = std::move(addresses);
    return true;
}

} // namespace

void applyProfileStream(std::istream &in, Profile &profile, DiagnosticEngine &diags, uint32_t fileId)
{
    std::string line;
    std::string section;
    uint32_t lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        const SourceLoc loc{fileId, lineNo, 0};
        const std::string_view trimmed = support::trim(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';')
            continue;
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = support::toLower(support::trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        const auto eq = trimmed.find('=');
        if (eq == std::string_view::npos)
        {
            diags.warning(loc, "expected 'key = value' in profile");
            continue;
        }
        const std::string_view rawKey = support::trim(trimmed.substr(0, eq));
        const std::string_view value = support::trim(trimmed.substr(eq + 1));
        const std::string key = support::toLower(rawKey);

        bool ok = true;
        if (section == "scan")
        {
            ok = applyScanKey(profile, key, value);
        }
        else if (section == "registry")
        {
            ok = applyRegistryKey(profile, key, value);
        }
        else if (section.rfind("layout.", 0) == 0)
        {
            auto category = categoryFromKey(std::string_view(section).substr(7));
            ok = category && applyLayoutKey(profile.registry.pattern(*category).layout, key, value);
        }
        else if (section == "datablock_owners")
        {
            ok = isHexAddress(rawKey) && !value.empty();
            if (ok)
                profile.owners[support::toUpper(rawKey)] = std::string(value);
        }
        else if (section == "inheritance")
        {
            auto chain = support::splitList(value);
            ok = !rawKey.empty() && !chain.empty();
            if (ok)
                profile.inheritance[std::string(rawKey)] = std::move(chain);
        }
        else if (section == "primitive_types")
        {
            auto code = support::parseDecimal(rawKey);
            ok = code && *code >= 0 && *code < 256;
            if (ok)
            {
                auto &labels = profile.primitiveLabels;
                const auto idx = static_cast<std::size_t>(*code);
                if (labels.size() <= idx)
                    labels.resize(idx + 1, "Unknown");
                labels[idx] = std::string(value);
            }
        }
        else if (section == "name_patches")
        {
            ok = !rawKey.empty();
            if (ok)
                profile.registry.namePatches.push_back({std::string(rawKey), std::string(value)});
        }

        if (!ok)
        {
            diags.warning(loc,
                          "ignoring invalid entry '" + std::string(rawKey) + "' in section [" +
                              section + "]");
        }
    }
}

support::Expected<void> loadProfileFromFile(const std::string &path,
                                            Profile &profile,
                                            DiagnosticEngine &diags,
                                            support::SourceManager &sm)
{
    std::ifstream in(path);
    if (!in)
        return support::makeError({}, "unable to open profile " + path);

    const uint32_t fileId = sm.addFile(path);
    applyProfileStream(in, profile, diags, fileId);
    return support::Expected<void>{};
}

} // namespace scour::config

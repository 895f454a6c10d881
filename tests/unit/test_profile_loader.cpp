// File: tests/unit/test_profile_loader.cpp
// Purpose: Verify INI profiles refine the built-in profile.
// Key invariants: Invalid entries are reported as warnings and leave the
//                 earlier value in place; valid entries override it.
// Ownership/Lifetime: Test owns profiles, diagnostics and the source manager.
// Links: src/config/ProfileLoader.hpp, tests/data/profile.ini

#include <gtest/gtest.h>

#include "config/ProfileLoader.hpp"

#include <set>
#include <sstream>
#include <string>

using namespace scour;
using config::Category;

namespace
{
const std::string kProfilePath = std::string(SCOUR_TEST_DATA_DIR) + "/profile.ini";
} // namespace

TEST(ProfileLoader, FileRefinesBuiltInProfile)
{
    config::Profile profile = config::makeTribes2Profile();
    support::DiagnosticEngine diags;
    support::SourceManager sm;

    auto loaded = config::loadProfileFromFile(kProfilePath, profile, diags, sm);
    ASSERT_TRUE(loaded.hasValue());

    EXPECT_EQ(profile.skipLines, 12u);
    EXPECT_EQ(profile.title, "Test Reference");
    EXPECT_EQ(profile.registry.sentinel, '\x1e');

    const config::CategoryPattern &values = profile.registry.pattern(Category::GlobalValue);
    ASSERT_EQ(values.addresses.size(), 2u);
    EXPECT_EQ(values.addresses[0], "4263B0");
    EXPECT_EQ(values.addresses[1], "4263C0");
    EXPECT_EQ(values.layout.name, 0u);
    EXPECT_EQ(values.layout.typeCode, 2u);
    EXPECT_FALSE(values.layout.address.has_value());

    EXPECT_EQ(profile.owners.at("7A0000"), "ShapeBaseImageData");
    EXPECT_EQ(profile.owners.at("61E7A0"), "ExplosionData");
    EXPECT_EQ(profile.inheritance.at("ShapeBaseImageData").size(), 4u);

    ASSERT_EQ(profile.primitiveLabels.size(), 10u);
    EXPECT_EQ(profile.primitiveLabels[9], "String");
    EXPECT_EQ(profile.primitiveLabels[7], "Unknown");
    EXPECT_EQ(profile.primitiveLabels[3], "Boolean");

    ASSERT_EQ(profile.registry.namePatches.size(), 2u);
    EXPECT_EQ(profile.registry.namePatches.back().artifact, "(int)&off_800000");
    EXPECT_EQ(profile.registry.namePatches.back().replacement, "Terrain");
}

TEST(ProfileLoader, InvalidEntriesWarnAndKeepDefaults)
{
    config::Profile profile = config::makeTribes2Profile();
    support::DiagnosticEngine diags;
    support::SourceManager sm;

    ASSERT_TRUE(config::loadProfileFromFile(kProfilePath, profile, diags, sm).hasValue());
    EXPECT_EQ(profile.registry.pattern(Category::GlobalFunction).layout.minArgs, 3u);

    ASSERT_EQ(diags.warningCount(), 2u);
    const auto &reported = diags.diagnostics();
    EXPECT_NE(reported[0].message.find("'min_args'"), std::string::npos);
    EXPECT_EQ(reported[0].loc.line, 28u);
    EXPECT_EQ(reported[1].loc.line, 29u);
    EXPECT_EQ(reported[1].loc.file_id, 1u);
}

TEST(ProfileLoader, RejectsReservedSentinelsAndPrefixedAddresses)
{
    config::Profile profile = config::makeTribes2Profile();
    support::DiagnosticEngine diags;
    std::istringstream in("[scan]\n"
                          "sentinel = \"\n"
                          "sentinel = 0x00\n"
                          "[registry]\n"
                          "type_methods = 0x426450\n"
                          "unknown_category = 426450\n"
                          "[layout.bogus]\n"
                          "name = 1\n");

    config::applyProfileStream(in, profile, diags);
    EXPECT_EQ(profile.registry.sentinel, '\x1f');
    EXPECT_EQ(profile.registry.pattern(Category::TypeMethod).addresses.size(), 3u);
    EXPECT_EQ(diags.warningCount(), 5u);
}

TEST(ProfileLoader, SingleCharacterSentinelIsAccepted)
{
    config::Profile profile;
    support::DiagnosticEngine diags;
    std::istringstream in("; comment\n[SCAN]\nsentinel = ~\ncall_prefix = fn_\n");

    config::applyProfileStream(in, profile, diags);
    EXPECT_EQ(profile.registry.sentinel, '~');
    EXPECT_EQ(profile.registry.callPrefix, "fn_");
    EXPECT_EQ(diags.warningCount(), 0u);
}

TEST(ProfileLoader, MissingFileIsAnError)
{
    config::Profile profile;
    support::DiagnosticEngine diags;
    support::SourceManager sm;

    auto loaded = config::loadProfileFromFile(kProfilePath + ".missing", profile, diags, sm);
    ASSERT_FALSE(loaded.hasValue());
    EXPECT_EQ(loaded.error().severity, support::Severity::Error);
    EXPECT_NE(loaded.error().message.find("unable to open profile"), std::string::npos);
}

TEST(ProfileTables, InheritanceChainsHaveNoRepeats)
{
    const config::Profile profile = config::makeTribes2Profile();
    for (const auto &[type, chain] : profile.inheritance)
    {
        const std::set<std::string> unique(chain.begin(), chain.end());
        EXPECT_EQ(unique.size(), chain.size()) << type;
        ASSERT_FALSE(chain.empty());
        EXPECT_EQ(chain.front(), type);
    }

    const auto &player = profile.inheritance.at("Player");
    ASSERT_EQ(player.size(), 6u);
    EXPECT_EQ(player[1], "ShapeBase");
    const auto &ai = profile.inheritance.at("AIConnection");
    ASSERT_EQ(ai.size(), 6u);
    EXPECT_EQ(ai[2], "NetConnection");
}

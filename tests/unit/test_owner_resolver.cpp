// File: tests/unit/test_owner_resolver.cpp
// Purpose: Verify datablock owners are resolved from the enclosing
//          subroutine header.
// Key invariants: Unknown callers become their own type name and are
//                 remembered; a missing header yields the unknown owner.
// Ownership/Lifetime: Resolver owns its copy of the owner table.
// Links: src/extract/OwnerResolver.hpp

#include <gtest/gtest.h>

#include "extract/OwnerResolver.hpp"

#include <string>

using namespace scour;
using namespace scour::extract;

namespace
{
const std::string kListing =
    "//----- (0061E7A0) --------------------------------------------------------\n"
    "int sub_61E7A0()\n"
    "{\n"
    "  sub_423F20(\"mass\", 5, 96, 1);\n"
    "  return 0;\n"
    "}\n"
    "//----- (00700000) --------------------------------------------------------\n"
    "int sub_700000()\n"
    "{\n"
    "  sub_423F20(\"mysteryField\", 5, 8, 1);\n"
    "}\n";

OwnerResolver makeResolver()
{
    return OwnerResolver({{"61E7A0", "ExplosionData"}}, config::HeaderMarkers{});
}
} // namespace

TEST(OwnerResolver, KnownCallerMapsToDatablock)
{
    OwnerResolver resolver = makeResolver();
    const std::size_t offset = kListing.find("sub_423F20(\"mass\"");

    EXPECT_EQ(resolver.callerAddress(kListing, offset), "61E7A0");
    const OwnerResolution owner = resolver.resolve(kListing, offset);
    EXPECT_EQ(owner.typeName, "ExplosionData");
    EXPECT_TRUE(owner.known);
    EXPECT_FALSE(owner.newlyRegistered);
}

TEST(OwnerResolver, NearestHeaderWins)
{
    const OwnerResolver resolver = makeResolver();
    const std::size_t offset = kListing.find("sub_423F20(\"mysteryField\"");
    EXPECT_EQ(resolver.callerAddress(kListing, offset), "700000");
}

TEST(OwnerResolver, UnknownCallerBecomesSyntheticType)
{
    OwnerResolver resolver = makeResolver();
    const std::size_t offset = kListing.find("sub_423F20(\"mysteryField\"");

    const OwnerResolution first = resolver.resolve(kListing, offset);
    EXPECT_EQ(first.typeName, "700000");
    EXPECT_FALSE(first.known);
    EXPECT_TRUE(first.newlyRegistered);
    EXPECT_EQ(resolver.table().count("700000"), 1u);

    const OwnerResolution second = resolver.resolve(kListing, offset);
    EXPECT_EQ(second.typeName, "700000");
    EXPECT_FALSE(second.newlyRegistered);
    EXPECT_EQ(resolver.table().size(), 2u);
}

TEST(OwnerResolver, MissingHeaderYieldsUnknownOwner)
{
    OwnerResolver resolver = makeResolver();
    const std::string text = "  sub_423F20(\"orphan\", 1, 2, 3);\n";

    const OwnerResolution owner = resolver.resolve(text, 2);
    EXPECT_EQ(owner.typeName, kUnknownOwner);
    EXPECT_FALSE(owner.callerAddress.has_value());
    EXPECT_EQ(resolver.table().size(), 1u);
}

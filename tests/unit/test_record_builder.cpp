// File: tests/unit/test_record_builder.cpp
// Purpose: Verify registration statements become catalog records or are
//          discarded with a reason.
// Key invariants: Accepted functions satisfy minArgs <= maxArgs and carry a
//                 non-empty name; methods always carry their owning type.
// Ownership/Lifetime: Test owns statements and the registry.
// Links: src/extract/RecordBuilder.hpp

#include <gtest/gtest.h>

#include "config/Profile.hpp"
#include "extract/QuoteMask.hpp"
#include "extract/RecordBuilder.hpp"

#include <string>

using namespace scour;
using namespace scour::extract;
using config::Category;

namespace
{
std::string masked(std::string statement, const config::PatternRegistry &registry)
{
    maskLiteralSemicolons(statement, registry.sentinel);
    return statement;
}
} // namespace

TEST(RecordBuilder, DescriptionAheadOfNameRoundTrips)
{
    config::PatternRegistry registry;
    config::CategoryPattern pattern{Category::GlobalFunction, {"ABCDEF"}, {}};
    pattern.layout.description = 1;
    pattern.layout.name = 2;
    pattern.layout.minArgs = 3;
    pattern.layout.maxArgs = 4;
    pattern.layout.fieldsAfterDescription = 3;

    auto fn = buildFunction(
        masked("sub_ABCDEF(0, \"quote;inside\", \"MyFunc\", 2, 5);\n", registry), pattern, registry);
    ASSERT_TRUE(fn.hasValue());
    EXPECT_EQ(fn.value().name, "MyFunc");
    EXPECT_EQ(fn.value().description, "quote;inside");
    EXPECT_EQ(fn.value().minArgs, 2);
    EXPECT_EQ(fn.value().maxArgs, 5);
    EXPECT_FALSE(fn.value().address.has_value());
    EXPECT_FALSE(fn.value().isMethod());
}

TEST(RecordBuilder, TypeMethodCarriesOwningType)
{
    const config::Profile profile = config::makeTribes2Profile();
    const config::PatternRegistry &registry = profile.registry;
    const config::CategoryPattern &pattern = registry.pattern(Category::TypeMethod);

    auto fn = buildFunction(
        masked("sub_426450(v2, \"SimObject\", \"getName\", sub_4a0b10, \"obj.getName()\", 2, 2);\n",
               registry),
        pattern,
        registry);
    ASSERT_TRUE(fn.hasValue());
    EXPECT_EQ(fn.value().typeName, "SimObject");
    EXPECT_EQ(fn.value().name, "getName");
    EXPECT_EQ(fn.value().address, "4A0B10");
    EXPECT_EQ(fn.value().description, "obj.getName()");
}

TEST(RecordBuilder, SkyPointerIsPatched)
{
    const config::Profile profile = config::makeTribes2Profile();
    const config::PatternRegistry &registry = profile.registry;

    auto fn = buildFunction(
        masked("sub_426450(v2, (int)&off_7957AC, \"realFog\", sub_4A0B30, "
               "\"sky.realFog(show, max, min)\", 5, 5);\n",
               registry),
        registry.pattern(Category::TypeMethod),
        registry);
    ASSERT_TRUE(fn.hasValue());
    EXPECT_EQ(fn.value().typeName, "Sky");
    EXPECT_EQ(fn.value().description, "sky.realFog(show, max, min)");
}

TEST(RecordBuilder, MalformedCountsAreDiscarded)
{
    const config::Profile profile = config::makeTribes2Profile();
    const config::PatternRegistry &registry = profile.registry;
    const config::CategoryPattern &pattern = registry.pattern(Category::GlobalFunction);

    auto inverted = buildFunction("sub_426650(\"f\", sub_1, \"f()\", 5, 2);\n", pattern, registry);
    ASSERT_FALSE(inverted.hasValue());
    EXPECT_NE(inverted.error().message.find("more minimum than maximum"), std::string::npos);

    auto symbolic = buildFunction("sub_426650(\"f\", sub_1, \"f()\", a1, 2);\n", pattern, registry);
    ASSERT_FALSE(symbolic.hasValue());
    EXPECT_NE(symbolic.error().message.find("non-numeric"), std::string::npos);

    auto unnamed = buildFunction("sub_426650(\"\", sub_1, \"f()\", 1, 2);\n", pattern, registry);
    EXPECT_FALSE(unnamed.hasValue());
}

TEST(RecordBuilder, GlobalValueKeepsTypeCode)
{
    const config::Profile profile = config::makeTribes2Profile();
    const config::PatternRegistry &registry = profile.registry;

    auto value = buildGlobalValue("sub_4263B0(\"$pref::Net::LagThreshold\", 1, &dword_7a1234);\n",
                                  registry.pattern(Category::GlobalValue),
                                  registry);
    ASSERT_TRUE(value.hasValue());
    EXPECT_EQ(value.value().name, "$pref::Net::LagThreshold");
    EXPECT_EQ(value.value().typeCode, 1);
    EXPECT_EQ(value.value().address, "7A1234");

    auto bad = buildGlobalValue("sub_4263B0(\"$x\", v3, &dword_1);\n",
                                registry.pattern(Category::GlobalValue),
                                registry);
    EXPECT_FALSE(bad.hasValue());
}

TEST(RecordBuilder, PropertyStartsUnresolved)
{
    const config::Profile profile = config::makeTribes2Profile();
    const config::PatternRegistry &registry = profile.registry;

    auto property = buildProperty("sub_423F20(\"mass\", 5, 96, 1);\n",
                                  registry.pattern(Category::DatablockProperty),
                                  registry);
    ASSERT_TRUE(property.hasValue());
    EXPECT_EQ(property.value().name, "mass");
    EXPECT_EQ(property.value().address, "96");
    EXPECT_FALSE(property.value().typeResolved());
}

// File: tests/unit/test_argument_decomposer.cpp
// Purpose: Verify argument lists split into stable field indices around the
//          free-text description.
// Key invariants: Commas inside the description never shift field indices;
//                 the description slot keeps only its closing quote.
// Ownership/Lifetime: Test owns the masked statements.
// Links: src/extract/ArgumentDecomposer.hpp

#include <gtest/gtest.h>

#include "extract/ArgumentDecomposer.hpp"
#include "extract/QuoteMask.hpp"

#include <string>

using namespace scour;
using namespace scour::extract;

namespace
{
std::string masked(std::string statement)
{
    maskLiteralSemicolons(statement, config::PatternRegistry{}.sentinel);
    return statement;
}

config::FieldLayout globalFunctionLayout()
{
    config::FieldLayout layout;
    layout.name = 0;
    layout.address = 1;
    layout.description = 2;
    layout.minArgs = 3;
    layout.maxArgs = 4;
    layout.fieldsAfterDescription = 2;
    return layout;
}
} // namespace

TEST(ArgumentDecomposer, ArgumentListSpansOuterParentheses)
{
    EXPECT_EQ(argumentList("sub_1(a, (b), c);\n"), "a, (b), c");
    EXPECT_EQ(argumentList("no call here;\n"), "");
}

TEST(ArgumentDecomposer, DescriptionFollowedByThreeFields)
{
    config::FieldLayout layout;
    layout.description = 1;
    layout.name = 2;
    layout.minArgs = 3;
    layout.maxArgs = 4;
    layout.fieldsAfterDescription = 3;

    const std::string statement = masked("sub_ABCDEF(0, \"quote;inside\", \"MyFunc\", 2, 5);\n");
    const DecomposedCall call = decomposeCall(statement, layout, config::PatternRegistry{});

    EXPECT_TRUE(call.hasDescription);
    EXPECT_EQ(call.description, "quote;inside");
    ASSERT_EQ(call.fields.size(), 5u);
    EXPECT_EQ(call.fields[0], "0");
    EXPECT_EQ(call.fields[1], "\"");
    EXPECT_EQ(call.fields[2], " \"MyFunc\"");
    EXPECT_EQ(call.fields[3], " 2");
    EXPECT_EQ(call.fields[4], " 5");
}

TEST(ArgumentDecomposer, CommasInsideDescriptionKeepIndices)
{
    const std::string statement = masked(
        "sub_426650(\"getWord\", sub_4A1B20, \"getWord(text, index); returns a word\", 3, 3);\n");
    const DecomposedCall call =
        decomposeCall(statement, globalFunctionLayout(), config::PatternRegistry{});

    EXPECT_EQ(call.description, "getWord(text, index); returns a word");
    ASSERT_EQ(call.fields.size(), 5u);
    EXPECT_EQ(call.fields[0], "\"getWord\"");
    EXPECT_EQ(call.fields[1], " sub_4A1B20");
    EXPECT_EQ(call.fields[2], "\"");
    EXPECT_EQ(call.fields[3], " 3");
}

TEST(ArgumentDecomposer, CastBeforeDescriptionIsStripped)
{
    const std::string statement =
        masked("sub_426650(\"echo\", sub_1, (int)\"echo(text)\", 2, 2);\n");
    const DecomposedCall call =
        decomposeCall(statement, globalFunctionLayout(), config::PatternRegistry{});
    EXPECT_EQ(call.description, "echo(text)");
    EXPECT_EQ(call.fields.size(), 5u);
}

TEST(ArgumentDecomposer, MissingQuoteLeavesPlainSplit)
{
    const DecomposedCall call =
        decomposeCall("sub_426650(a, b, c, 1, 2);\n", globalFunctionLayout(), config::PatternRegistry{});
    EXPECT_FALSE(call.hasDescription);
    EXPECT_EQ(call.descriptionBegin, -1);
    EXPECT_TRUE(call.description.empty());
    EXPECT_EQ(call.fields.size(), 5u);
}

TEST(ArgumentDecomposer, DescriptionWithoutLeadingComma)
{
    config::FieldLayout layout;
    layout.description = 0;
    layout.minArgs = 1;
    layout.maxArgs = 2;
    layout.fieldsAfterDescription = 2;

    const DecomposedCall call =
        decomposeCall("sub_426650(\"only\", 1, 2);\n", layout, config::PatternRegistry{});
    EXPECT_TRUE(call.hasDescription);
    EXPECT_EQ(call.descriptionBegin, -1);
    EXPECT_EQ(call.description, "only");
    ASSERT_EQ(call.fields.size(), 3u);
    EXPECT_EQ(call.fields[0], "\"");
    EXPECT_EQ(call.fields[2], " 2");
}

TEST(ArgumentDecomposer, UnquotedUsageKeepsNameInPlace)
{
    const DecomposedCall call = decomposeCall("sub_426650(\"nullUsage\", sub_4A1B20, 0, 2, 3);\n",
                                              globalFunctionLayout(),
                                              config::PatternRegistry{});
    EXPECT_FALSE(call.hasDescription);
    EXPECT_EQ(call.descriptionBegin, -1);
    EXPECT_TRUE(call.description.empty());
    ASSERT_EQ(call.fields.size(), 5u);
    EXPECT_EQ(call.fields[0], "\"nullUsage\"");
    EXPECT_EQ(call.fields[2], " 0");
    EXPECT_EQ(call.fields[4], " 3");
}

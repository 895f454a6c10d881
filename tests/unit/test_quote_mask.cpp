// File: tests/unit/test_quote_mask.cpp
// Purpose: Verify in-literal semicolons are masked in place and restored.
// Key invariants: Masking never changes the buffer length or any byte outside
//                 a string literal; restoring the sentinel undoes the mask.
// Ownership/Lifetime: Test owns all buffers.
// Links: src/extract/QuoteMask.hpp

#include <gtest/gtest.h>

#include "extract/QuoteMask.hpp"

#include <string>

using namespace scour::extract;

namespace
{
constexpr char kSentinel = '\x1f';
} // namespace

TEST(QuoteMask, MasksOnlyInsideLiterals)
{
    std::string text = "a; sub_1(\"x;y;z\"); b;";
    const std::string original = text;

    EXPECT_EQ(maskLiteralSemicolons(text, kSentinel), 2u);
    EXPECT_EQ(text.size(), original.size());
    EXPECT_EQ(text, "a; sub_1(\"x\x1fy\x1fz\"); b;");
}

TEST(QuoteMask, EscapedQuoteDoesNotCloseLiteral)
{
    std::string text = "f(\"a\\\";b\");";
    EXPECT_EQ(maskLiteralSemicolons(text, kSentinel), 1u);
    EXPECT_EQ(text, "f(\"a\\\"\x1f" "b\");");
}

TEST(QuoteMask, CharConstantQuoteIsSkipped)
{
    std::string text = "c = '\"'; g(\"k;v\");";
    EXPECT_EQ(maskLiteralSemicolons(text, kSentinel), 1u);
    EXPECT_EQ(text, "c = '\"'; g(\"k\x1fv\");");
}

TEST(QuoteMask, LiteralDoesNotSpanNewline)
{
    std::string text = "x(\"a;\nb;\");";
    const std::string original = text;
    EXPECT_EQ(maskLiteralSemicolons(text, kSentinel), 0u);
    EXPECT_EQ(text, original);
}

TEST(QuoteMask, RestoreUndoesMask)
{
    std::string text = "sub_426650(\"echo\", sub_1, \"echo(a; b); prints\", 2, 2);\n";
    const std::string original = text;
    maskLiteralSemicolons(text, kSentinel);
    EXPECT_NE(text, original);
    restoreSentinels(text, kSentinel);
    EXPECT_EQ(text, original);
}

TEST(QuoteMask, FindsEveryClosedLiteral)
{
    const auto spans = findLiteralSpans("\"a\" + \"b\"");
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].open, 0u);
    EXPECT_EQ(spans[0].close, 2u);
    EXPECT_EQ(spans[1].open, 6u);
    EXPECT_EQ(spans[1].close, 8u);
}

TEST(QuoteMask, ApostropheInProseDoesNotHideLiteral)
{
    std::string text = "x = 1; // it's \"a';b\", 2); y = 3;";
    EXPECT_EQ(maskLiteralSemicolons(text, '~'), 1u);
    EXPECT_EQ(text, "x = 1; // it's \"a'~b\", 2); y = 3;");
}

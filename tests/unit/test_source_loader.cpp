// File: tests/unit/test_source_loader.cpp
// Purpose: Verify corpus loading normalizes newlines and drops the
//          declaration prefix.
// Key invariants: firstLine is one past the number of dropped lines; a
//                 missing corpus is reported as an error, never thrown.
// Ownership/Lifetime: Test creates and removes its temporary corpus file.
// Links: src/tools/common/source_loader.hpp

#include <gtest/gtest.h>

#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace scour;
using namespace scour::tools::common;

TEST(SourceLoader, NormalizesEveryNewlineConvention)
{
    std::string text = "a\r\nb\rc\n\r\n";
    normalizeNewlines(text);
    EXPECT_EQ(text, "a\nb\nc\n\n");
}

TEST(SourceLoader, SkipsLeadingLines)
{
    std::string text = "l1\nl2\nl3\n";
    EXPECT_EQ(skipLeadingLines(text, 2), 2u);
    EXPECT_EQ(text, "l3\n");

    std::string shortText = "a\nb";
    EXPECT_EQ(skipLeadingLines(shortText, 5), 2u);
    EXPECT_TRUE(shortText.empty());
}

TEST(SourceLoader, LoadsAndSkipsPrefix)
{
    const auto path = std::filesystem::temp_directory_path() / "scour_source_loader_test.c";
    {
        std::ofstream out(path, std::ios::binary);
        out << "one\r\ntwo\r\nthree\r\n";
    }

    support::SourceManager sm;
    auto corpus = loadCorpus(path.string(), 1, sm);
    std::filesystem::remove(path);

    ASSERT_TRUE(corpus.hasValue());
    EXPECT_EQ(corpus.value().text, "two\nthree\n");
    EXPECT_EQ(corpus.value().firstLine, 2u);
    EXPECT_EQ(corpus.value().fileId, 1u);
    EXPECT_EQ(sm.fileCount(), 1u);
}

TEST(SourceLoader, MissingCorpusIsAnError)
{
    support::SourceManager sm;
    auto corpus = loadCorpus("/nonexistent/scour/corpus.c", 0, sm);
    ASSERT_FALSE(corpus.hasValue());
    EXPECT_NE(corpus.error().message.find("unable to open"), std::string::npos);
    EXPECT_EQ(sm.fileCount(), 0u);
}

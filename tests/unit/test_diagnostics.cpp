// File: tests/unit/test_diagnostics.cpp
// Purpose: Verify diagnostics are counted, filtered and printed in the
//          path:line:col format.
// Key invariants: printAll honours the minimum severity; locations without a
//                 registered file print the bare severity and message.
// Ownership/Lifetime: Test owns the engine and source manager.
// Links: src/support/diagnostics.hpp, src/support/diag_expected.hpp

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/source_location.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace scour::support;

TEST(Diagnostics, CountsBySeverity)
{
    DiagnosticEngine diags;
    diags.note({}, "n1");
    diags.note({}, "n2");
    diags.warning({}, "w");
    diags.error({}, "e");

    EXPECT_EQ(diags.noteCount(), 2u);
    EXPECT_EQ(diags.warningCount(), 1u);
    EXPECT_EQ(diags.errorCount(), 1u);
    EXPECT_EQ(diags.diagnostics().size(), 4u);
}

TEST(Diagnostics, PrintAllFiltersBelowMinimum)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("listing/./t2.c");
    DiagnosticEngine diags;
    diags.note({id, 4, 2}, "hidden");
    diags.warning({id, 4, 2}, "shown");

    std::ostringstream os;
    diags.printAll(os, &sm, Severity::Warning);
    EXPECT_EQ(os.str(), "listing/t2.c:4:2: warning: shown\n");
}

TEST(Diagnostics, PrintDiagWithoutFile)
{
    std::ostringstream os;
    printDiag(makeError({}, "unable to open corpus.c"), os);
    EXPECT_EQ(os.str(), "error: unable to open corpus.c\n");
}

TEST(Diagnostics, SourceManagerReusesIds)
{
    SourceManager sm;
    const uint32_t first = sm.addFile("a/b/../c.c");
    EXPECT_EQ(sm.addFile("a/c.c"), first);
    EXPECT_EQ(sm.fileCount(), 1u);
    EXPECT_EQ(sm.getPath(0), "");
}

TEST(Diagnostics, LineIndexHonoursFirstLine)
{
    const LineIndex index("ab\ncd\n", 10);
    const SourceLoc loc = index.locate(3, 4);
    EXPECT_EQ(loc.file_id, 3u);
    EXPECT_EQ(loc.line, 11u);
    EXPECT_EQ(loc.column, 2u);
    EXPECT_TRUE(loc.isValid());
    EXPECT_EQ(index.lineCount(), 3u);
}

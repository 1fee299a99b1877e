//===----------------------------------------------------------------------===//
//
// Part of the Shake project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/SupportTests.cpp
// Purpose: Test suite for diagnostics, source registry, locations and tracing.
// Key invariants: File identifiers start at one; printed diagnostics end in a newline.
// Ownership/Lifetime: Each test owns its engines and streams.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"
#include "support/source_manager.hpp"
#include "support/trace.hpp"

#include <sstream>
#include <string>

using namespace shake::support;

TEST(SupportTest, DiagnosticFormatting)
{
    SourceManager sm;
    SourceLoc loc{sm.addFile("test"), 1, 1};
    DiagnosticEngine de;
    de.report({Severity::Error, "oops", loc});
    de.report({Severity::Warning, "careful", {}});

    std::ostringstream oss;
    de.printAll(oss, &sm);
    EXPECT_EQ(oss.str(), "test:1:1: error: oops\nwarning: careful\n");
    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    EXPECT_EQ(de.diagnostics().size(), 2u);
}

TEST(SupportTest, PrintDiagIncludesCode)
{
    SourceManager sm;
    const uint32_t id = sm.addFile("lib/a.js");
    std::ostringstream oss;
    printDiag(makeError({id, 3, 7}, "Duplicated import 'x'", "S3001"), oss, &sm);
    EXPECT_EQ(oss.str(), "lib/a.js:3:7: error[S3001]: Duplicated import 'x'\n");

    std::ostringstream bare;
    printDiag(makeError({}, "no location"), bare);
    EXPECT_EQ(bare.str(), "error: no location\n");
}

TEST(SupportTest, ExpectedCarriesValueOrDiagnostic)
{
    Expected<int> ok = 42;
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad = makeError({}, "failed", "S4000");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "failed");
    EXPECT_EQ(bad.error().severity, Severity::Error);

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> broken = makeError({}, "nope");
    EXPECT_FALSE(broken.hasValue());
    EXPECT_EQ(broken.error().message, "nope");
}

TEST(SupportTest, SourceManagerNormalizesAndDeduplicates)
{
    SourceManager sm;
    const uint32_t first = sm.addFile("src/./lib/../main.js");
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(sm.getPath(first), "src/main.js");
    EXPECT_EQ(sm.addFile("src/main.js"), first);
    EXPECT_EQ(sm.addFile("src/util.js"), 2u);

    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(9).empty());

    sm.setText(first, "var a;\nvar b;\n");
    EXPECT_EQ(sm.getText(first), "var a;\nvar b;\n");
    const SourceLoc loc = sm.locate(first, 11);
    EXPECT_EQ(loc.file_id, first);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 5u);
}

TEST(SupportTest, LocateOffsetClampsToText)
{
    const SourceLoc start = locateOffset(0, "ab\ncd", 0);
    EXPECT_EQ(start.line, 1u);
    EXPECT_EQ(start.column, 1u);

    const SourceLoc past = locateOffset(0, "ab\ncd", 100);
    EXPECT_EQ(past.line, 2u);
    EXPECT_EQ(past.column, 3u);
    EXPECT_FALSE(past.isValid());
}

TEST(SupportTest, TraceSinkRespectsMode)
{
    std::ostringstream oss;
    TraceConfig cfg;
    cfg.os = &oss;

    TraceSink off(cfg);
    off.onDefine("a.js", "x");
    EXPECT_TRUE(oss.str().empty());

    cfg.mode = TraceConfig::Modules;
    TraceSink modules(cfg);
    modules.onModuleFetched("path", true);
    modules.onRename("a.js", "x", "_x");
    modules.onStatementIncluded("a.js", 0, 0, 6);
    EXPECT_EQ(oss.str(), "[shake] fetch path (external)\n[shake] rename a.js x -> _x\n");

    oss.str("");
    cfg.mode = TraceConfig::Statements;
    TraceSink statements(cfg);
    statements.onStatementIncluded("a.js", 0, 4, 10);
    EXPECT_EQ(oss.str(), "[shake] include a.js @4..10\n");
}

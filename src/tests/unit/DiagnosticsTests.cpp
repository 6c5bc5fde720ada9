//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/DiagnosticsTests.cpp
// Purpose: Check diagnostic printing, counting and Expected propagation.
// Key invariants: Printed diagnostics follow
//                 `<severity>: <function>: <parameter>: <message> [<kind>]`.
// Ownership/Lifetime: Each test owns its engine.
// Links: docs/codemap.md#support
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <sstream>
#include <string>

using namespace hat::support;

namespace
{

Expected<int> half(int value)
{
    if (value % 2 != 0)
        return makeError(ErrorKind::InvalidOption, "value must be even", "half", "value");
    return value / 2;
}

} // namespace

TEST(DiagnosticsTest, PrintsAllFields)
{
    std::ostringstream os;
    printDiag(makeError(ErrorKind::ShapeMismatch, "expected 6 elements, got 5", "gemm", "A"), os);
    EXPECT_EQ(os.str(), "error: gemm: A: expected 6 elements, got 5 [ShapeMismatch]\n");
}

TEST(DiagnosticsTest, OmitsEmptyFields)
{
    std::ostringstream os;
    printDiag(makeWarning(ErrorKind::None, "nothing to run"), os);
    printDiag(makeError(ErrorKind::IOError, "disk full", "", ""), os);
    EXPECT_EQ(os.str(), "warning: nothing to run\nerror: disk full [IOError]\n");
}

TEST(DiagnosticsTest, EngineCountsBySeverity)
{
    DiagnosticEngine engine;
    engine.report(makeWarning(ErrorKind::UnspecifiedOwnership, "leaks", "Range", "output"));
    engine.report(makeError(ErrorKind::SymbolNotFound, "missing", "f"));
    engine.report(Diagnostic{Severity::Note, ErrorKind::None, "fyi"});

    EXPECT_EQ(engine.warningCount(), 1u);
    EXPECT_EQ(engine.errorCount(), 1u);
    EXPECT_EQ(engine.diagnostics().size(), 3u);
    EXPECT_TRUE(engine.contains(ErrorKind::SymbolNotFound));
    EXPECT_FALSE(engine.contains(ErrorKind::ShapeMismatch));

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(),
              "warning: Range: output: leaks [UnspecifiedOwnership]\n"
              "error: f: missing [SymbolNotFound]\n"
              "note: fyi\n");
}

TEST(DiagnosticsTest, ExpectedCarriesValueOrDiagnostic)
{
    auto ok = half(8);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 4);

    auto bad = half(3);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidOption);
    EXPECT_EQ(bad.error().parameter, "value");

    const Diag taken = bad.takeError();
    EXPECT_EQ(taken.function, "half");
    EXPECT_EQ(toString(taken.kind), "InvalidOption");
}

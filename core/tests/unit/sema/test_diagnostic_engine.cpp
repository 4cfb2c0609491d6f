// tests/unit/sema/test_diagnostic_engine.cpp - Diagnostic report and checks
//
// Report-level tests go through create_diagnostic_report() (0-based ranges);
// checker-level tests run one DiagnosticChecker check on a parsed or
// hand-built program (1-based ranges).
//

#include <gtest/gtest.h>

#include <filesystem>
#include <gsl/span>
#include <string>
#include <vector>

#include "syx/ast/ast.hpp"
#include "syx/ast/ast_context.hpp"
#include "syx/sema/diagnostic_engine.hpp"
#include "syx/syntax/frontend.hpp"
#include "test_support.hpp"

using namespace syx;

namespace
{

constexpr const char * k_file = "/tmp/syx_diag/main.syx";

DiagnosticBag run_checks(const std::string & text, const std::string & file = k_file)
{
  DiagnosticBag bag;
  const auto unit = parse_source(file, text, syntax::Grammar::Declaration);
  DiagnosticChecker checker(file, bag);
  checker.check_all(*unit->program);
  return bag;
}

const TextEdit & only_edit(const CodeAction & action, const std::string & file)
{
  return action.changes.at(file).at(0);
}

}  // namespace

// ============================================================================
// Report
// ============================================================================

TEST(SemaDiagnosticReport, ValidKeywordHasNoItems)
{
  const DiagnosticReport report = create_diagnostic_report(k_file, std::string_view("keyword ruleish;"));
  EXPECT_EQ(report.kind, "full");
  EXPECT_TRUE(report.items.empty());
}

TEST(SemaDiagnosticReport, MissingSemicolonIsSingleZeroBasedError)
{
  const DiagnosticReport report = create_diagnostic_report(k_file, std::string_view("keyword ruleis"));
  ASSERT_EQ(report.items.size(), 1U);

  const Diagnostic & d = report.items[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.message, "Expected ';' after statement, found 'EOF'.");
  EXPECT_EQ(d.range, (SourceRange{0, 14, 0, 14}));
  EXPECT_EQ(d.source, "syntax-script");
}

TEST(SemaDiagnosticReport, ParseErrorStopsFurtherChecks)
{
  // The duplicate keyword would be reported if checks ran
  const DiagnosticReport report = create_diagnostic_report(
    k_file, std::string_view("keyword a;\nkeyword a;\nrule 'custom-random-rule?';"));
  ASSERT_EQ(report.items.size(), 1U);
  EXPECT_EQ(report.items[0].message, "Unknown rule 'custom-random-rule?'.");
  EXPECT_EQ(report.items[0].actions.size(), 5U);
}

TEST(SemaDiagnosticReport, CodeActionEditsAreZeroBased)
{
  const DiagnosticReport report =
    create_diagnostic_report(k_file, std::string_view("rule 'imports-keywor': import;"));
  ASSERT_EQ(report.items.size(), 1U);
  const Diagnostic & d = report.items[0];
  EXPECT_EQ(d.range, (SourceRange{0, 5, 0, 21}));
  ASSERT_FALSE(d.actions.empty());
  EXPECT_EQ(only_edit(d.actions[0], k_file).range, (SourceRange{0, 5, 0, 21}));
  EXPECT_EQ(only_edit(d.actions[0], k_file).new_text, "'imports-keyword'");
}

TEST(SemaDiagnosticReport, UnreadableFile)
{
  const DiagnosticReport report = create_diagnostic_report("/nonexistent/syx/missing.syx");
  ASSERT_EQ(report.items.size(), 1U);
  EXPECT_EQ(report.items[0].severity, Severity::Error);
  EXPECT_EQ(report.items[0].message, "Can't read file '/nonexistent/syx/missing.syx'.");
}

TEST(SemaDiagnosticReport, ReadsFromDiskWhenContentAbsent)
{
  test::TempDir dir;
  const auto path = dir.write("main.syx", "keyword ruleis");

  const DiagnosticReport report = create_diagnostic_report(path.string());
  ASSERT_EQ(report.items.size(), 1U);
  EXPECT_EQ(report.items[0].message, "Expected ';' after statement, found 'EOF'.");
}

TEST(SemaDiagnosticReport, UsageFilesUseUsageGrammar)
{
  const DiagnosticReport report =
    create_diagnostic_report("/tmp/syx_diag/page.sys", std::string_view("keyword a;\n:::x"));
  ASSERT_EQ(report.items.size(), 1U);
  EXPECT_EQ(report.items[0].message, "Unexpected expression: 'keyword'");
}

TEST(SemaDiagnosticReport, AcceptsFileUris)
{
  const DiagnosticReport report =
    create_diagnostic_report("file:///tmp/syx_diag/main.syx", std::string_view("keyword ruleis"));
  ASSERT_EQ(report.items.size(), 1U);
  EXPECT_EQ(report.items[0].file, "file:///tmp/syx_diag/main.syx");
}

TEST(SemaDiagnosticReport, Deterministic)
{
  const std::string text =
    "rule 'enforce-single-string-quotes': true;\n"
    "rule 'enforce-double-string-quotes': true;\n"
    "keyword a;\n"
    "keyword a;\n";
  const DiagnosticReport first = create_diagnostic_report(k_file, std::string_view(text));
  const DiagnosticReport second = create_diagnostic_report(k_file, std::string_view(text));
  ASSERT_EQ(first.items.size(), 3U);
  EXPECT_EQ(first.items, second.items);
}

// ============================================================================
// Rule conflicts
// ============================================================================

TEST(SemaRuleConflicts, BothSidesWarnWithTwoFixes)
{
  const DiagnosticReport report = create_diagnostic_report(
    k_file, std::string_view(
              "rule 'enforce-single-string-quotes': true;\n"
              "rule 'enforce-double-string-quotes': true;"));
  ASSERT_EQ(report.items.size(), 2U);

  const Diagnostic & on_double = report.items[0];
  EXPECT_EQ(on_double.severity, Severity::Warning);
  EXPECT_EQ(
    on_double.message,
    "Rule 'enforce-double-string-quotes' conflicts with 'enforce-single-string-quotes', Both of "
    "them should not be defined.");
  EXPECT_EQ(on_double.range, (SourceRange{1, 0, 1, 41}));
  ASSERT_EQ(on_double.actions.size(), 2U);
  EXPECT_EQ(on_double.actions[0].title, "Remove enforce-single-string-quotes definition");
  EXPECT_EQ(only_edit(on_double.actions[0], k_file).range, (SourceRange{0, 0, 0, 42}));
  EXPECT_EQ(only_edit(on_double.actions[0], k_file).new_text, "");
  EXPECT_EQ(on_double.actions[1].title, "Remove enforce-double-string-quotes definition");
  EXPECT_EQ(only_edit(on_double.actions[1], k_file).range, (SourceRange{1, 0, 1, 42}));

  const Diagnostic & on_single = report.items[1];
  EXPECT_EQ(on_single.severity, Severity::Warning);
  EXPECT_EQ(on_single.range, (SourceRange{0, 0, 0, 41}));
  EXPECT_EQ(on_single.actions.size(), 2U);
}

TEST(SemaRuleConflicts, SingleRuleIsFine)
{
  EXPECT_TRUE(run_checks("rule 'enforce-single-string-quotes': true;").empty());
}

TEST(SemaRuleConflicts, RemovalCoversSpacedSemicolon)
{
  const DiagnosticReport report = create_diagnostic_report(
    k_file, std::string_view(
              "rule 'enforce-single-string-quotes': true ;\n"
              "rule 'enforce-double-string-quotes': true\n;"));
  ASSERT_EQ(report.items.size(), 2U);

  const Diagnostic & on_double = report.items[0];
  ASSERT_EQ(on_double.actions.size(), 2U);
  EXPECT_EQ(only_edit(on_double.actions[0], k_file).range, (SourceRange{0, 0, 0, 43}));
  EXPECT_EQ(only_edit(on_double.actions[1], k_file).range, (SourceRange{1, 0, 2, 1}));
}

// ============================================================================
// Duplicate rules
// ============================================================================

TEST(SemaDuplicateRules, LaterDefinitionIsReported)
{
  const DiagnosticBag bag = run_checks(
    "rule 'function-value-return-enabled': true;\n"
    "rule 'function-value-return-enabled': false;");
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.message, "Rule 'function-value-return-enabled' is already defined.");
  EXPECT_EQ(d.range.start.line, 2U);
  ASSERT_EQ(d.actions.size(), 1U);
  EXPECT_EQ(d.actions[0].title, "Remove this definition");
  EXPECT_EQ(only_edit(d.actions[0], k_file).range.end.character, d.range.end.character + 1);
}

// ============================================================================
// Imports
// ============================================================================

TEST(SemaImports, ResolvedImportIsClean)
{
  test::TempDir dir;
  dir.write("lib.syx", "export keyword a;");
  const auto main = dir.write("main.syx", "import './lib';");

  const DiagnosticReport report = create_diagnostic_report(main.string());
  EXPECT_TRUE(report.items.empty());
}

TEST(SemaImports, DottedNameResolvesToDeclarationFile)
{
  test::TempDir dir;
  dir.write("lib.v2.syx", "export keyword a;");
  const auto main = dir.write("main.syx", "import './lib.v2';");

  const DiagnosticReport report = create_diagnostic_report(main.string());
  EXPECT_TRUE(report.items.empty());
}

TEST(SemaImports, MissingFile)
{
  test::TempDir dir;
  const auto main = dir.write("main.syx", "import './missing';");

  const DiagnosticBag bag = run_checks("import './missing';", main.string());
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all()[0];
  const std::string target = (dir.path / "missing.syx").string();
  EXPECT_EQ(d.message, "Can't find file '" + target + "' imported from '" + main.string() + "'");
  EXPECT_EQ(d.range, (SourceRange{1, 1, 1, 19}));
  ASSERT_EQ(d.actions.size(), 1U);
  EXPECT_EQ(d.actions[0].title, "Remove this import statement");
  EXPECT_EQ(only_edit(d.actions[0], main.string()).range, (SourceRange{1, 1, 1, 20}));
}

TEST(SemaImports, DirectoryIsNotAFile)
{
  test::TempDir dir;
  std::filesystem::create_directories(dir.path / "folder.syx");
  const auto main = dir.write("main.syx", "");

  const DiagnosticBag bag = run_checks("import './folder';", main.string());
  ASSERT_EQ(bag.size(), 1U);
  const std::string target = (dir.path / "folder.syx").string();
  EXPECT_EQ(
    bag.all()[0].message,
    "'" + target + "' imported from '" + main.string() + "' doesn't seem to be a file.");
}

TEST(SemaImports, NonDeclarationFileCannotBeImported)
{
  test::TempDir dir;
  dir.write("data.txt", "x");
  const auto main = dir.write("main.syx", "");

  const DiagnosticBag bag = run_checks("import './data.txt';", main.string());
  ASSERT_EQ(bag.size(), 1U);
  const std::string target = (dir.path / "data.txt").string();
  EXPECT_EQ(
    bag.all()[0].message,
    "'" + target + "' imported from '" + main.string() + "' cannot be imported.");
}

TEST(SemaImports, UsageFileImportsAreChecked)
{
  test::TempDir dir;
  dir.write("ops.syx", "keyword a;");
  const auto page = dir.write("page.sys", "import './ops';\nimport './gone';\n:::1+2");

  const DiagnosticReport report = create_diagnostic_report(page.string());
  ASSERT_EQ(report.items.size(), 1U);
  EXPECT_EQ(report.items[0].range.start.line, 1U);
}

// ============================================================================
// Duplicate operator patterns
// ============================================================================

TEST(SemaDuplicateOperators, SamePatternReportedOnLaterOperator)
{
  const DiagnosticBag bag = run_checks(
    "operator <int> '+' <int> { compile(ts) int|0; }\n"
    "operator <int> '+' <int> { compile(ts) int|1; }\n"
    "operator <int> '-' <int> { compile(ts) int|1; }");
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.message, "Regex of this operator is same with another operator.");
  EXPECT_EQ(d.range, (SourceRange{2, 10, 2, 25}));
  ASSERT_EQ(d.actions.size(), 1U);
  EXPECT_EQ(d.actions[0].title, "Remove this operator");
  EXPECT_EQ(only_edit(d.actions[0], k_file).range, (SourceRange{2, 1, 2, 48}));
}

TEST(SemaDuplicateOperators, WhitespaceMakesPatternsDifferent)
{
  EXPECT_TRUE(run_checks(
                "operator <int> '+' <int> { compile(ts) int|0; }\n"
                "operator <int> +s '+' +s <int> { compile(ts) int|0; }")
                .empty());
}

// ============================================================================
// Duplicate names
// ============================================================================

TEST(SemaDuplicateNames, TopLevelKeywordsAndFunctions)
{
  const DiagnosticBag bag = run_checks(
    "keyword a;\n"
    "keyword a;\n"
    "function f <int> { compile(ts) 'f'; }\n"
    "function f <string> { compile(ts) 'g'; }");
  ASSERT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.all()[0].message, "Duplicate declaration of 'a'.");
  EXPECT_EQ(bag.all()[0].range, (SourceRange{2, 1, 2, 10}));
  EXPECT_TRUE(bag.all()[0].actions.empty());
  EXPECT_EQ(bag.all()[1].message, "Duplicate declaration of 'f'.");
}

TEST(SemaDuplicateNames, GlobalBodyIsItsOwnScope)
{
  const DiagnosticBag bag = run_checks(
    "keyword a;\n"
    "global g {\n"
    "  keyword a;\n"
    "  keyword b;\n"
    "  keyword b;\n"
    "}");
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].message, "Duplicate declaration of 'b'.");
  EXPECT_EQ(bag.all()[0].range.start.line, 5U);
}

// ============================================================================
// Exportable
// ============================================================================

TEST(SemaExportable, ExportOnNonExportableStatement)
{
  AstContext ctx;
  const syntax::Token export_tok{
    syntax::TokenType::ExportKeyword, "export", SourceRange{1, 1, 1, 7}};

  auto * imp = ctx.create<ImportStmt>("./a", SourceRange{1, 1, 1, 19});
  imp->modifiers = ctx.copy_to_arena(std::vector<syntax::Token>{export_tok});
  auto * kw = ctx.create<KeywordStmt>("a", SourceRange{2, 1, 2, 10});
  const auto body = ctx.copy_to_arena(std::vector<Stmt *>{imp, kw});

  DiagnosticBag bag;
  DiagnosticChecker checker(k_file, bag);
  checker.check_exportable(body);

  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.message, "This statement cannot be exported.");
  EXPECT_EQ(d.range, (SourceRange{1, 1, 1, 19}));
  ASSERT_EQ(d.actions.size(), 1U);
  EXPECT_EQ(d.actions[0].title, "Remove export keyword");
  EXPECT_EQ(only_edit(d.actions[0], k_file).range, (SourceRange{1, 1, 1, 7}));
}

TEST(SemaExportable, RecursesIntoBodies)
{
  AstContext ctx;
  const syntax::Token export_tok{
    syntax::TokenType::ExportKeyword, "export", SourceRange{2, 3, 2, 9}};

  auto * compile = ctx.create<CompileStmt>(
    gsl::span<std::string_view>{}, gsl::span<Expr *>{}, SourceRange{2, 3, 2, 24});
  compile->modifiers = ctx.copy_to_arena(std::vector<syntax::Token>{export_tok});
  auto * op = ctx.create<OperatorStmt>(
    gsl::span<Expr *>{}, ctx.copy_to_arena(std::vector<Stmt *>{compile}), SourceRange{1, 1, 3, 2});
  auto * program =
    ctx.create<Program>(ctx.copy_to_arena(std::vector<Stmt *>{op}), SourceRange{1, 1, 3, 2});

  DiagnosticBag bag;
  DiagnosticChecker checker(k_file, bag);
  checker.check_all(*program);

  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].range, (SourceRange{2, 3, 2, 24}));
}

TEST(SemaExportable, ExportedDeclarationsAreClean)
{
  EXPECT_TRUE(run_checks(
                "export keyword a;\n"
                "export rule 'imports-keyword': a;\n"
                "export global g { export keyword b; }\n"
                "export function f <int> { compile(ts) 'f'; }")
                .empty());
}

// syx/sema/diagnostic_engine.cpp - Semantic checks and the diagnostic report
#include "syx/sema/diagnostic_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

#include "syx/basic/compiler_error.hpp"
#include "syx/codegen/pattern.hpp"
#include "syx/sema/registry.hpp"
#include "syx/syntax/frontend.hpp"

namespace syx
{

namespace
{

std::string single_quoted(std::string_view v) { return "'" + std::string(v) + "'"; }

std::vector<const RuleStmt *> collect_rules(const Program & program)
{
  std::vector<const RuleStmt *> rules;
  for (const Stmt * s : program.body) {
    if (const auto * r = dyn_cast<RuleStmt>(s)) {
      rules.push_back(r);
    }
  }
  return rules;
}

/// Name a Function/Global/Keyword statement declares, empty for others
std::string_view declared_name(const Stmt * s)
{
  if (const auto * fn = dyn_cast<FunctionStmt>(s)) return fn->name;
  if (const auto * gl = dyn_cast<GlobalStmt>(s)) return gl->name;
  if (const auto * kw = dyn_cast<KeywordStmt>(s)) return kw->word;
  return {};
}

}  // namespace

// ============================================================================
// Report
// ============================================================================

DiagnosticBag collect_diagnostics(
  std::string_view file_path_or_uri, std::optional<std::string_view> content)
{
  const std::string file(file_path_or_uri);
  const std::filesystem::path path = uri_or_path_to_path(file);

  DiagnosticBag diags;

  std::string text;
  if (content) {
    text = std::string(*content);
  } else if (auto loaded = read_file_to_string(path)) {
    text = std::move(*loaded);
  } else {
    diags.report_error(SourceRange{}, "Can't read file " + single_quoted(path.string()) + ".")
      .in_file(file);
    return diags;
  }

  try {
    const auto unit = parse_source(file, std::move(text), grammar_for_path(path));
    DiagnosticChecker checker(file, diags);
    checker.check_all(*unit->program);
  } catch (const CompilerError & e) {
    diags.add(e.to_diagnostic());
  }
  return diags;
}

DiagnosticReport create_diagnostic_report(
  std::string_view file_path_or_uri, std::optional<std::string_view> content)
{
  DiagnosticBag diags = collect_diagnostics(file_path_or_uri, content);

  DiagnosticReport report;
  for (auto & d : diags.take()) {
    report.items.push_back(to_zero_based(std::move(d)));
  }
  return report;
}

// ============================================================================
// DiagnosticChecker
// ============================================================================

void DiagnosticChecker::check_all(const Program & program)
{
  check_exportable(program.body);
  check_rule_conflicts(program);
  check_duplicate_rules(program);
  check_imports(program);
  check_duplicate_operator_patterns(program);
  check_duplicate_names(program.body);
}

void DiagnosticChecker::check_exportable(gsl::span<Stmt * const> statements)
{
  for (const Stmt * stmt : statements) {
    const syntax::Token * exp = stmt->find_modifier(syntax::TokenType::ExportKeyword);
    if (exp != nullptr && !registry::is_exportable(stmt->type)) {
      diags_.report_error(stmt->range, "This statement cannot be exported.")
        .in_file(file_)
        .with_removal("Remove export keyword", exp->range);
    }

    if (registry::has_body(stmt->type)) {
      check_exportable(statement_body(stmt));
    }
  }
}

void DiagnosticChecker::check_rule_conflicts(const Program & program)
{
  const std::vector<const RuleStmt *> rules = collect_rules(program);

  for (const RuleStmt * rule : rules) {
    for (const RuleStmt * other : rules) {
      if (other == rule || !registry::rules_conflict(rule->rule, other->rule)) continue;

      diags_
        .report_warning(
          other->range, "Rule " + single_quoted(other->rule) + " conflicts with " +
                          single_quoted(rule->rule) + ", Both of them should not be defined.")
        .in_file(file_)
        .with_removal(
          "Remove " + std::string(rule->rule) + " definition", rule->range_with_terminator())
        .with_removal(
          "Remove " + std::string(other->rule) + " definition", other->range_with_terminator());
    }
  }
}

void DiagnosticChecker::check_duplicate_rules(const Program & program)
{
  const std::vector<const RuleStmt *> rules = collect_rules(program);

  for (size_t i = 0; i < rules.size(); ++i) {
    const bool seen_before = std::any_of(
      rules.begin(), rules.begin() + static_cast<std::ptrdiff_t>(i),
      [&](const RuleStmt * r) { return r->rule == rules[i]->rule; });
    if (!seen_before) continue;

    diags_
      .report_error(
        rules[i]->range, "Rule " + single_quoted(rules[i]->rule) + " is already defined.")
      .in_file(file_)
      .with_removal("Remove this definition", rules[i]->range_with_terminator());
  }
}

void DiagnosticChecker::check_imports(const Program & program)
{
  namespace fs = std::filesystem;

  const std::string importer = uri_or_path_to_path(file_).string();

  for (const Stmt * s : program.body) {
    const auto * import = dyn_cast<ImportStmt>(s);
    if (import == nullptr) continue;

    // A path naming an existing non-declaration file is checked as written
    fs::path target = resolve_import_path(file_, import->path);
    std::error_code ec;
    if (!fs::exists(target, ec)) {
      const fs::path literal =
        (uri_or_path_to_path(file_).parent_path() / std::string(import->path)).lexically_normal();
      if (literal.extension() != ".syx" && fs::exists(literal, ec)) {
        target = literal;
      }
    }

    const std::string target_text = target.string();
    const SourceRange removal = import->range_with_terminator();

    if (!fs::exists(target, ec)) {
      diags_
        .report_error(
          import->range, "Can't find file " + single_quoted(target_text) + " imported from " +
                           single_quoted(importer))
        .in_file(file_)
        .with_removal("Remove this import statement", removal);
      continue;
    }

    if (!fs::is_regular_file(target, ec)) {
      diags_
        .report_error(
          import->range, single_quoted(target_text) + " imported from " +
                           single_quoted(importer) + " doesn't seem to be a file.")
        .in_file(file_)
        .with_removal("Remove this import statement", removal);
    }

    if (target.extension() != ".syx") {
      diags_
        .report_error(
          import->range, single_quoted(target_text) + " imported from " +
                           single_quoted(importer) + " cannot be imported.")
        .in_file(file_)
        .with_removal("Remove this import statement", removal);
    }
  }
}

void DiagnosticChecker::check_duplicate_operator_patterns(const Program & program)
{
  std::vector<std::string> seen;

  for (const Stmt * s : program.body) {
    const auto * op = dyn_cast<OperatorStmt>(s);
    if (op == nullptr) continue;

    std::string source = codegen::build_operator_pattern(*op).source;
    if (std::find(seen.begin(), seen.end(), source) == seen.end()) {
      seen.push_back(std::move(source));
      continue;
    }

    const SourceRange range = op->regex.empty()
                                ? op->range
                                : join_ranges(op->regex.front()->range, op->regex.back()->range);
    diags_.report_error(range, "Regex of this operator is same with another operator.")
      .in_file(file_)
      .with_removal("Remove this operator", op->range);
  }
}

void DiagnosticChecker::check_duplicate_names(gsl::span<Stmt * const> scope)
{
  std::vector<std::string_view> seen;

  for (const Stmt * s : scope) {
    const std::string_view name = declared_name(s);
    if (!name.empty()) {
      if (std::find(seen.begin(), seen.end(), name) != seen.end()) {
        diags_.report_error(s->range, "Duplicate declaration of " + single_quoted(name) + ".")
          .in_file(file_);
      } else {
        seen.push_back(name);
      }
    }

    if (const auto * gl = dyn_cast<GlobalStmt>(s)) {
      check_duplicate_names(gl->body);
    }
  }
}

}  // namespace syx

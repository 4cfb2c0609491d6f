// syx/sema/diagnostic_engine.hpp - Semantic checks and the diagnostic report
//
// create_diagnostic_report() parses one file and runs every check in a fixed
// order. A parse error becomes the only item of the report. Item ranges are
// 0-based (editor coordinates).
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gsl/span>

#include "syx/ast/ast.hpp"
#include "syx/basic/diagnostic.hpp"

namespace syx
{

struct DiagnosticReport
{
  std::string kind = "full";
  std::vector<Diagnostic> items;
};

/**
 * Parse one file and run every check, keeping 1-based ranges.
 *
 * Same inputs as create_diagnostic_report(); used by tools that print
 * diagnostics against the source text.
 */
[[nodiscard]] DiagnosticBag collect_diagnostics(
  std::string_view file_path_or_uri, std::optional<std::string_view> content = std::nullopt);

/**
 * Build the diagnostic report of one file.
 *
 * @param file_path_or_uri Path or `file://` URI; `.syx` selects the
 *        declaration grammar. Code action edits are keyed by this string.
 * @param content Text of the file; read from disk when absent
 */
[[nodiscard]] DiagnosticReport create_diagnostic_report(
  std::string_view file_path_or_uri, std::optional<std::string_view> content = std::nullopt);

/**
 * The individual checks over a parsed program. Ranges stay 1-based; the
 * report converts them.
 */
class DiagnosticChecker
{
public:
  DiagnosticChecker(std::string file, DiagnosticBag & diags) : file_(std::move(file)), diags_(diags)
  {
  }

  /// Every check, in report order
  void check_all(const Program & program);

  /// `export` on a statement type that cannot be exported (recurses into bodies)
  void check_exportable(gsl::span<Stmt * const> statements);

  /// Rules whose registry entries conflict (either direction): one warning per pair side
  void check_rule_conflicts(const Program & program);

  /// Same rule declared more than once
  void check_duplicate_rules(const Program & program);

  /// Import targets that are missing, not regular files, or not declaration files
  void check_imports(const Program & program);

  /// Operators whose assembled patterns are textually identical
  void check_duplicate_operator_patterns(const Program & program);

  /// Function/Global/Keyword names declared twice in one scope
  void check_duplicate_names(gsl::span<Stmt * const> scope);

private:
  std::string file_;
  DiagnosticBag & diags_;
};

}  // namespace syx

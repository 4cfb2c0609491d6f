// syx/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

#include "syx/basic/diagnostic.hpp"
#include "syx/basic/source_manager.hpp"

namespace syx
{

/**
 * Prints 1-based diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error: Expected ';' after statement, found 'EOF'.
 *     --> src/main.syx:1:15
 *      |
 *    1 | keyword ruleis
 *      |               ^
 *      |
 *      = help: Replace with 'ruleish'
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic. The source line is looked up in `sources`
   * by the diagnostic's file; it is omitted when the file is unknown.
   */
  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of the bag, ordered by file then position.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col);

  void print_help(std::string_view message);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace syx

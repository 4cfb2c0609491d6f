// syx/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "syx/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace syx
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  // Convert to relative path for cleaner output
  std::string filename = "<unknown>";
  const SourceFile * source = nullptr;
  if (!diag.file.empty()) {
    const std::filesystem::path abs_path = uri_or_path_to_path(diag.file);
    std::error_code ec;
    auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
    filename = (ec || rel_path.empty()) ? abs_path.string() : rel_path.string();
    source = sources.get(abs_path);
  }

  // === Header line: error: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (diag.range.start.line > 0) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, diag.range.start.line, diag.range.start.character));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Source snippet ===
  if (source != nullptr && diag.range.start.line > 0) {
    const SourceRange & r = diag.range;
    const uint32_t end_col = (r.end.line == r.start.line && r.end.character > r.start.character)
                               ? r.end.character
                               : (r.start.character + 1);
    print_source_line(*source, r.start.line - 1, r.start.character, end_col);
  }

  // === Quick fixes ===
  for (const auto & action : diag.actions) {
    print_help(action.title);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  // === Trailing empty line for separation ===
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      if (a.file != b.file) return a.file < b.file;
      return a.range.start < b.range.start;
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    std::string severity_str;
    switch (diag.severity) {
      case Severity::Error:
        severity_str = "error";
        break;
      case Severity::Warning:
        severity_str = "warning";
        break;
    }
    fmt::print(os_, "{}: {}\n", severity_str, diag.message);
  }
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col)
{
  const std::string_view line = source.get_line(line_index);
  const uint32_t line_num = line_index + 1;

  // Build cleaned line (tabs -> spaces)
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else if (c != '\r' && c != '\n') {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Skip to start column (handle tabs). Columns past the end of the line
  // (e.g. an EOF position) keep advancing with spaces.
  std::string marker_prefix;
  size_t char_idx = 0;
  for (uint32_t visual_col = 1; visual_col < start_col; ++visual_col, ++char_idx) {
    marker_prefix += (char_idx < line.size() && line[char_idx] == '\t') ? "    " : " ";
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
    fmt::print(os_, "{}", std::string(marker_len, '^'));
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "{}", std::string(marker_len, '^'));
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace syx

// syx/basic/diagnostic.hpp - Diagnostic and code action types
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "syx/basic/source_manager.hpp"

namespace syx
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
};

/// Tag carried by every diagnostic this library produces.
inline constexpr const char * k_diagnostic_source = "syntax-script";

/// Kind string of every code action this library produces.
inline constexpr const char * k_quickfix_kind = "quickfix";

struct TextEdit
{
  SourceRange range;
  std::string new_text;

  [[nodiscard]] bool operator==(const TextEdit & other) const
  {
    return range == other.range && new_text == other.new_text;
  }
};

/**
 * A machine-applicable fix. `changes` maps a file (path or URI, whichever
 * the caller used) to the edits applied to it.
 */
struct CodeAction
{
  std::string title;
  std::string kind = k_quickfix_kind;
  std::map<std::string, std::vector<TextEdit>> changes;

  [[nodiscard]] bool operator==(const CodeAction & other) const
  {
    return title == other.title && kind == other.kind && changes == other.changes;
  }
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string message;
  SourceRange range;
  std::string source = k_diagnostic_source;
  std::string file;  // path or URI the diagnostic belongs to

  std::vector<CodeAction> actions;
  std::optional<std::string> help_message;

  [[nodiscard]] bool operator==(const Diagnostic & other) const
  {
    return severity == other.severity && message == other.message && range == other.range &&
           source == other.source && file == other.file && actions == other.actions &&
           help_message == other.help_message;
  }
};

/// Single-edit action replacing `range` in `file` with `new_text`.
[[nodiscard]] CodeAction make_edit_action(
  std::string title, const std::string & file, SourceRange range, std::string new_text);

/// Same diagnostic with the range and every edit range shifted to 0-based.
[[nodiscard]] Diagnostic to_zero_based(Diagnostic diag);

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it with the bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & in_file(std::string file);

  DiagnosticBuilder & with_action(CodeAction action);

  /// Shorthand for an action that deletes `range` from the diagnostic's file
  DiagnosticBuilder & with_removal(std::string title, SourceRange range);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(SourceRange range, std::string message);
  DiagnosticBuilder report_warning(SourceRange range, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;

  // Utilities
  void merge(DiagnosticBag && other);

  /// Moves the collected diagnostics out, leaving the bag empty
  [[nodiscard]] std::vector<Diagnostic> take();

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace syx

// syx/basic/diagnostic.cpp - Diagnostic implementation
#include "syx/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace syx
{

CodeAction make_edit_action(
  std::string title, const std::string & file, SourceRange range, std::string new_text)
{
  CodeAction action;
  action.title = std::move(title);
  action.changes[file].push_back(TextEdit{range, std::move(new_text)});
  return action;
}

Diagnostic to_zero_based(Diagnostic diag)
{
  diag.range = to_zero_based(diag.range);
  for (auto & action : diag.actions) {
    for (auto & [file, edits] : action.changes) {
      (void)file;
      for (auto & edit : edits) {
        edit.range = to_zero_based(edit.range);
      }
    }
  }
  return diag;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::in_file(std::string file)
{
  diagnostic_.file = std::move(file);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_action(CodeAction action)
{
  diagnostic_.actions.push_back(std::move(action));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_removal(std::string title, SourceRange range)
{
  return with_action(make_edit_action(std::move(title), diagnostic_.file, range, ""));
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.message = std::move(message);
  d.range = range;
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_warning(SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = std::move(message);
  d.range = range;
  return {*this, std::move(d)};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

void DiagnosticBag::add(const Diagnostic & diag) { diagnostics_.push_back(diag); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

std::vector<Diagnostic> DiagnosticBag::take()
{
  std::vector<Diagnostic> out = std::move(diagnostics_);
  diagnostics_.clear();
  return out;
}

}  // namespace syx

// syx/basic/compiler_error.hpp - Fatal parse/compile error
//
// Thrown by the parser and the compiler engine. The first error aborts the
// current file; callers that want a diagnostic list (the diagnostic engine,
// the project driver) catch it at their boundary.
//
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "syx/basic/diagnostic.hpp"
#include "syx/basic/source_manager.hpp"

namespace syx
{

class CompilerError : public std::runtime_error
{
public:
  CompilerError(
    SourceRange range, const std::string & message, std::string file = {},
    std::vector<CodeAction> actions = {});

  [[nodiscard]] SourceRange range() const noexcept { return range_; }
  [[nodiscard]] const std::string & file() const noexcept { return file_; }
  [[nodiscard]] const std::vector<CodeAction> & actions() const noexcept { return actions_; }

  /// Diagnostic form (1-based range), used at catch boundaries
  [[nodiscard]] Diagnostic to_diagnostic() const;

private:
  SourceRange range_;
  std::string file_;
  std::vector<CodeAction> actions_;
};

}  // namespace syx

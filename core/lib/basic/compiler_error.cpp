// syx/basic/compiler_error.cpp
#include "syx/basic/compiler_error.hpp"

#include <utility>

namespace syx
{

CompilerError::CompilerError(
  SourceRange range, const std::string & message, std::string file,
  std::vector<CodeAction> actions)
: std::runtime_error(message), range_(range), file_(std::move(file)), actions_(std::move(actions))
{
}

Diagnostic CompilerError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.message = what();
  d.range = range_;
  d.file = file_;
  d.actions = actions_;
  return d;
}

}  // namespace syx

// syx/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "syx/ast/ast.hpp"
#include "syx/ast/ast_context.hpp"
#include "syx/syntax/parser.hpp"
#include "syx/syntax/token.hpp"

namespace syx
{

/**
 * Everything one parse produced. Tokens and AST nodes view into `source` and
 * `ast`, so the unit is heap-allocated and never moved after construction.
 */
struct ParsedUnit
{
  std::string source;
  AstContext ast;
  std::vector<syntax::Token> tokens;
  Program * program = nullptr;

  /// Offset right after `:::` in a usage file, or std::string::npos
  size_t body_offset = std::string::npos;

  /// Text after `:::` (empty when there is no marker)
  [[nodiscard]] std::string_view body() const noexcept
  {
    if (body_offset == std::string::npos || body_offset > source.size()) return {};
    return std::string_view(source).substr(body_offset);
  }
};

/// `.syx` files use the declaration grammar, everything else the usage grammar.
[[nodiscard]] syntax::Grammar grammar_for_path(const std::filesystem::path & path);

/**
 * Resolve an `import` path against the importing file's directory. `.syx` is
 * appended unless the path already ends with it, so `./lib.v2` names
 * `lib.v2.syx`; `file://` URIs are decoded.
 */
[[nodiscard]] std::filesystem::path resolve_import_path(
  std::string_view importing_file, std::string_view import_path);

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST)
// Throws CompilerError (with `file` set) on the first syntax error.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string file, std::string source_text, syntax::Grammar grammar);

}  // namespace syx

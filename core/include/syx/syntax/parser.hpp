// syx/syntax/parser.hpp - Recursive-descent parser
//
// One Parser object per parse: it owns the token cursor and the program under
// construction, so independent files never share state. There is no error
// recovery; the first grammar violation throws CompilerError.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "syx/ast/ast.hpp"
#include "syx/ast/ast_context.hpp"
#include "syx/basic/compiler_error.hpp"
#include "syx/syntax/token.hpp"

namespace syx::syntax
{

enum class Grammar : uint8_t {
  Declaration,  // .syx: every statement kind
  Usage,        // .sys: import statements and strings before :::
};

class Parser
{
public:
  /**
   * @param tokens Output of the lexer; must end with EndOfFile
   * @param file   Path or URI stamped on thrown errors and code actions
   */
  Parser(std::vector<Token> tokens, std::string file, AstContext & ast, Grammar grammar);

  /// Parse the whole token stream. Throws CompilerError on the first error.
  [[nodiscard]] Program * parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenType t) const { return cur().type == t; }
  [[nodiscard]] bool at_eof() const { return at(TokenType::EndOfFile); }
  const Token & advance();

  [[noreturn]] void fail(SourceRange range, const std::string & message) const;
  [[noreturn]] void fail(
    SourceRange range, const std::string & message, std::vector<CodeAction> actions) const;

  const Token & expect_semicolon(std::string_view message_if_missing);
  const Token & expect_statement_end();

  [[nodiscard]] bool is_statement_start(TokenType t) const;

  // Statements
  [[nodiscard]] Stmt * parse_statement();
  [[nodiscard]] ImportStmt * parse_import(const Token & kw);
  [[nodiscard]] OperatorStmt * parse_operator(const Token & kw);
  [[nodiscard]] CompileStmt * parse_compile(const Token & kw);
  [[nodiscard]] ImportsStmt * parse_imports(const Token & kw);
  [[nodiscard]] FunctionStmt * parse_function(const Token & kw);
  [[nodiscard]] GlobalStmt * parse_global(const Token & kw);
  [[nodiscard]] KeywordStmt * parse_keyword(const Token & kw);
  [[nodiscard]] RuleStmt * parse_rule(const Token & kw);
  [[nodiscard]] Stmt * parse_export(const Token & kw);

  /// `ident , ident ... )` after compile/imports; the caller consumed `(`.
  [[nodiscard]] gsl::span<std::string_view> parse_format_list(SourceRange & close_range);

  /// Brace body whose statements must all be Compile or Imports.
  [[nodiscard]] BraceExpr * parse_restricted_body(std::string_view owner);

  // Expressions
  [[nodiscard]] Stmt * parse_expression(bool statements, bool expect_identifier = false);
  [[nodiscard]] StringExpr * parse_string();
  [[nodiscard]] PrimitiveTypeExpr * parse_primitive_type();
  [[nodiscard]] VariableExpr * parse_variable();
  [[nodiscard]] gsl::span<Stmt *> parse_bracket_body(TokenType close);

  [[nodiscard]] std::vector<std::string> declared_keywords() const;

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  std::string file_;
  AstContext & ast_;
  Grammar grammar_;

  /// Top-level statements parsed so far (keyword rules look these up)
  std::vector<Stmt *> top_level_;
};

}  // namespace syx::syntax

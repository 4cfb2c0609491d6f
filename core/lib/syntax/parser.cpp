// syx/syntax/parser.cpp - Recursive-descent parser implementation
#include "syx/syntax/parser.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>

#include "syx/basic/edit_distance.hpp"
#include "syx/sema/registry.hpp"

namespace syx::syntax
{

namespace
{

bool is_regex_fragment(NodeType t)
{
  return t == NodeType::PrimitiveType || t == NodeType::WhitespaceIdentifier ||
         t == NodeType::String;
}

bool is_template_element(NodeType t)
{
  return t == NodeType::String || t == NodeType::WhitespaceIdentifier || t == NodeType::Variable;
}

std::string single_quoted(std::string_view v) { return "'" + std::string(v) + "'"; }

}  // namespace

Parser::Parser(std::vector<Token> tokens, std::string file, AstContext & ast, Grammar grammar)
: tokens_(std::move(tokens)), file_(std::move(file)), ast_(ast), grammar_(grammar)
{
  if (tokens_.empty() || !tokens_.back().is(TokenType::EndOfFile)) {
    const Position end = tokens_.empty() ? Position{1, 1} : tokens_.back().range.end;
    tokens_.push_back(Token{TokenType::EndOfFile, "EOF", SourceRange{end, end}});
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = pos_ + lookahead;
  return (i < tokens_.size()) ? tokens_[i] : tokens_.back();
}

const Token & Parser::advance()
{
  const Token & t = tokens_[pos_];
  if (!t.is(TokenType::EndOfFile)) {
    ++pos_;
  }
  return t;
}

void Parser::fail(SourceRange range, const std::string & message) const
{
  throw CompilerError(range, message, file_);
}

void Parser::fail(
  SourceRange range, const std::string & message, std::vector<CodeAction> actions) const
{
  throw CompilerError(range, message, file_, std::move(actions));
}

const Token & Parser::expect_semicolon(std::string_view message_if_missing)
{
  if (!at(TokenType::Semicolon)) {
    fail(cur().range, std::string(message_if_missing));
  }
  return advance();
}

const Token & Parser::expect_statement_end()
{
  if (!at(TokenType::Semicolon)) {
    fail(cur().range, "Expected ';' after statement, found " + single_quoted(cur().value) + ".");
  }
  return advance();
}

bool Parser::is_statement_start(TokenType t) const
{
  if (grammar_ == Grammar::Usage) {
    return t == TokenType::ImportKeyword;
  }
  return is_statement_keyword(t);
}

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program()
{
  top_level_.clear();
  while (!at_eof()) {
    top_level_.push_back(parse_statement());
  }

  const SourceRange range{Position{1, 1}, cur().range.end};
  return ast_.create<Program>(ast_.copy_to_arena(top_level_), range);
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_statement()
{
  if (!is_statement_start(cur().type)) {
    return parse_expression(true);
  }

  const Token & kw = advance();
  switch (kw.type) {
    case TokenType::ImportKeyword:
      return parse_import(kw);
    case TokenType::OperatorKeyword:
      return parse_operator(kw);
    case TokenType::CompileKeyword:
      return parse_compile(kw);
    case TokenType::ImportsKeyword:
      return parse_imports(kw);
    case TokenType::FunctionKeyword:
      return parse_function(kw);
    case TokenType::GlobalKeyword:
      return parse_global(kw);
    case TokenType::KeywordKeyword:
      return parse_keyword(kw);
    case TokenType::RuleKeyword:
      return parse_rule(kw);
    case TokenType::ExportKeyword:
      return parse_export(kw);
    default:
      break;
  }
  fail(kw.range, "Unexpected statement.");
}

ImportStmt * Parser::parse_import(const Token & kw)
{
  Stmt * ex = parse_expression(false);
  auto * path = dyn_cast<StringExpr>(ex);
  if (path == nullptr) {
    fail(ex->range, "Expected string after import statement.");
  }
  const Token & semi = expect_statement_end();
  auto * import = ast_.create<ImportStmt>(path->value, join_ranges(kw.range, path->range));
  import->terminator_end = semi.range.end;
  return import;
}

OperatorStmt * Parser::parse_operator(const Token & kw)
{
  std::vector<Expr *> regex;
  while (!at(TokenType::OpenBrace)) {
    Stmt * ex = parse_expression(false);
    if (!is_regex_fragment(ex->type)) {
      fail(ex->range, "Unexpected expression: " + single_quoted(cast<Expr>(ex)->value));
    }
    regex.push_back(cast<Expr>(ex));
  }

  BraceExpr * body = parse_restricted_body("operator");
  return ast_.create<OperatorStmt>(
    ast_.copy_to_arena(regex), body->body, join_ranges(kw.range, body->range));
}

CompileStmt * Parser::parse_compile(const Token & kw)
{
  if (!at(TokenType::OpenParen)) {
    fail(cur().range, "Expected parens after 'compile' statement.");
  }
  advance();
  SourceRange close_range;
  const gsl::span<std::string_view> formats = parse_format_list(close_range);

  std::vector<Expr *> body;
  while (!at(TokenType::Semicolon)) {
    Stmt * ex = parse_expression(false);
    if (!is_template_element(ex->type)) {
      fail(ex->range, "Unexpected expression: " + single_quoted(cast<Expr>(ex)->value));
    }
    body.push_back(cast<Expr>(ex));
  }
  advance();  // ;

  const Position end = body.empty() ? close_range.end : body.back()->range.end;
  return ast_.create<CompileStmt>(
    formats, ast_.copy_to_arena(body), SourceRange{kw.range.start, end});
}

ImportsStmt * Parser::parse_imports(const Token & kw)
{
  if (!at(TokenType::OpenParen)) {
    fail(cur().range, "Expected parens after 'imports' statement.");
  }
  advance();
  SourceRange close_range;
  const gsl::span<std::string_view> formats = parse_format_list(close_range);

  Stmt * ex = parse_expression(false);
  auto * module = dyn_cast<StringExpr>(ex);
  if (module == nullptr) {
    fail(ex->range, "Expected string after parens of imports statement.");
  }
  const Token & semi = expect_semicolon("Expected ';' after imports statement.");

  auto * imports =
    ast_.create<ImportsStmt>(formats, module->value, join_ranges(kw.range, module->range));
  imports->terminator_end = semi.range.end;
  return imports;
}

gsl::span<std::string_view> Parser::parse_format_list(SourceRange & close_range)
{
  std::vector<std::string_view> formats;
  while (!at(TokenType::CloseParen)) {
    const Token & t = advance();
    if (t.is(TokenType::Comma)) {
      if (!at(TokenType::Identifier)) {
        fail(t.range, "Expected identifier after comma.");
      }
      if (formats.empty()) {
        fail(t.range, "Can't start with comma.");
      }
    } else if (t.is(TokenType::Identifier)) {
      formats.push_back(ast_.intern(t.value));
    } else {
      fail(t.range, "Unexpected token.");
    }
  }
  close_range = advance().range;
  return ast_.copy_to_arena(formats);
}

BraceExpr * Parser::parse_restricted_body(std::string_view owner)
{
  Stmt * ex = parse_expression(false);
  auto * brace = dyn_cast<BraceExpr>(ex);
  if (brace == nullptr) {
    fail(ex->range, "Expected braces after '" + std::string(owner) + "'.");
  }
  for (const Stmt * s : brace->body) {
    if (!isa<CompileStmt>(s) && !isa<ImportsStmt>(s)) {
      fail(s->range, "Statement not allowed.");
    }
  }
  return brace;
}

FunctionStmt * Parser::parse_function(const Token & kw)
{
  if (!at(TokenType::Identifier)) {
    fail(cur().range, "Expected identifier after function statement.");
  }
  const std::string_view name = ast_.intern(advance().value);

  std::vector<std::string_view> arguments;
  while (!at(TokenType::OpenBrace)) {
    Stmt * ex = parse_expression(false);
    auto * type = dyn_cast<PrimitiveTypeExpr>(ex);
    if (type == nullptr) {
      fail(ex->range, "Expected argument types after function name.");
    }
    arguments.push_back(type->value);
  }

  BraceExpr * body = parse_restricted_body("function");
  return ast_.create<FunctionStmt>(
    name, ast_.copy_to_arena(arguments), body->body, join_ranges(kw.range, body->range));
}

GlobalStmt * Parser::parse_global(const Token & kw)
{
  if (!at(TokenType::Identifier)) {
    fail(cur().range, "Expected identifier after global statement.");
  }
  const std::string_view name = ast_.intern(advance().value);

  if (!at(TokenType::OpenBrace)) {
    fail(cur().range, "Expected braces after 'global'.");
  }
  auto * body = cast<BraceExpr>(parse_expression(false));
  return ast_.create<GlobalStmt>(name, body->body, join_ranges(kw.range, body->range));
}

KeywordStmt * Parser::parse_keyword(const Token & kw)
{
  Stmt * ex = parse_expression(false, true);
  auto * word = dyn_cast<IdentifierExpr>(ex);
  if (word == nullptr) {
    fail(ex->range, "Expected identifier after keyword statement.");
  }
  const Token & semi = expect_statement_end();
  auto * keyword = ast_.create<KeywordStmt>(word->value, join_ranges(kw.range, word->range));
  keyword->terminator_end = semi.range.end;
  return keyword;
}

RuleStmt * Parser::parse_rule(const Token & kw)
{
  Stmt * name_ex = parse_expression(false);
  auto * name = dyn_cast<StringExpr>(name_ex);
  if (name == nullptr) {
    fail(name_ex->range, "Expected string after 'rule'.");
  }

  const registry::RuleEntry * entry = registry::find_rule(name->value);
  if (entry == nullptr) {
    std::vector<CodeAction> actions;
    for (const auto & candidate : rank_by_edit_distance(name->value, registry::rule_names())) {
      actions.push_back(make_edit_action(
        "Replace with " + single_quoted(candidate), file_, name->range, single_quoted(candidate)));
    }
    fail(name->range, "Unknown rule " + single_quoted(name->value) + ".", std::move(actions));
  }

  if (cur().value != ":") {
    fail(cur().range, "Expected ':' after rule name.");
  }
  advance();

  Stmt * value_ex = parse_expression(false, true);
  auto * value = dyn_cast<IdentifierExpr>(value_ex);

  switch (entry->kind) {
    case registry::RuleValueKind::Boolean:
      if (value == nullptr || !registry::is_boolean_literal(value->value)) {
        fail(value_ex->range, "Expected boolean as rule value.");
      }
      break;
    case registry::RuleValueKind::Keyword: {
      const std::vector<std::string> keywords = declared_keywords();
      const bool known =
        value != nullptr &&
        std::find(keywords.begin(), keywords.end(), value->value) != keywords.end();
      if (!known) {
        const std::string_view text = cast<Expr>(value_ex)->value;
        std::vector<CodeAction> actions;
        for (const auto & candidate : rank_by_edit_distance(text, keywords)) {
          actions.push_back(make_edit_action(
            "Replace with " + single_quoted(candidate), file_, value_ex->range, candidate));
        }
        fail(
          value_ex->range, "Can't find keyword " + single_quoted(text) + ".", std::move(actions));
      }
      break;
    }
  }

  const Token & semi = expect_statement_end();
  auto * rule =
    ast_.create<RuleStmt>(name->value, value->value, join_ranges(kw.range, value->range));
  rule->terminator_end = semi.range.end;
  return rule;
}

Stmt * Parser::parse_export(const Token & kw)
{
  Stmt * stmt = parse_statement();
  if (!registry::is_exportable(stmt->type)) {
    fail(stmt->range, "Expected exportable statement after export.");
  }

  std::vector<Token> modifiers;
  modifiers.reserve(stmt->modifiers.size() + 1);
  modifiers.push_back(kw);
  modifiers.insert(modifiers.end(), stmt->modifiers.begin(), stmt->modifiers.end());

  stmt->modifiers = ast_.copy_to_arena(modifiers);
  stmt->range.start = kw.range.start;
  return stmt;
}

std::vector<std::string> Parser::declared_keywords() const
{
  std::vector<std::string> words;
  for (const Stmt * s : top_level_) {
    if (const auto * k = dyn_cast<KeywordStmt>(s)) {
      words.emplace_back(k->word);
    }
  }
  return words;
}

// ============================================================================
// Expressions
// ============================================================================

Stmt * Parser::parse_expression(bool statements, bool expect_identifier)
{
  const Token & t = cur();

  switch (t.type) {
    case TokenType::SingleQuote:
    case TokenType::DoubleQuote:
      return parse_string();
    default:
      break;
  }

  if (is_statement_start(t.type)) {
    if (!statements) {
      fail(t.range, "Unexpected statement.");
    }
    return parse_statement();
  }

  if (grammar_ == Grammar::Declaration) {
    switch (t.type) {
      case TokenType::OpenDiamond:
        return parse_primitive_type();
      case TokenType::WhitespaceIdentifier:
        return ast_.create<WhitespaceIdentifierExpr>(advance().range);
      case TokenType::OpenBrace: {
        const Token & open = advance();
        const gsl::span<Stmt *> body = parse_bracket_body(TokenType::CloseBrace);
        return ast_.create<BraceExpr>(body, join_ranges(open.range, advance().range));
      }
      case TokenType::OpenParen: {
        const Token & open = advance();
        const gsl::span<Stmt *> body = parse_bracket_body(TokenType::CloseParen);
        return ast_.create<ParenExpr>(body, join_ranges(open.range, advance().range));
      }
      case TokenType::OpenSquare: {
        const Token & open = advance();
        const gsl::span<Stmt *> body = parse_bracket_body(TokenType::CloseSquare);
        return ast_.create<SquareExpr>(body, join_ranges(open.range, advance().range));
      }
      case TokenType::Identifier:
        if (cur(1).is(TokenType::VarSeparator)) {
          return parse_variable();
        }
        if (expect_identifier) {
          const Token & id = advance();
          return ast_.create<IdentifierExpr>(id.value, id.range);
        }
        break;
      default:
        break;
    }
  }

  fail(t.range, "Unexpected expression: " + single_quoted(t.value));
}

StringExpr * Parser::parse_string()
{
  const Token & open = advance();
  SourceRange accumulated = open.range;
  std::string text;

  while (!at(open.type)) {
    if (at_eof()) {
      fail(accumulated, "Unterminated string.");
    }
    const Token & t = advance();
    text += t.value;
    accumulated.end = t.range.end;
  }
  const Token & close = advance();

  return ast_.create<StringExpr>(ast_.intern(text), join_ranges(open.range, close.range));
}

PrimitiveTypeExpr * Parser::parse_primitive_type()
{
  const Token & name = cur(1);
  if (!name.is(TokenType::Identifier)) {
    fail(name.range, "Expected identifier after '<'.");
  }
  if (!registry::is_primitive_type(name.value)) {
    fail(name.range, "Expected primitive type, found " + single_quoted(name.value) + ".");
  }
  if (!cur(2).is(TokenType::CloseDiamond)) {
    fail(
      cur(2).range,
      "Expected '>' after primitive type, found " + single_quoted(cur(2).value) + ".");
  }

  const Token & open = advance();
  advance();  // type name
  const Token & close = advance();
  return ast_.create<PrimitiveTypeExpr>(name.value, join_ranges(open.range, close.range));
}

VariableExpr * Parser::parse_variable()
{
  const Token & id = cur();
  const Token & index = cur(2);
  const std::string missing_index = "Expected index after " + std::string(id.value) + " variable";
  if (!index.is(TokenType::IntNumber)) {
    fail(index.range, missing_index);
  }

  uint32_t value = 0;
  const auto [ptr, ec] =
    std::from_chars(index.value.data(), index.value.data() + index.value.size(), value);
  if (ec != std::errc() || ptr != index.value.data() + index.value.size()) {
    fail(index.range, missing_index);
  }

  advance();  // name
  advance();  // |
  advance();  // index
  return ast_.create<VariableExpr>(id.value, value, join_ranges(id.range, index.range));
}

gsl::span<Stmt *> Parser::parse_bracket_body(TokenType close)
{
  std::vector<Stmt *> body;
  while (!at(close)) {
    body.push_back(parse_statement());
  }
  return ast_.copy_to_arena(body);
}

}  // namespace syx::syntax

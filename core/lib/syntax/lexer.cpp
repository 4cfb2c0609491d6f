// syx/syntax/lexer.cpp - Tokenizer implementation
#include "syx/syntax/lexer.hpp"

#include <array>
#include <utility>

namespace syx::syntax
{

namespace
{

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }

bool is_space(char c)
{
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

struct Punct
{
  char c;
  TokenType type;
};

constexpr std::array<Punct, 11> k_punctuation = {{
  {'(', TokenType::OpenParen},
  {')', TokenType::CloseParen},
  {'{', TokenType::OpenBrace},
  {'}', TokenType::CloseBrace},
  {'[', TokenType::OpenSquare},
  {']', TokenType::CloseSquare},
  {',', TokenType::Comma},
  {';', TokenType::Semicolon},
  {'<', TokenType::OpenDiamond},
  {'>', TokenType::CloseDiamond},
  {'|', TokenType::VarSeparator},
}};

struct KeywordEntry
{
  std::string_view word;
  TokenType type;
};

constexpr std::array<KeywordEntry, 10> k_keywords = {{
  {"operator", TokenType::OperatorKeyword},
  {"compile", TokenType::CompileKeyword},
  {"import", TokenType::ImportKeyword},
  {"imports", TokenType::ImportsKeyword},
  {"export", TokenType::ExportKeyword},
  {"global", TokenType::GlobalKeyword},
  {"class", TokenType::ClassKeyword},
  {"function", TokenType::FunctionKeyword},
  {"keyword", TokenType::KeywordKeyword},
  {"rule", TokenType::RuleKeyword},
}};

}  // namespace

TokenType keyword_or_identifier(std::string_view word) noexcept
{
  for (const auto & kw : k_keywords) {
    if (kw.word == word) {
      return kw.type;
    }
  }
  return TokenType::Identifier;
}

bool is_statement_keyword(TokenType t) noexcept
{
  switch (t) {
    case TokenType::ImportKeyword:
    case TokenType::ExportKeyword:
    case TokenType::CompileKeyword:
    case TokenType::OperatorKeyword:
    case TokenType::ImportsKeyword:
    case TokenType::GlobalKeyword:
    case TokenType::FunctionKeyword:
    case TokenType::KeywordKeyword:
    case TokenType::RuleKeyword:
      return true;
    default:
      return false;
  }
}

std::vector<Token> tokenize(std::string_view src, LexMode mode)
{
  Lexer lexer(src, mode);
  return lexer.lex_all();
}

// ============================================================================
// Lexer
// ============================================================================

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  out.reserve(src_.size() / 2 + 1);

  while (!eof()) {
    if (mode_ == LexMode::Usage && starts_with(k_body_marker)) {
      body_offset_ = pos_ + k_body_marker.size();
      break;
    }
    if (mode_ == LexMode::Declaration) {
      lex_declaration_char(out);
    } else {
      lex_usage_char(out);
    }
  }

  const Position here{line_, character_};
  out.push_back(Token{TokenType::EndOfFile, "EOF", SourceRange{here, here}});
  return out;
}

void Lexer::lex_declaration_char(std::vector<Token> & out)
{
  const char c = peek();

  if (!in_string_ && c == '/' && peek(1) == '/') {
    skip_line_comment();
    return;
  }

  if (c == '\'' || c == '"') {
    out.push_back(take(c == '\'' ? TokenType::SingleQuote : TokenType::DoubleQuote, 1));
    toggle_quote(c);
    return;
  }

  for (const auto & p : k_punctuation) {
    if (p.c == c) {
      out.push_back(take(in_string_ ? TokenType::Raw : p.type, 1));
      return;
    }
  }

  if (c == '+' && peek(1) == 's') {
    out.push_back(take(in_string_ ? TokenType::Raw : TokenType::WhitespaceIdentifier, 2));
    return;
  }

  if (is_digit(c)) {
    out.push_back(lex_run(&is_digit, TokenType::IntNumber));
    return;
  }

  if (is_alpha(c)) {
    out.push_back(lex_word());
    return;
  }

  if (is_space(c) && !in_string_) {
    skip_whitespace_char();
    return;
  }

  out.push_back(take(TokenType::Raw, 1));
}

void Lexer::lex_usage_char(std::vector<Token> & out)
{
  const char c = peek();

  if (!in_string_ && c == '/' && peek(1) == '/') {
    skip_line_comment();
    return;
  }

  if (c == '\'' || c == '"') {
    out.push_back(take(c == '\'' ? TokenType::SingleQuote : TokenType::DoubleQuote, 1));
    toggle_quote(c);
    return;
  }

  if (c == ';') {
    out.push_back(take(in_string_ ? TokenType::Raw : TokenType::Semicolon, 1));
    return;
  }

  if (is_alpha(c)) {
    out.push_back(lex_word());
    return;
  }

  if (is_space(c) && !in_string_) {
    skip_whitespace_char();
    return;
  }

  out.push_back(take(TokenType::Raw, 1));
}

Token Lexer::take(TokenType type, size_t n)
{
  const Position start{line_, character_};
  const std::string_view value = src_.substr(pos_, n);
  pos_ += n;

  if (n == 1 && value[0] == '\n') {
    // Only reachable inside a string: the newline is kept as Raw text.
    ++line_;
    character_ = 1;
    return Token{type, value, SourceRange{start, Position{start.line, start.character + 1}}};
  }

  character_ += static_cast<uint32_t>(n);
  return Token{type, value, SourceRange{start, Position{line_, character_}}};
}

void Lexer::toggle_quote(char quote) noexcept
{
  if (!in_string_) {
    in_string_ = true;
    open_quote_ = quote;
  } else if (quote == open_quote_) {
    in_string_ = false;
    open_quote_ = '\0';
  }
}

void Lexer::skip_line_comment() noexcept
{
  while (!eof() && peek() != '\n') {
    ++pos_;
    ++character_;
  }
}

void Lexer::skip_whitespace_char() noexcept
{
  if (peek() == '\n') {
    ++line_;
    character_ = 1;
  } else {
    ++character_;
  }
  ++pos_;
}

Token Lexer::lex_run(bool (*pred)(char), TokenType type)
{
  size_t n = 0;
  while (pos_ + n < src_.size() && pred(src_[pos_ + n])) {
    ++n;
  }
  return take(in_string_ ? TokenType::Raw : type, n);
}

Token Lexer::lex_word()
{
  size_t n = 0;
  while (pos_ + n < src_.size() && is_alpha(src_[pos_ + n])) {
    ++n;
  }
  const TokenType type = in_string_ ? TokenType::Raw : keyword_or_identifier(src_.substr(pos_, n));
  return take(type, n);
}

}  // namespace syx::syntax

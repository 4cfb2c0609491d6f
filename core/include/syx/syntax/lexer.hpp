// syx/syntax/lexer.hpp - Tokenizer for declaration and usage files
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "syx/syntax/token.hpp"

namespace syx::syntax
{

enum class LexMode : uint8_t {
  Declaration,  // .syx
  Usage,        // .sys, stops at the ::: marker
};

/**
 * Single-pass, total tokenizer. Never throws: characters it does not
 * recognize become Raw tokens, and the output always ends with EndOfFile.
 *
 * Token values are views into `src`, which must outlive the tokens.
 */
class Lexer
{
public:
  static constexpr std::string_view k_body_marker = ":::";
  static constexpr size_t npos = static_cast<size_t>(-1);

  explicit Lexer(std::string_view src, LexMode mode = LexMode::Declaration)
  : src_(src), mode_(mode)
  {
  }

  [[nodiscard]] std::vector<Token> lex_all();

  /// Offset right after the ::: marker (Usage mode, after lex_all), or npos
  [[nodiscard]] size_t body_offset() const noexcept { return body_offset_; }

private:
  void lex_declaration_char(std::vector<Token> & out);
  void lex_usage_char(std::vector<Token> & out);

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return src_.substr(pos_, s.size()) == s;
  }

  /// Consume `n` characters on the current line and return their token
  Token take(TokenType type, size_t n);

  void toggle_quote(char quote) noexcept;
  void skip_line_comment() noexcept;
  /// Whitespace outside a string: consumed, only the position moves
  void skip_whitespace_char() noexcept;

  Token lex_run(bool (*pred)(char), TokenType type);
  Token lex_word();

  std::string_view src_;
  LexMode mode_;
  size_t pos_ = 0;
  uint32_t line_ = 1;
  uint32_t character_ = 1;

  bool in_string_ = false;
  char open_quote_ = '\0';

  size_t body_offset_ = npos;
};

/// Convenience wrapper: `Lexer(src, mode).lex_all()`.
[[nodiscard]] std::vector<Token> tokenize(
  std::string_view src, LexMode mode = LexMode::Declaration);

}  // namespace syx::syntax

// syx/syntax/token.hpp - Token model
#pragma once

#include <cstdint>
#include <string_view>

#include "syx/basic/source_manager.hpp"

namespace syx::syntax
{

enum class TokenType : uint8_t {
  OpenBrace,
  CloseBrace,
  DefinitionEnd,
  Semicolon,
  Comma,
  OpenParen,
  CloseParen,
  OpenSquare,
  CloseSquare,
  OperatorKeyword,
  CompileKeyword,
  Identifier,
  OpenDiamond,
  CloseDiamond,
  WhitespaceIdentifier,  // +s
  IntNumber,
  SingleQuote,
  DoubleQuote,
  ImportKeyword,
  ExportKeyword,
  Raw,  // anything else, and every structural character inside a string
  VarSeparator,  // |
  GlobalKeyword,
  FunctionKeyword,
  ClassKeyword,
  ImportsKeyword,
  EndOfFile,
  KeywordKeyword,
  RuleKeyword,
};

struct Token
{
  TokenType type = TokenType::Raw;
  std::string_view value;  // slice of the source, or "EOF"
  SourceRange range;       // 1-based, end exclusive

  [[nodiscard]] bool is(TokenType t) const noexcept { return type == t; }
};

/// Keyword table lookup; returns Identifier for non-keywords.
[[nodiscard]] TokenType keyword_or_identifier(std::string_view word) noexcept;

/// True for the keywords that start a statement in declaration files.
[[nodiscard]] bool is_statement_keyword(TokenType t) noexcept;

[[nodiscard]] constexpr std::string_view to_string(TokenType t) noexcept
{
  switch (t) {
    case TokenType::OpenBrace:
      return "{";
    case TokenType::CloseBrace:
      return "}";
    case TokenType::DefinitionEnd:
      return "<definition_end>";
    case TokenType::Semicolon:
      return ";";
    case TokenType::Comma:
      return ",";
    case TokenType::OpenParen:
      return "(";
    case TokenType::CloseParen:
      return ")";
    case TokenType::OpenSquare:
      return "[";
    case TokenType::CloseSquare:
      return "]";
    case TokenType::OperatorKeyword:
      return "operator";
    case TokenType::CompileKeyword:
      return "compile";
    case TokenType::Identifier:
      return "identifier";
    case TokenType::OpenDiamond:
      return "<";
    case TokenType::CloseDiamond:
      return ">";
    case TokenType::WhitespaceIdentifier:
      return "+s";
    case TokenType::IntNumber:
      return "int";
    case TokenType::SingleQuote:
      return "'";
    case TokenType::DoubleQuote:
      return "\"";
    case TokenType::ImportKeyword:
      return "import";
    case TokenType::ExportKeyword:
      return "export";
    case TokenType::Raw:
      return "<raw>";
    case TokenType::VarSeparator:
      return "|";
    case TokenType::GlobalKeyword:
      return "global";
    case TokenType::FunctionKeyword:
      return "function";
    case TokenType::ClassKeyword:
      return "class";
    case TokenType::ImportsKeyword:
      return "imports";
    case TokenType::EndOfFile:
      return "<eof>";
    case TokenType::KeywordKeyword:
      return "keyword";
    case TokenType::RuleKeyword:
      return "rule";
  }
  return "<unknown>";
}

}  // namespace syx::syntax

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "syx/syntax/lexer.hpp"
#include "syx/syntax/token.hpp"

using syx::SourceRange;
using syx::syntax::Lexer;
using syx::syntax::LexMode;
using syx::syntax::Token;
using syx::syntax::TokenType;

namespace
{

std::vector<TokenType> types_of(const std::vector<Token> & toks)
{
  std::vector<TokenType> out;
  out.reserve(toks.size());
  for (const auto & t : toks) {
    out.push_back(t.type);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, OperatorDeclaration)
{
  const auto toks = syx::syntax::tokenize("operator <int> +s '+' +s <int> {");

  const std::vector<TokenType> expected = {
    TokenType::OperatorKeyword,      TokenType::OpenDiamond, TokenType::Identifier,
    TokenType::CloseDiamond,         TokenType::WhitespaceIdentifier,
    TokenType::SingleQuote,          TokenType::Raw,         TokenType::SingleQuote,
    TokenType::WhitespaceIdentifier, TokenType::OpenDiamond, TokenType::Identifier,
    TokenType::CloseDiamond,         TokenType::OpenBrace,   TokenType::EndOfFile,
  };
  EXPECT_EQ(types_of(toks), expected);
  EXPECT_EQ(toks[6].value, "+");
}

TEST(SyntaxLexer, KeywordTable)
{
  const auto toks = syx::syntax::tokenize(
    "operator compile import imports export global class function keyword rule other");
  const std::vector<TokenType> expected = {
    TokenType::OperatorKeyword, TokenType::CompileKeyword,  TokenType::ImportKeyword,
    TokenType::ImportsKeyword,  TokenType::ExportKeyword,   TokenType::GlobalKeyword,
    TokenType::ClassKeyword,    TokenType::FunctionKeyword, TokenType::KeywordKeyword,
    TokenType::RuleKeyword,     TokenType::Identifier,      TokenType::EndOfFile,
  };
  EXPECT_EQ(types_of(toks), expected);
}

TEST(SyntaxLexer, RangesAreOneBasedAndEndExclusive)
{
  const auto toks = syx::syntax::tokenize("keyword ruleish;");
  ASSERT_EQ(toks.size(), 4U);

  EXPECT_EQ(toks[0].range, (SourceRange{1, 1, 1, 8}));
  EXPECT_EQ(toks[1].value, "ruleish");
  EXPECT_EQ(toks[1].range, (SourceRange{1, 9, 1, 16}));
  EXPECT_EQ(toks[2].type, TokenType::Semicolon);
  EXPECT_EQ(toks[2].range, (SourceRange{1, 16, 1, 17}));
}

TEST(SyntaxLexer, EndOfFileIsZeroWidthAfterLastCharacter)
{
  const auto toks = syx::syntax::tokenize("keyword ruleis");
  ASSERT_FALSE(toks.empty());
  const Token & eof = toks.back();
  EXPECT_EQ(eof.type, TokenType::EndOfFile);
  EXPECT_EQ(eof.value, "EOF");
  EXPECT_EQ(eof.range, (SourceRange{1, 15, 1, 15}));
}

TEST(SyntaxLexer, EmptyInputYieldsOnlyEndOfFile)
{
  const auto toks = syx::syntax::tokenize("");
  ASSERT_EQ(toks.size(), 1U);
  EXPECT_EQ(toks[0].type, TokenType::EndOfFile);
  EXPECT_EQ(toks[0].range, (SourceRange{1, 1, 1, 1}));
}

TEST(SyntaxLexer, NewlinesAdvanceLineAndResetCharacter)
{
  const auto toks = syx::syntax::tokenize("keyword a;\n  keyword b;");
  ASSERT_GE(toks.size(), 6U);
  EXPECT_EQ(toks[3].type, TokenType::KeywordKeyword);
  EXPECT_EQ(toks[3].range, (SourceRange{2, 3, 2, 10}));
  EXPECT_EQ(toks[4].range, (SourceRange{2, 11, 2, 12}));
}

TEST(SyntaxLexer, StructuralCharactersInsideStringAreRaw)
{
  const auto toks = syx::syntax::tokenize("'f (x); <y> | 12 +s'");

  ASSERT_GE(toks.size(), 3U);
  EXPECT_EQ(toks.front().type, TokenType::SingleQuote);
  for (size_t i = 1; i + 2 < toks.size(); ++i) {
    EXPECT_EQ(toks[i].type, TokenType::Raw) << "token " << i << " '" << toks[i].value << "'";
  }
  EXPECT_EQ(toks[toks.size() - 2].type, TokenType::SingleQuote);
  EXPECT_EQ(toks.back().type, TokenType::EndOfFile);
}

TEST(SyntaxLexer, WhitespaceInsideStringIsKept)
{
  const auto toks = syx::syntax::tokenize("' + '");
  ASSERT_EQ(toks.size(), 6U);
  EXPECT_EQ(toks[1].value, " ");
  EXPECT_EQ(toks[2].value, "+");
  EXPECT_EQ(toks[3].value, " ");
}

TEST(SyntaxLexer, OtherQuoteInsideStringDoesNotClose)
{
  const auto toks = syx::syntax::tokenize("\"it's\" keyword");
  const std::vector<TokenType> expected = {
    TokenType::DoubleQuote, TokenType::Raw,         TokenType::SingleQuote,
    TokenType::Raw,         TokenType::DoubleQuote, TokenType::KeywordKeyword,
    TokenType::EndOfFile,
  };
  EXPECT_EQ(types_of(toks), expected);
}

TEST(SyntaxLexer, LineCommentsAreSkipped)
{
  const auto toks = syx::syntax::tokenize("// header\nkeyword a; // trailing\n'//kept'");
  const std::vector<TokenType> expected = {
    TokenType::KeywordKeyword, TokenType::Identifier, TokenType::Semicolon,
    TokenType::SingleQuote,    TokenType::Raw,        TokenType::Raw,
    TokenType::Raw,            TokenType::SingleQuote, TokenType::EndOfFile,
  };
  EXPECT_EQ(types_of(toks), expected);
}

TEST(SyntaxLexer, NumbersAndVariables)
{
  const auto toks = syx::syntax::tokenize("int|12");
  const std::vector<TokenType> expected = {
    TokenType::Identifier, TokenType::VarSeparator, TokenType::IntNumber, TokenType::EndOfFile};
  EXPECT_EQ(types_of(toks), expected);
  EXPECT_EQ(toks[2].value, "12");
}

TEST(SyntaxLexer, UnknownCharactersBecomeRaw)
{
  const auto toks = syx::syntax::tokenize("@#$%:\x01");
  ASSERT_EQ(toks.size(), 7U);
  for (size_t i = 0; i + 1 < toks.size(); ++i) {
    EXPECT_EQ(toks[i].type, TokenType::Raw);
  }
  EXPECT_EQ(toks.back().type, TokenType::EndOfFile);
}

TEST(SyntaxLexer, UnterminatedStringStillEndsWithEof)
{
  const auto toks = syx::syntax::tokenize("'abc\ndef");
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().type, TokenType::EndOfFile);
  EXPECT_EQ(toks.back().range.start.line, 2U);
}

TEST(SyntaxLexer, UsageModeStopsAtBodyMarker)
{
  const std::string_view src = "import './a';\n:::3+4 keyword";
  Lexer lex(src, LexMode::Usage);
  const auto toks = lex.lex_all();

  const std::vector<TokenType> expected = {
    TokenType::ImportKeyword, TokenType::SingleQuote, TokenType::Raw,
    TokenType::Raw,           TokenType::Raw,         TokenType::SingleQuote,
    TokenType::Semicolon,     TokenType::EndOfFile,
  };
  EXPECT_EQ(types_of(toks), expected);
  ASSERT_NE(lex.body_offset(), Lexer::npos);
  EXPECT_EQ(src.substr(lex.body_offset()), "3+4 keyword");
}

TEST(SyntaxLexer, UsageModeWithoutMarker)
{
  Lexer lex("import './a';", LexMode::Usage);
  (void)lex.lex_all();
  EXPECT_EQ(lex.body_offset(), Lexer::npos);
}

TEST(SyntaxLexer, DeclarationModeIgnoresBodyMarker)
{
  Lexer lex(":::", LexMode::Declaration);
  const auto toks = lex.lex_all();
  EXPECT_EQ(toks.size(), 4U);
  EXPECT_EQ(lex.body_offset(), Lexer::npos);
}

// syx/syntax/frontend.cpp - High-level parse pipeline
#include "syx/syntax/frontend.hpp"

#include <utility>

#include "syx/syntax/lexer.hpp"

namespace syx
{

syntax::Grammar grammar_for_path(const std::filesystem::path & path)
{
  return path.extension() == ".syx" ? syntax::Grammar::Declaration : syntax::Grammar::Usage;
}

std::filesystem::path resolve_import_path(
  std::string_view importing_file, std::string_view import_path)
{
  std::filesystem::path target(std::string{import_path});
  if (target.extension() != ".syx") {
    target += ".syx";
  }
  const std::filesystem::path base = uri_or_path_to_path(importing_file).parent_path();
  return (base / target).lexically_normal();
}

std::unique_ptr<ParsedUnit> parse_source(
  std::string file, std::string source_text, syntax::Grammar grammar)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = std::move(source_text);

  const syntax::LexMode mode = grammar == syntax::Grammar::Declaration
                                 ? syntax::LexMode::Declaration
                                 : syntax::LexMode::Usage;
  syntax::Lexer lexer(unit->source, mode);
  unit->tokens = lexer.lex_all();
  if (lexer.body_offset() != syntax::Lexer::npos) {
    unit->body_offset = lexer.body_offset();
  }

  syntax::Parser parser(unit->tokens, std::move(file), unit->ast, grammar);
  unit->program = parser.parse_program();
  return unit;
}

}  // namespace syx

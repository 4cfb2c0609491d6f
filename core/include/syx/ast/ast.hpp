// syx/ast/ast.hpp - AST node class definitions
//
// LLVM-style hierarchy with classof() for isa/cast/dyn_cast. All nodes are
// arena-allocated by AstContext and therefore trivially destructible: text is
// held as std::string_view, sequences as gsl::span.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>
#include <utility>

#include "syx/ast/ast_enums.hpp"
#include "syx/basic/casting.hpp"
#include "syx/basic/source_manager.hpp"
#include "syx/syntax/token.hpp"

namespace syx
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for every AST node.
 *
 * Every node has:
 * - A NodeType for RTTI (classof pattern)
 * - A 1-based SourceRange (first to last constituent token, terminating
 *   semicolon excluded)
 * - The end of the terminating semicolon, when the statement has one
 * - An ordered list of modifier tokens (currently only `export`)
 */
class Stmt
{
public:
  const NodeType type;
  SourceRange range;
  gsl::span<const syntax::Token> modifiers;

  /// End of the `;` closing the statement; line 0 when there is none
  Position terminator_end;

  // Non-copyable, non-movable (managed by AstContext)
  Stmt(const Stmt &) = delete;
  Stmt & operator=(const Stmt &) = delete;
  Stmt(Stmt &&) = delete;
  Stmt & operator=(Stmt &&) = delete;

  [[nodiscard]] NodeType get_type() const noexcept { return type; }

  [[nodiscard]] bool is_exported() const noexcept
  {
    return find_modifier(syntax::TokenType::ExportKeyword) != nullptr;
  }

  [[nodiscard]] const syntax::Token * find_modifier(syntax::TokenType t) const noexcept
  {
    for (const auto & m : modifiers) {
      if (m.type == t) {
        return &m;
      }
    }
    return nullptr;
  }

  /// Statement range extended over its `;`, which may sit after whitespace
  [[nodiscard]] SourceRange range_with_terminator() const noexcept
  {
    return {range.start, terminator_end.line > 0 ? terminator_end : range.end};
  }

  static bool classof(const Stmt *) { return true; }

protected:
  explicit Stmt(NodeType t, SourceRange r = {}) : type(t), range(r) {}
  ~Stmt() = default;
};

/**
 * Base class for expressions. Adds the textual value of the expression.
 */
class Expr : public Stmt
{
public:
  std::string_view value;

  static bool classof(const Stmt * node) { return is_expr_type(node->type); }

protected:
  Expr(NodeType t, SourceRange r, std::string_view v) : Stmt(t, r), value(v) {}
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

template <typename Derived, typename Base, NodeType K>
class NodeBase : public Base
{
public:
  static constexpr NodeType node_type = K;

  static bool classof(const Stmt * node) { return node->type == K; }

protected:
  template <typename... Args>
  explicit NodeBase(Args &&... args) : Base(K, std::forward<Args>(args)...)
  {
  }
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// `<int>`, `<string>`, `<boolean>`, `<decimal>`; value is the type name.
class PrimitiveTypeExpr : public NodeBase<PrimitiveTypeExpr, Expr, NodeType::PrimitiveType>
{
public:
  PrimitiveTypeExpr(std::string_view type_name, SourceRange r) : NodeBase(r, type_name) {}
};

/// `+s`
class WhitespaceIdentifierExpr
: public NodeBase<WhitespaceIdentifierExpr, Expr, NodeType::WhitespaceIdentifier>
{
public:
  explicit WhitespaceIdentifierExpr(SourceRange r) : NodeBase(r, std::string_view("+s")) {}
};

/// `name|index`; value is the name.
class VariableExpr : public NodeBase<VariableExpr, Expr, NodeType::Variable>
{
public:
  uint32_t index;

  VariableExpr(std::string_view name, uint32_t idx, SourceRange r)
  : NodeBase(r, name), index(idx)
  {
  }
};

/// Quoted string; value is the text between the quotes.
class StringExpr : public NodeBase<StringExpr, Expr, NodeType::String>
{
public:
  StringExpr(std::string_view text, SourceRange r) : NodeBase(r, text) {}
};

/// Bare identifier where the grammar expects one (keyword words, rule values).
class IdentifierExpr : public NodeBase<IdentifierExpr, Expr, NodeType::Identifier>
{
public:
  IdentifierExpr(std::string_view name, SourceRange r) : NodeBase(r, name) {}
};

/// `{ ... }`
class BraceExpr : public NodeBase<BraceExpr, Expr, NodeType::Brace>
{
public:
  gsl::span<Stmt *> body;

  BraceExpr(gsl::span<Stmt *> b, SourceRange r) : NodeBase(r, std::string_view("{")), body(b) {}
};

/// `( ... )`
class ParenExpr : public NodeBase<ParenExpr, Expr, NodeType::Paren>
{
public:
  gsl::span<Stmt *> body;

  ParenExpr(gsl::span<Stmt *> b, SourceRange r) : NodeBase(r, std::string_view("(")), body(b) {}
};

/// `[ ... ]`
class SquareExpr : public NodeBase<SquareExpr, Expr, NodeType::Square>
{
public:
  gsl::span<Stmt *> body;

  SquareExpr(gsl::span<Stmt *> b, SourceRange r) : NodeBase(r, std::string_view("[")), body(b)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `operator <int> +s '+' +s <int> { compile(...) ...; imports(...) '...'; }`
class OperatorStmt : public NodeBase<OperatorStmt, Stmt, NodeType::Operator>
{
public:
  gsl::span<Expr *> regex;  // PrimitiveType / WhitespaceIdentifier / String fragments
  gsl::span<Stmt *> body;   // Compile / Imports only

  OperatorStmt(gsl::span<Expr *> rx, gsl::span<Stmt *> b, SourceRange r)
  : NodeBase(r), regex(rx), body(b)
  {
  }
};

/// `compile(ts,js) 'text' +s int|0;`
class CompileStmt : public NodeBase<CompileStmt, Stmt, NodeType::Compile>
{
public:
  gsl::span<std::string_view> formats;
  gsl::span<Expr *> body;

  CompileStmt(gsl::span<std::string_view> f, gsl::span<Expr *> b, SourceRange r)
  : NodeBase(r), formats(f), body(b)
  {
  }
};

/// `imports(ts,js) 'module';`
class ImportsStmt : public NodeBase<ImportsStmt, Stmt, NodeType::Imports>
{
public:
  gsl::span<std::string_view> formats;
  std::string_view module;

  ImportsStmt(gsl::span<std::string_view> f, std::string_view m, SourceRange r)
  : NodeBase(r), formats(f), module(m)
  {
  }
};

/// `import './path';`
class ImportStmt : public NodeBase<ImportStmt, Stmt, NodeType::Import>
{
public:
  std::string_view path;

  ImportStmt(std::string_view p, SourceRange r) : NodeBase(r), path(p) {}
};

/// `function name <int> <string> { ... }`
class FunctionStmt : public NodeBase<FunctionStmt, Stmt, NodeType::Function>
{
public:
  std::string_view name;
  gsl::span<std::string_view> arguments;  // primitive type names, in order
  gsl::span<Stmt *> body;                 // Compile / Imports only

  FunctionStmt(
    std::string_view n, gsl::span<std::string_view> args, gsl::span<Stmt *> b, SourceRange r)
  : NodeBase(r), name(n), arguments(args), body(b)
  {
  }
};

/// `global name { ... }`
class GlobalStmt : public NodeBase<GlobalStmt, Stmt, NodeType::Global>
{
public:
  std::string_view name;
  gsl::span<Stmt *> body;

  GlobalStmt(std::string_view n, gsl::span<Stmt *> b, SourceRange r)
  : NodeBase(r), name(n), body(b)
  {
  }
};

/// `keyword word;`
class KeywordStmt : public NodeBase<KeywordStmt, Stmt, NodeType::Keyword>
{
public:
  std::string_view word;

  KeywordStmt(std::string_view w, SourceRange r) : NodeBase(r), word(w) {}
};

/// `rule 'rule-name': value;`
class RuleStmt : public NodeBase<RuleStmt, Stmt, NodeType::Rule>
{
public:
  std::string_view rule;
  std::string_view value;

  RuleStmt(std::string_view name, std::string_view v, SourceRange r)
  : NodeBase(r), rule(name), value(v)
  {
  }
};

// ============================================================================
// Program
// ============================================================================

/// Root node: ordered top-level statements.
class Program : public NodeBase<Program, Stmt, NodeType::Program>
{
public:
  gsl::span<Stmt *> body;

  Program(gsl::span<Stmt *> b, SourceRange r) : NodeBase(r), body(b) {}
};

// ============================================================================
// Helpers
// ============================================================================

/// Body of a statement that carries one (Operator, Function, Global), else empty.
[[nodiscard]] inline gsl::span<Stmt * const> statement_body(const Stmt * stmt) noexcept
{
  if (const auto * op = dyn_cast<OperatorStmt>(stmt)) return op->body;
  if (const auto * fn = dyn_cast<FunctionStmt>(stmt)) return fn->body;
  if (const auto * gl = dyn_cast<GlobalStmt>(stmt)) return gl->body;
  return {};
}

}  // namespace syx

// syx/ast/ast_enums.hpp - AST enumeration definitions
#pragma once

#include <cstdint>
#include <string_view>

namespace syx
{

// ============================================================================
// NodeType - Identifies all AST node types
// ============================================================================

/**
 * Node type enumeration for LLVM-style RTTI.
 * Statements come first, expressions after, so classof checks are ranges.
 */
enum class NodeType : uint8_t {
  // === Statements ===
  Program,
  Operator,
  Compile,
  Imports,
  Import,
  Function,
  Global,
  Keyword,
  Rule,

  // === Expressions ===
  PrimitiveType,
  WhitespaceIdentifier,
  Variable,
  String,
  Identifier,
  Brace,
  Paren,
  Square,
};

namespace detail
{
inline constexpr NodeType k_first_expr_type = NodeType::PrimitiveType;
inline constexpr NodeType k_last_expr_type = NodeType::Square;
inline constexpr NodeType k_first_body_expr_type = NodeType::Brace;
}  // namespace detail

[[nodiscard]] constexpr bool is_expr_type(NodeType t) noexcept
{
  return t >= detail::k_first_expr_type && t <= detail::k_last_expr_type;
}

/// Brace/Paren/Square containers
[[nodiscard]] constexpr bool is_body_expr_type(NodeType t) noexcept
{
  return t >= detail::k_first_body_expr_type && t <= detail::k_last_expr_type;
}

[[nodiscard]] constexpr std::string_view to_string(NodeType t) noexcept
{
  switch (t) {
    case NodeType::Program:
      return "Program";
    case NodeType::Operator:
      return "Operator";
    case NodeType::Compile:
      return "Compile";
    case NodeType::Imports:
      return "Imports";
    case NodeType::Import:
      return "Import";
    case NodeType::Function:
      return "Function";
    case NodeType::Global:
      return "Global";
    case NodeType::Keyword:
      return "Keyword";
    case NodeType::Rule:
      return "Rule";
    case NodeType::PrimitiveType:
      return "PrimitiveType";
    case NodeType::WhitespaceIdentifier:
      return "WhitespaceIdentifier";
    case NodeType::Variable:
      return "Variable";
    case NodeType::String:
      return "String";
    case NodeType::Identifier:
      return "Identifier";
    case NodeType::Brace:
      return "Brace";
    case NodeType::Paren:
      return "Paren";
    case NodeType::Square:
      return "Square";
  }
  return "<unknown>";
}

}  // namespace syx

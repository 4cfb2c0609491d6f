// syx/codegen/pattern.cpp - Operator regex assembly
#include "syx/codegen/pattern.hpp"

#include "syx/sema/registry.hpp"

namespace syx::codegen
{

std::string escape_regex(std::string_view text)
{
  static constexpr std::string_view k_special = ".*+?^${}()|[]\\";

  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    if (k_special.find(c) != std::string_view::npos) {
      out += '\\';
    }
    out += c;
  }
  return out;
}

std::optional<std::string> primitive_regex(std::string_view type_name)
{
  if (const auto p = registry::primitive_pattern(type_name)) {
    return std::string(p->source);
  }
  return std::nullopt;
}

OperatorPattern build_operator_pattern(const OperatorStmt & op)
{
  OperatorPattern out;
  uint32_t next_group = 1;

  for (const Expr * fragment : op.regex) {
    switch (fragment->type) {
      case NodeType::PrimitiveType: {
        const auto p = registry::primitive_pattern(fragment->value);
        if (!p) break;
        out.source += p->source;
        out.captures.push_back(CaptureSlot{std::string(fragment->value), next_group});
        next_group += p->group_count;
        break;
      }
      case NodeType::WhitespaceIdentifier:
        out.source += registry::whitespace_pattern();
        break;
      case NodeType::String:
        out.source += escape_regex(fragment->value);
        break;
      default:
        break;
    }
  }
  return out;
}

std::optional<uint32_t> resolve_capture(
  const OperatorPattern & pattern, std::string_view name, uint32_t index)
{
  const bool by_type = registry::is_primitive_type(name);
  uint32_t seen = 0;
  for (const auto & slot : pattern.captures) {
    if (by_type && slot.type != name) continue;
    if (seen == index) {
      return slot.group;
    }
    ++seen;
  }
  return std::nullopt;
}

}  // namespace syx::codegen

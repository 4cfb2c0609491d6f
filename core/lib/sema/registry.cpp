// syx/sema/registry.cpp - Rule and dictionary tables
#include "syx/sema/registry.hpp"

#include <algorithm>
#include <array>

namespace syx::registry
{

namespace
{

// RE2 syntax; [\s\S] matches any byte including newlines.
constexpr std::array<PrimitivePattern, 4> k_primitive_patterns = {{
  {"int", R"(([0-9]+))", 1},
  {"string", R"(('[\s\S]*'|"[\s\S]*"))", 1},
  {"boolean", R"((true|false))", 1},
  {"decimal", R"(([0-9]+(\.[0-9]+)?))", 2},
}};

std::vector<RuleEntry> make_rules()
{
  std::vector<RuleEntry> r;
  r.push_back(RuleEntry{
    "imports-keyword",
    RuleValueKind::Keyword,
    "import",
    {},
    "Determines which keyword should be used to import modules using defined in an imports "
    "statement."});
  r.push_back(RuleEntry{
    "function-value-return-enabled",
    RuleValueKind::Boolean,
    "false",
    {},
    "Determines whether is it possible to return a value from a function using a keyword."});
  r.push_back(RuleEntry{
    "function-value-return-keyword",
    RuleValueKind::Keyword,
    "return",
    {},
    "Determines the keyword used to return a function from a keyword. Must be used with "
    "`function-value-return-enabled` set to true to make a difference."});
  r.push_back(RuleEntry{
    "enforce-single-string-quotes",
    RuleValueKind::Boolean,
    "false",
    {"enforce-double-string-quotes"},
    "Enforces string values to have single quotes in output. Useful for languages like Java "
    "where quote type matters."});
  r.push_back(RuleEntry{
    "enforce-double-string-quotes",
    RuleValueKind::Boolean,
    "false",
    {"enforce-single-string-quotes"},
    "Enforces string values to have double quotes in output. Useful for languages like Java "
    "where quote type matters."});
  return r;
}

}  // namespace

bool RuleEntry::conflicts_with(std::string_view other) const noexcept
{
  return std::find(conflicts.begin(), conflicts.end(), other) != conflicts.end();
}

const std::vector<RuleEntry> & rules()
{
  static const std::vector<RuleEntry> k_rules = make_rules();
  return k_rules;
}

const RuleEntry * find_rule(std::string_view name) noexcept
{
  for (const auto & r : rules()) {
    if (r.name == name) {
      return &r;
    }
  }
  return nullptr;
}

std::vector<std::string> rule_names()
{
  std::vector<std::string> names;
  for (const auto & r : rules()) {
    names.emplace_back(r.name);
  }
  return names;
}

bool rules_conflict(std::string_view a, std::string_view b) noexcept
{
  const RuleEntry * ra = find_rule(a);
  const RuleEntry * rb = find_rule(b);
  return (ra != nullptr && ra->conflicts_with(b)) || (rb != nullptr && rb->conflicts_with(a));
}

const std::vector<std::string_view> & reserved_keywords()
{
  static const std::vector<std::string_view> k_keywords = {
    "export", "rule", "keyword", "import", "operator", "function", "global"};
  return k_keywords;
}

const std::vector<std::string_view> & primitive_types()
{
  static const std::vector<std::string_view> k_types = {"int", "decimal", "boolean", "string"};
  return k_types;
}

bool is_primitive_type(std::string_view name) noexcept
{
  const auto & types = primitive_types();
  return std::find(types.begin(), types.end(), name) != types.end();
}

std::optional<PrimitivePattern> primitive_pattern(std::string_view type_name) noexcept
{
  for (const auto & p : k_primitive_patterns) {
    if (p.type_name == type_name) {
      return p;
    }
  }
  return std::nullopt;
}

std::string_view whitespace_pattern() noexcept { return R"(\s*)"; }

bool is_boolean_literal(std::string_view value)
{
  return value == "true" || value == "false";
}

bool is_exportable(NodeType t) noexcept
{
  switch (t) {
    case NodeType::Function:
    case NodeType::Operator:
    case NodeType::Keyword:
    case NodeType::Rule:
    case NodeType::Global:
      return true;
    default:
      return false;
  }
}

bool has_body(NodeType t) noexcept
{
  return t == NodeType::Operator || t == NodeType::Function || t == NodeType::Global;
}

}  // namespace syx::registry

// syx/sema/registry.hpp - Rule and dictionary tables
//
// Read-only lookup tables consulted by the parser, the diagnostic engine and
// the compiler: registered rules, reserved keywords, primitive-type patterns
// and the node types that may be exported or carry a body.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "syx/ast/ast_enums.hpp"

namespace syx::registry
{

enum class RuleValueKind : uint8_t {
  Boolean,
  Keyword,
};

struct RuleEntry
{
  std::string_view name;
  RuleValueKind kind = RuleValueKind::Boolean;
  std::string_view default_value;
  std::vector<std::string_view> conflicts;
  std::string_view description;

  [[nodiscard]] bool conflicts_with(std::string_view other) const noexcept;
};

/// Regex source for a primitive type and the number of capture groups it opens.
struct PrimitivePattern
{
  std::string_view type_name;
  std::string_view source;
  uint32_t group_count = 0;
};

inline constexpr std::string_view k_imports_keyword_rule = "imports-keyword";

/// All registered rules, in declaration order.
[[nodiscard]] const std::vector<RuleEntry> & rules();

[[nodiscard]] const RuleEntry * find_rule(std::string_view name) noexcept;

/// Names of every registered rule, in declaration order.
[[nodiscard]] std::vector<std::string> rule_names();

/// True when either rule lists the other as conflicting.
[[nodiscard]] bool rules_conflict(std::string_view a, std::string_view b) noexcept;

/// Words reserved by the grammar.
[[nodiscard]] const std::vector<std::string_view> & reserved_keywords();

/// int, decimal, boolean, string.
[[nodiscard]] const std::vector<std::string_view> & primitive_types();

[[nodiscard]] bool is_primitive_type(std::string_view name) noexcept;

[[nodiscard]] std::optional<PrimitivePattern> primitive_pattern(
  std::string_view type_name) noexcept;

/// Pattern of the `+s` whitespace identifier.
[[nodiscard]] std::string_view whitespace_pattern() noexcept;

/// Value accepted by boolean rules: `true` or `false`.
[[nodiscard]] bool is_boolean_literal(std::string_view value);

[[nodiscard]] bool is_exportable(NodeType t) noexcept;

[[nodiscard]] bool has_body(NodeType t) noexcept;

}  // namespace syx::registry

// syx/codegen/pattern.hpp - Operator regex assembly with capture provenance
//
// An operator's fragments (`<type>`, `+s`, literal strings) are concatenated
// into one RE2 pattern. Every primitive fragment records which capture
// group of the assembled pattern it opened, so a compile template can read
// `name|N` directly from a single match.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "syx/ast/ast.hpp"

namespace syx::codegen
{

/// Capture opened by one primitive fragment.
struct CaptureSlot
{
  std::string type;    // int, decimal, boolean, string
  uint32_t group = 0;  // 1-based group index in the assembled pattern
};

struct OperatorPattern
{
  std::string source;
  std::vector<CaptureSlot> captures;  // primitive fragments in source order
};

/// Escape every regex metacharacter in `text`.
[[nodiscard]] std::string escape_regex(std::string_view text);

/// Regex for one primitive type name; nullopt for an unknown name.
[[nodiscard]] std::optional<std::string> primitive_regex(std::string_view type_name);

[[nodiscard]] OperatorPattern build_operator_pattern(const OperatorStmt & op);

/**
 * Group index of the `name|index` reference.
 *
 * A primitive type name selects the index-th fragment of that type; any other
 * name selects the index-th primitive fragment overall.
 */
[[nodiscard]] std::optional<uint32_t> resolve_capture(
  const OperatorPattern & pattern, std::string_view name, uint32_t index);

}  // namespace syx::codegen

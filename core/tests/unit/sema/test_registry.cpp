#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "syx/sema/registry.hpp"

namespace registry = syx::registry;
using syx::NodeType;

TEST(SemaRegistry, RegisteredRules)
{
  const std::vector<std::string> expected = {
    "imports-keyword",
    "function-value-return-enabled",
    "function-value-return-keyword",
    "enforce-single-string-quotes",
    "enforce-double-string-quotes",
  };
  EXPECT_EQ(registry::rule_names(), expected);
}

TEST(SemaRegistry, RuleKindsAndDefaults)
{
  const auto * imports = registry::find_rule("imports-keyword");
  ASSERT_NE(imports, nullptr);
  EXPECT_EQ(imports->kind, registry::RuleValueKind::Keyword);
  EXPECT_EQ(imports->default_value, "import");
  EXPECT_FALSE(imports->description.empty());

  const auto * ret = registry::find_rule("function-value-return-keyword");
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(ret->kind, registry::RuleValueKind::Keyword);
  EXPECT_EQ(ret->default_value, "return");

  const auto * enabled = registry::find_rule("function-value-return-enabled");
  ASSERT_NE(enabled, nullptr);
  EXPECT_EQ(enabled->kind, registry::RuleValueKind::Boolean);
  EXPECT_EQ(enabled->default_value, "false");

  EXPECT_EQ(registry::find_rule("custom-random-rule?"), nullptr);
  EXPECT_EQ(registry::find_rule("Imports-Keyword"), nullptr);
}

TEST(SemaRegistry, QuoteRulesConflictInBothDirections)
{
  EXPECT_TRUE(
    registry::rules_conflict("enforce-single-string-quotes", "enforce-double-string-quotes"));
  EXPECT_TRUE(
    registry::rules_conflict("enforce-double-string-quotes", "enforce-single-string-quotes"));
  EXPECT_FALSE(registry::rules_conflict("imports-keyword", "enforce-single-string-quotes"));
  EXPECT_FALSE(registry::rules_conflict("unknown", "imports-keyword"));
}

TEST(SemaRegistry, PrimitivePatterns)
{
  EXPECT_TRUE(registry::is_primitive_type("int"));
  EXPECT_TRUE(registry::is_primitive_type("decimal"));
  EXPECT_TRUE(registry::is_primitive_type("boolean"));
  EXPECT_TRUE(registry::is_primitive_type("string"));
  EXPECT_FALSE(registry::is_primitive_type("float"));

  const auto int_pattern = registry::primitive_pattern("int");
  ASSERT_TRUE(int_pattern.has_value());
  EXPECT_EQ(int_pattern->source, "([0-9]+)");
  EXPECT_EQ(int_pattern->group_count, 1U);

  const auto decimal = registry::primitive_pattern("decimal");
  ASSERT_TRUE(decimal.has_value());
  EXPECT_EQ(decimal->group_count, 2U);

  EXPECT_FALSE(registry::primitive_pattern("float").has_value());
  EXPECT_EQ(registry::whitespace_pattern(), "\\s*");
}

TEST(SemaRegistry, BooleanLiterals)
{
  EXPECT_TRUE(registry::is_boolean_literal("true"));
  EXPECT_TRUE(registry::is_boolean_literal("false"));
  EXPECT_FALSE(registry::is_boolean_literal("True"));
  EXPECT_FALSE(registry::is_boolean_literal("truex"));
  EXPECT_FALSE(registry::is_boolean_literal(""));
}

TEST(SemaRegistry, ExportableAndBodyNodeTypes)
{
  EXPECT_TRUE(registry::is_exportable(NodeType::Operator));
  EXPECT_TRUE(registry::is_exportable(NodeType::Function));
  EXPECT_TRUE(registry::is_exportable(NodeType::Keyword));
  EXPECT_TRUE(registry::is_exportable(NodeType::Rule));
  EXPECT_TRUE(registry::is_exportable(NodeType::Global));
  EXPECT_FALSE(registry::is_exportable(NodeType::Import));
  EXPECT_FALSE(registry::is_exportable(NodeType::Compile));
  EXPECT_FALSE(registry::is_exportable(NodeType::String));

  EXPECT_TRUE(registry::has_body(NodeType::Operator));
  EXPECT_TRUE(registry::has_body(NodeType::Function));
  EXPECT_TRUE(registry::has_body(NodeType::Global));
  EXPECT_FALSE(registry::has_body(NodeType::Keyword));
}

TEST(SemaRegistry, ReservedKeywords)
{
  const auto & words = registry::reserved_keywords();
  EXPECT_NE(std::find(words.begin(), words.end(), "operator"), words.end());
  EXPECT_NE(std::find(words.begin(), words.end(), "rule"), words.end());
}

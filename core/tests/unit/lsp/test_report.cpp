#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "syx/lsp/report.hpp"

using namespace syx;
using json = nlohmann::json;

TEST(LspReport, SeverityCodes)
{
  EXPECT_EQ(lsp::severity_to_lsp(Severity::Error), 1);
  EXPECT_EQ(lsp::severity_to_lsp(Severity::Warning), 2);
}

TEST(LspReport, RangeShape)
{
  const json j = lsp::range_to_json(SourceRange{1, 2, 3, 4});
  EXPECT_EQ(j["start"]["line"], 1);
  EXPECT_EQ(j["start"]["character"], 2);
  EXPECT_EQ(j["end"]["line"], 3);
  EXPECT_EQ(j["end"]["character"], 4);

  EXPECT_EQ(lsp::range_from_json(j), (SourceRange{1, 2, 3, 4}));
}

TEST(LspReport, RangeFromPartialJson)
{
  const json partial = json::parse(R"({"start": {"line": 2}})");
  EXPECT_EQ(lsp::range_from_json(partial), (SourceRange{2, 0, 0, 0}));
  EXPECT_EQ(lsp::range_from_json(json::object()), SourceRange{});
}

TEST(LspReport, CodeActionShape)
{
  const CodeAction action =
    make_edit_action("Remove this rule", "file:///w/a.syx", SourceRange{0, 0, 0, 9}, "");
  const json j = lsp::code_action_to_json(action);

  EXPECT_EQ(j["title"], "Remove this rule");
  EXPECT_EQ(j["kind"], "quickfix");
  const json & edits = j["edit"]["changes"]["file:///w/a.syx"];
  ASSERT_EQ(edits.size(), 1U);
  EXPECT_EQ(edits[0]["newText"], "");
  EXPECT_EQ(edits[0]["range"]["end"]["character"], 9);
}

TEST(LspReport, DiagnosticCarriesActionsInData)
{
  Diagnostic d;
  d.severity = Severity::Warning;
  d.message = "Rule 'a' conflicts with rule 'b'.";
  d.range = SourceRange{0, 5, 0, 8};
  d.file = "a.syx";
  d.actions.push_back(make_edit_action("Remove", "a.syx", d.range, ""));

  const json j = lsp::diagnostic_to_json(d);
  EXPECT_EQ(j["message"], d.message);
  EXPECT_EQ(j["severity"], 2);
  EXPECT_EQ(j["source"], "syntax-script");
  ASSERT_TRUE(j["data"].is_array());
  ASSERT_EQ(j["data"].size(), 1U);
  EXPECT_EQ(j["data"][0]["title"], "Remove");
}

TEST(LspReport, ReportShape)
{
  const DiagnosticReport empty;
  const json e = lsp::report_to_json(empty);
  EXPECT_EQ(e["kind"], "full");
  EXPECT_TRUE(e["items"].is_array());
  EXPECT_TRUE(e["items"].empty());

  const DiagnosticReport report =
    create_diagnostic_report("/tmp/syx_lsp/main.syx", std::string_view("keyword ruleis"));
  const json j = lsp::report_to_json(report);
  ASSERT_EQ(j["items"].size(), 1U);
  EXPECT_EQ(j["items"][0]["severity"], 1);
  EXPECT_EQ(j["items"][0]["range"]["start"]["line"], 0);
  EXPECT_EQ(j["items"][0]["range"]["start"]["character"], 14);
  EXPECT_EQ(j["items"][0]["range"]["end"]["character"], 14);
}

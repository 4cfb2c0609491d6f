// syx/lsp/report.cpp - LSP JSON encoding of diagnostic reports
#include "syx/lsp/report.hpp"

namespace syx::lsp
{

using json = nlohmann::json;

int severity_to_lsp(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return 1;
    case Severity::Warning:
      return 2;
  }
  return 1;
}

json range_to_json(const SourceRange & r)
{
  return json{
    {"start", {{"line", r.start.line}, {"character", r.start.character}}},
    {"end", {{"line", r.end.line}, {"character", r.end.character}}},
  };
}

SourceRange range_from_json(const json & j)
{
  auto coord = [&j](const char * pos, const char * field) -> uint32_t {
    if (!j.contains(pos) || !j[pos].contains(field)) return 0;
    return j[pos][field].get<uint32_t>();
  };
  return SourceRange{
    coord("start", "line"), coord("start", "character"), coord("end", "line"),
    coord("end", "character")};
}

json code_action_to_json(const CodeAction & action)
{
  json changes = json::object();
  for (const auto & [file, edits] : action.changes) {
    json list = json::array();
    for (const auto & edit : edits) {
      list.push_back(json{{"range", range_to_json(edit.range)}, {"newText", edit.new_text}});
    }
    changes[file] = std::move(list);
  }

  return json{
    {"title", action.title},
    {"kind", action.kind},
    {"edit", {{"changes", std::move(changes)}}},
  };
}

json diagnostic_to_json(const Diagnostic & diag)
{
  json data = json::array();
  for (const auto & action : diag.actions) {
    data.push_back(code_action_to_json(action));
  }

  return json{
    {"message", diag.message},
    {"range", range_to_json(diag.range)},
    {"severity", severity_to_lsp(diag.severity)},
    {"source", diag.source},
    {"data", std::move(data)},
  };
}

json report_to_json(const DiagnosticReport & report)
{
  json items = json::array();
  for (const auto & d : report.items) {
    items.push_back(diagnostic_to_json(d));
  }
  return json{{"kind", report.kind}, {"items", std::move(items)}};
}

}  // namespace syx::lsp

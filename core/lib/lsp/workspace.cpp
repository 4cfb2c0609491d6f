// syx/lsp/workspace.cpp - Open-document store for the language server
#include "syx/lsp/workspace.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <unordered_map>
#include <utility>

#include "syx/lsp/report.hpp"
#include "syx/sema/diagnostic_engine.hpp"

namespace syx::lsp
{

using json = nlohmann::json;

// =============================================================================
// Workspace::Impl
// =============================================================================

struct Workspace::Impl
{
  struct Document
  {
    std::string uri;
    std::string text;
    std::optional<DiagnosticReport> report;
  };

  std::unordered_map<std::string, Document> docs;

  Document * get_doc(std::string_view uri)
  {
    auto it = docs.find(std::string(uri));
    if (it == docs.end()) {
      return nullptr;
    }
    return &it->second;
  }

  const DiagnosticReport & ensure_report(Document & d)
  {
    if (!d.report) {
      d.report = create_diagnostic_report(d.uri, std::optional<std::string_view>(d.text));
    }
    return *d.report;
  }
};

// =============================================================================
// Workspace public API
// =============================================================================

Workspace::Workspace() : impl_(std::make_unique<Impl>()) {}

Workspace::~Workspace() = default;

Workspace::Workspace(Workspace && other) noexcept = default;

Workspace & Workspace::operator=(Workspace && other) noexcept = default;

void Workspace::set_document(std::string uri, std::string text)
{
  auto & d = impl_->docs[uri];
  d.uri = std::move(uri);
  d.text = std::move(text);
  d.report.reset();
}

void Workspace::remove_document(std::string_view uri) { impl_->docs.erase(std::string(uri)); }

bool Workspace::has_document(std::string_view uri) const
{
  return impl_->docs.find(std::string(uri)) != impl_->docs.end();
}

std::string Workspace::diagnostics_json(std::string_view uri)
{
  auto * doc = impl_->get_doc(uri);
  if (doc == nullptr) {
    return report_to_json(DiagnosticReport{}).dump();
  }
  return report_to_json(impl_->ensure_report(*doc)).dump();
}

std::string Workspace::code_actions_json(std::string_view uri, const SourceRange & range)
{
  json out = json::array();

  auto * doc = impl_->get_doc(uri);
  if (doc == nullptr) {
    return out.dump();
  }

  for (const auto & item : impl_->ensure_report(*doc).items) {
    if (!item.range.intersects(range)) continue;
    for (const auto & action : item.actions) {
      json a = code_action_to_json(action);
      a["diagnostics"] = json::array({diagnostic_to_json(item)});
      out.push_back(std::move(a));
    }
  }
  return out.dump();
}

}  // namespace syx::lsp

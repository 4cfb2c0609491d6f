// syx/lsp/workspace.hpp - Open-document store for the language server
#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "syx/basic/source_manager.hpp"

namespace syx::lsp
{

/**
 * In-memory copies of the documents an editor has open.
 *
 * Reports are computed on demand from the stored text and cached until the
 * document changes. All JSON results are LSP-shaped with 0-based ranges.
 */
class Workspace
{
public:
  Workspace();
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  void set_document(std::string uri, std::string text);
  void remove_document(std::string_view uri);
  [[nodiscard]] bool has_document(std::string_view uri) const;

  /// `{kind: "full", items: [...]}`; empty report for unknown documents
  [[nodiscard]] std::string diagnostics_json(std::string_view uri);

  /// Code actions of every diagnostic whose range intersects `range` (0-based)
  [[nodiscard]] std::string code_actions_json(std::string_view uri, const SourceRange & range);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace syx::lsp

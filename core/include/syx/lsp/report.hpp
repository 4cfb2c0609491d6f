// syx/lsp/report.hpp - LSP JSON encoding of diagnostic reports
#pragma once

#include <nlohmann/json.hpp>

#include "syx/basic/diagnostic.hpp"
#include "syx/basic/source_manager.hpp"
#include "syx/sema/diagnostic_engine.hpp"

namespace syx::lsp
{

/// LSP DiagnosticSeverity: Error = 1, Warning = 2
[[nodiscard]] int severity_to_lsp(Severity s) noexcept;

/// `{start: {line, character}, end: {line, character}}`, coordinates as given
[[nodiscard]] nlohmann::json range_to_json(const SourceRange & r);

/// Inverse of range_to_json; missing fields read as 0
[[nodiscard]] SourceRange range_from_json(const nlohmann::json & j);

/// `{title, kind, edit: {changes: {<file>: [{range, newText}]}}}`
[[nodiscard]] nlohmann::json code_action_to_json(const CodeAction & action);

/// LSP Diagnostic; code actions travel in `data`
[[nodiscard]] nlohmann::json diagnostic_to_json(const Diagnostic & diag);

/// `{kind: "full", items: [...]}`
[[nodiscard]] nlohmann::json report_to_json(const DiagnosticReport & report);

}  // namespace syx::lsp

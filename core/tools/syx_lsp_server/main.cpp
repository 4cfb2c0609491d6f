// Syntax Script LSP server (stdio JSON-RPC)
//
// This is a thin wrapper around syx::lsp::Workspace. It implements document
// sync, diagnostics (pushed and pulled) and quick-fix code actions.
//
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <syx/lsp/report.hpp>
#include <syx/lsp/workspace.hpp>
#include <utility>

using nlohmann::json;

namespace
{

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// LSP error codes
constexpr int k_method_not_found = -32601;
constexpr int k_invalid_params = -32602;

void write_message(const json & msg)
{
  const std::string body = msg.dump();
  std::cout << "Content-Length: " << body.size() << "\r\n\r\n";
  std::cout << body;
  std::cout.flush();
}

std::optional<json> read_message()
{
  std::string line;
  size_t content_length = 0;
  bool saw_length = false;

  while (std::getline(std::cin, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    if (starts_with(sv, "Content-Length:")) {
      const std::string_view rest = sv.substr(std::string_view("Content-Length:").size());
      content_length = static_cast<size_t>(std::strtoul(std::string(rest).c_str(), nullptr, 10));
      saw_length = true;
    }
  }

  if (!saw_length || content_length == 0) {
    // Malformed header or end of input.
    return std::nullopt;
  }

  std::string body(content_length, '\0');
  std::cin.read(body.data(), static_cast<std::streamsize>(content_length));
  if (std::cin.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }

  try {
    return json::parse(body);
  } catch (const json::parse_error & e) {
    std::cerr << "syx_lsp_server: dropping malformed message: " << e.what() << "\n";
    return std::nullopt;
  }
}

}  // namespace

int main()
{
  std::ios::sync_with_stdio(false);

  syx::lsp::Workspace ws;

  auto publish_diagnostics = [&](const std::string & uri) {
    json report = json::parse(ws.diagnostics_json(uri));

    json notif;
    notif["jsonrpc"] = "2.0";
    notif["method"] = "textDocument/publishDiagnostics";
    notif["params"] = json{{"uri", uri}, {"diagnostics", std::move(report["items"])}};
    write_message(notif);
  };

  bool running = true;
  bool shutdown_requested = false;
  while (running) {
    const auto msg_opt = read_message();
    if (!msg_opt) {
      if (!std::cin.good()) {
        break;
      }
      continue;
    }

    const json & msg = *msg_opt;
    const std::string method = msg.value("method", "");
    const bool is_request = msg.contains("id");

    auto respond = [&](const json & id, const json & result) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = id;
      resp["result"] = result;
      write_message(resp);
    };

    auto respond_error = [&](const json & id, int code, std::string message) {
      json resp;
      resp["jsonrpc"] = "2.0";
      resp["id"] = id;
      resp["error"] = json{{"code", code}, {"message", std::move(message)}};
      write_message(resp);
    };

    const json params = msg.value("params", json::object());

    if (method == "initialize" && is_request) {
      json caps;
      caps["textDocumentSync"] = json{{"openClose", true}, {"change", 1}};  // Full sync
      caps["codeActionProvider"] = json{{"codeActionKinds", json::array({"quickfix"})}};
      caps["diagnosticProvider"] =
        json{{"interFileDependencies", true}, {"workspaceDiagnostics", false}};

      const json result = json{
        {"capabilities", caps},
        {"serverInfo", json{{"name", "syx_lsp_server"}, {"version", "0.1.0"}}}};
      respond(msg["id"], result);
      continue;
    }

    if (method == "initialized") {
      // no-op
      continue;
    }

    if (method == "shutdown" && is_request) {
      shutdown_requested = true;
      respond(msg["id"], json());
      continue;
    }

    if (method == "exit") {
      running = false;
      continue;
    }

    if (method == "textDocument/didOpen") {
      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");
      if (!uri.empty()) {
        ws.set_document(uri, td.value("text", ""));
        publish_diagnostics(uri);
      }
      continue;
    }

    if (method == "textDocument/didChange") {
      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");
      if (uri.empty()) {
        continue;
      }

      // Full sync: the last change carries the whole document
      const auto changes = params.value("contentChanges", json::array());
      if (changes.empty() || !changes.back().is_object()) {
        continue;
      }
      ws.set_document(uri, changes.back().value("text", ""));
      publish_diagnostics(uri);
      continue;
    }

    if (method == "textDocument/didClose") {
      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");
      if (!uri.empty()) {
        ws.remove_document(uri);

        // Clear diagnostics on close
        json notif;
        notif["jsonrpc"] = "2.0";
        notif["method"] = "textDocument/publishDiagnostics";
        notif["params"] = json{{"uri", uri}, {"diagnostics", json::array()}};
        write_message(notif);
      }
      continue;
    }

    if (method == "textDocument/diagnostic" && is_request) {
      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");
      if (uri.empty()) {
        respond_error(msg["id"], k_invalid_params, "textDocument.uri is required");
        continue;
      }
      respond(msg["id"], json::parse(ws.diagnostics_json(uri)));
      continue;
    }

    if (method == "textDocument/codeAction" && is_request) {
      const auto td = params.value("textDocument", json::object());
      const std::string uri = td.value("uri", "");
      if (uri.empty() || !params.contains("range")) {
        respond_error(msg["id"], k_invalid_params, "textDocument.uri and range are required");
        continue;
      }
      const syx::SourceRange range = syx::lsp::range_from_json(params["range"]);
      respond(msg["id"], json::parse(ws.code_actions_json(uri, range)));
      continue;
    }

    if (is_request) {
      respond_error(msg["id"], k_method_not_found, "Method not found: " + method);
    }
  }

  return shutdown_requested ? 0 : 1;
}

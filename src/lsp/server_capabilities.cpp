#include "lsp/server_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(nlohmann::json& j, const TextDocumentSyncKind& o) {
  j = nlohmann::json(static_cast<int>(o));
}

void from_json(const nlohmann::json& j, TextDocumentSyncKind& o) {
  o = static_cast<TextDocumentSyncKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const TextDocumentSyncOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "openClose", o.openClose);
  to_json_optional(j, "change", o.change);
}

void from_json(const nlohmann::json& j, TextDocumentSyncOptions& o) {
  from_json_optional(j, "openClose", o.openClose);
  from_json_optional(j, "change", o.change);
}

void to_json(nlohmann::json& j, const CompletionOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "triggerCharacters", o.triggerCharacters);
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, CompletionOptions& o) {
  from_json_optional(j, "triggerCharacters", o.triggerCharacters);
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const InlayHintOptions& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "resolveProvider", o.resolveProvider);
}

void from_json(const nlohmann::json& j, InlayHintOptions& o) {
  from_json_optional(j, "resolveProvider", o.resolveProvider);
}

void to_json(nlohmann::json& j, const WorkspaceFoldersServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "supported", o.supported);
  to_json_optional(j, "changeNotifications", o.changeNotifications);
}

void from_json(const nlohmann::json& j, WorkspaceFoldersServerCapabilities& o) {
  from_json_optional(j, "supported", o.supported);
  // The protocol also allows a registration id string here
  if (j.contains("changeNotifications") &&
      j.at("changeNotifications").is_boolean()) {
    o.changeNotifications = j.at("changeNotifications").get<bool>();
  }
}

void to_json(
    nlohmann::json& j, const ServerCapabilities::InlayHintProvider& o) {
  std::visit([&j](const auto& arg) { j = arg; }, o);
}

void from_json(
    const nlohmann::json& j, ServerCapabilities::InlayHintProvider& o) {
  if (j.is_boolean()) {
    o = j.get<bool>();
  } else {
    o = j.get<InlayHintOptions>();
  }
}

void to_json(nlohmann::json& j, const ServerCapabilities::Workspace& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void from_json(const nlohmann::json& j, ServerCapabilities::Workspace& o) {
  from_json_optional(j, "workspaceFolders", o.workspaceFolders);
}

void to_json(nlohmann::json& j, const ServerCapabilities& o) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncoding", o.positionEncoding);
  to_json_optional(j, "textDocumentSync", o.textDocumentSync);
  to_json_optional(j, "completionProvider", o.completionProvider);
  to_json_optional(j, "hoverProvider", o.hoverProvider);
  to_json_optional(j, "definitionProvider", o.definitionProvider);
  to_json_optional(j, "inlayHintProvider", o.inlayHintProvider);
  to_json_optional(j, "workspace", o.workspace);
}

void from_json(const nlohmann::json& j, ServerCapabilities& o) {
  from_json_optional(j, "positionEncoding", o.positionEncoding);
  from_json_optional(j, "textDocumentSync", o.textDocumentSync);
  from_json_optional(j, "completionProvider", o.completionProvider);
  from_json_optional(j, "hoverProvider", o.hoverProvider);
  from_json_optional(j, "definitionProvider", o.definitionProvider);
  from_json_optional(j, "inlayHintProvider", o.inlayHintProvider);
  from_json_optional(j, "workspace", o.workspace);
}

}  // namespace lsp

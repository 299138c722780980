#include "lsp/client_capabilities.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

void to_json(
    nlohmann::json& j, const DidChangeConfigurationClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "dynamicRegistration", c.dynamicRegistration);
}

void from_json(
    const nlohmann::json& j, DidChangeConfigurationClientCapabilities& c) {
  from_json_optional(j, "dynamicRegistration", c.dynamicRegistration);
}

void to_json(nlohmann::json& j, const WorkspaceClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "didChangeConfiguration", c.didChangeConfiguration);
  to_json_optional(j, "workspaceFolders", c.workspaceFolders);
  to_json_optional(j, "configuration", c.configuration);
}

void from_json(const nlohmann::json& j, WorkspaceClientCapabilities& c) {
  from_json_optional(j, "didChangeConfiguration", c.didChangeConfiguration);
  from_json_optional(j, "workspaceFolders", c.workspaceFolders);
  from_json_optional(j, "configuration", c.configuration);
}

void to_json(nlohmann::json& j, const PublishDiagnosticsClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "relatedInformation", c.relatedInformation);
  to_json_optional(j, "versionSupport", c.versionSupport);
}

void from_json(
    const nlohmann::json& j, PublishDiagnosticsClientCapabilities& c) {
  from_json_optional(j, "relatedInformation", c.relatedInformation);
  from_json_optional(j, "versionSupport", c.versionSupport);
}

void to_json(nlohmann::json& j, const TextDocumentClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "publishDiagnostics", c.publishDiagnostics);
}

void from_json(const nlohmann::json& j, TextDocumentClientCapabilities& c) {
  from_json_optional(j, "publishDiagnostics", c.publishDiagnostics);
}

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "positionEncodings", c.positionEncodings);
}

void from_json(const nlohmann::json& j, GeneralClientCapabilities& c) {
  from_json_optional(j, "positionEncodings", c.positionEncodings);
}

void to_json(nlohmann::json& j, const ClientCapabilities& c) {
  j = nlohmann::json::object();
  to_json_optional(j, "workspace", c.workspace);
  to_json_optional(j, "textDocument", c.textDocument);
  to_json_optional(j, "general", c.general);
}

void from_json(const nlohmann::json& j, ClientCapabilities& c) {
  from_json_optional(j, "workspace", c.workspace);
  from_json_optional(j, "textDocument", c.textDocument);
  from_json_optional(j, "general", c.general);
}

}  // namespace lsp

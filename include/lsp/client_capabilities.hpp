#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace lsp {

// Workspace specific client capabilities
struct DidChangeConfigurationClientCapabilities {
  std::optional<bool> dynamicRegistration;
};

void to_json(
    nlohmann::json& j, const DidChangeConfigurationClientCapabilities& c);
void from_json(
    const nlohmann::json& j, DidChangeConfigurationClientCapabilities& c);

struct WorkspaceClientCapabilities {
  std::optional<DidChangeConfigurationClientCapabilities>
      didChangeConfiguration;
  std::optional<bool> workspaceFolders;
  std::optional<bool> configuration;
};

void to_json(nlohmann::json& j, const WorkspaceClientCapabilities& c);
void from_json(const nlohmann::json& j, WorkspaceClientCapabilities& c);

// Text document specific client capabilities
struct PublishDiagnosticsClientCapabilities {
  std::optional<bool> relatedInformation;
  std::optional<bool> versionSupport;
};

void to_json(nlohmann::json& j, const PublishDiagnosticsClientCapabilities& c);
void from_json(
    const nlohmann::json& j, PublishDiagnosticsClientCapabilities& c);

struct TextDocumentClientCapabilities {
  std::optional<PublishDiagnosticsClientCapabilities> publishDiagnostics;
};

void to_json(nlohmann::json& j, const TextDocumentClientCapabilities& c);
void from_json(const nlohmann::json& j, TextDocumentClientCapabilities& c);

// General client capabilities
struct GeneralClientCapabilities {
  // Kept as strings so unknown encodings do not fail the whole request
  std::optional<std::vector<std::string>> positionEncodings;
};

void to_json(nlohmann::json& j, const GeneralClientCapabilities& c);
void from_json(const nlohmann::json& j, GeneralClientCapabilities& c);

struct ClientCapabilities {
  std::optional<WorkspaceClientCapabilities> workspace;
  std::optional<TextDocumentClientCapabilities> textDocument;
  std::optional<GeneralClientCapabilities> general;
};

void to_json(nlohmann::json& j, const ClientCapabilities& c);
void from_json(const nlohmann::json& j, ClientCapabilities& c);

}  // namespace lsp

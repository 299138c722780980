#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Configuration Request
struct ConfigurationItem {
  std::optional<DocumentUri> scopeUri;
  std::optional<std::string> section;
};

void to_json(nlohmann::json& j, const ConfigurationItem& p);
void from_json(const nlohmann::json& j, ConfigurationItem& p);

struct ConfigurationParams {
  std::vector<ConfigurationItem> items;
};

void to_json(nlohmann::json& j, const ConfigurationParams& p);
void from_json(const nlohmann::json& j, ConfigurationParams& p);

// One entry per requested item, null when the client has no value
using ConfigurationResult = std::vector<nlohmann::json>;

// DidChangeConfiguration Notification
struct DidChangeConfigurationParams {
  nlohmann::json settings;
};

void to_json(nlohmann::json& j, const DidChangeConfigurationParams& p);
void from_json(const nlohmann::json& j, DidChangeConfigurationParams& p);

// DidChangeWorkspaceFolders Notification
struct WorkspaceFoldersChangeEvent {
  std::vector<WorkspaceFolder> added;
  std::vector<WorkspaceFolder> removed;
};

void to_json(nlohmann::json& j, const WorkspaceFoldersChangeEvent& p);
void from_json(const nlohmann::json& j, WorkspaceFoldersChangeEvent& p);

struct DidChangeWorkspaceFoldersParams {
  WorkspaceFoldersChangeEvent event;
};

void to_json(nlohmann::json& j, const DidChangeWorkspaceFoldersParams& p);
void from_json(const nlohmann::json& j, DidChangeWorkspaceFoldersParams& p);

}  // namespace lsp

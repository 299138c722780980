#include "lsp/workspace.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Configuration Request
void to_json(nlohmann::json& j, const ConfigurationItem& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "scopeUri", p.scopeUri);
  to_json_optional(j, "section", p.section);
}

void from_json(const nlohmann::json& j, ConfigurationItem& p) {
  from_json_optional(j, "scopeUri", p.scopeUri);
  from_json_optional(j, "section", p.section);
}

void to_json(nlohmann::json& j, const ConfigurationParams& p) {
  to_json_required(j, "items", p.items);
}

void from_json(const nlohmann::json& j, ConfigurationParams& p) {
  from_json_required(j, "items", p.items);
}

// DidChangeConfiguration Notification
void to_json(nlohmann::json& j, const DidChangeConfigurationParams& p) {
  to_json_required(j, "settings", p.settings);
}

void from_json(const nlohmann::json& j, DidChangeConfigurationParams& p) {
  if (j.contains("settings")) {
    p.settings = j.at("settings");
  } else {
    p.settings = nullptr;
  }
}

// DidChangeWorkspaceFolders Notification
void to_json(nlohmann::json& j, const WorkspaceFoldersChangeEvent& p) {
  to_json_required(j, "added", p.added);
  to_json_required(j, "removed", p.removed);
}

void from_json(const nlohmann::json& j, WorkspaceFoldersChangeEvent& p) {
  from_json_required(j, "added", p.added);
  from_json_required(j, "removed", p.removed);
}

void to_json(nlohmann::json& j, const DidChangeWorkspaceFoldersParams& p) {
  to_json_required(j, "event", p.event);
}

void from_json(const nlohmann::json& j, DidChangeWorkspaceFoldersParams& p) {
  from_json_required(j, "event", p.event);
}

}  // namespace lsp

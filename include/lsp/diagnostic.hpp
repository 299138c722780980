#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// PublishDiagnostics Notification
struct PublishDiagnosticsParams {
  DocumentUri uri;
  std::optional<int> version;
  std::vector<Diagnostic> diagnostics;
};

void to_json(nlohmann::json& j, const PublishDiagnosticsParams& p);
void from_json(const nlohmann::json& j, PublishDiagnosticsParams& p);

}  // namespace lsp

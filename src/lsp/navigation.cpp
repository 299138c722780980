#include "lsp/navigation.hpp"

#include <nlohmann/json.hpp>

#include "lsp/json_utils.hpp"

namespace lsp {

// Goto Definition Request
void to_json(nlohmann::json& j, const DefinitionParams& p) {
  to_json_required(j, "textDocument", p.textDocument);
  to_json_required(j, "position", p.position);
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, DefinitionParams& p) {
  from_json_required(j, "textDocument", p.textDocument);
  from_json_required(j, "position", p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "partialResultToken", p.partialResultToken);
}

void to_json(nlohmann::json& j, const DefinitionResult& r) {
  if (!r) {
    j = nullptr;
    return;
  }
  std::visit([&j](const auto& value) { j = value; }, *r);
}

void from_json(const nlohmann::json& j, DefinitionResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else if (j.is_array()) {
    r = j.get<std::vector<Location>>();
  } else {
    r = j.get<Location>();
  }
}

}  // namespace lsp

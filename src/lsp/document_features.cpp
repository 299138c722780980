#include "lsp/document_features.hpp"

#include "lsp/json_utils.hpp"

namespace lsp {

// Hover Request
void to_json(nlohmann::json& j, const HoverParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, HoverParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("position").get_to(p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

void to_json(nlohmann::json& j, const HoverContents& c) {
  std::visit([&j](const auto& arg) { j = arg; }, c);
}

void from_json(const nlohmann::json& j, HoverContents& c) {
  if (j.is_string()) {
    c = j.get<std::string>();
  } else {
    c = j.get<MarkupContent>();
  }
}

void to_json(nlohmann::json& j, const Hover& h) {
  j = nlohmann::json{{"contents", h.contents}};
  to_json_optional(j, "range", h.range);
}

void from_json(const nlohmann::json& j, Hover& h) {
  j.at("contents").get_to(h.contents);
  from_json_optional(j, "range", h.range);
}

void to_json(nlohmann::json& j, const HoverResult& r) {
  if (r.has_value()) {
    j = r.value();
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, HoverResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<Hover>();
  }
}

// Completion Request
void to_json(nlohmann::json& j, const CompletionContext& c) {
  j = nlohmann::json{{"triggerKind", static_cast<int>(c.triggerKind)}};
  to_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void from_json(const nlohmann::json& j, CompletionContext& c) {
  c.triggerKind = static_cast<CompletionTriggerKind>(
      j.at("triggerKind").get<int>());
  from_json_optional(j, "triggerCharacter", c.triggerCharacter);
}

void to_json(nlohmann::json& j, const CompletionParams& p) {
  j = nlohmann::json{
      {"textDocument", p.textDocument}, {"position", p.position}};
  to_json_optional(j, "workDoneToken", p.workDoneToken);
  to_json_optional(j, "partialResultToken", p.partialResultToken);
  to_json_optional(j, "context", p.context);
}

void from_json(const nlohmann::json& j, CompletionParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("position").get_to(p.position);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
  from_json_optional(j, "partialResultToken", p.partialResultToken);
  from_json_optional(j, "context", p.context);
}

void to_json(nlohmann::json& j, const CompletionItemKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, CompletionItemKind& k) {
  k = static_cast<CompletionItemKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const CompletionItem& c) {
  j = nlohmann::json{{"label", c.label}};
  to_json_optional(j, "kind", c.kind);
  to_json_optional(j, "detail", c.detail);
  to_json_optional(j, "documentation", c.documentation);
  to_json_optional(j, "sortText", c.sortText);
  to_json_optional(j, "insertText", c.insertText);
}

void from_json(const nlohmann::json& j, CompletionItem& c) {
  j.at("label").get_to(c.label);
  from_json_optional(j, "kind", c.kind);
  from_json_optional(j, "detail", c.detail);
  from_json_optional(j, "documentation", c.documentation);
  from_json_optional(j, "sortText", c.sortText);
  from_json_optional(j, "insertText", c.insertText);
}

void to_json(nlohmann::json& j, const CompletionList& c) {
  j = nlohmann::json{{"isIncomplete", c.isIncomplete}, {"items", c.items}};
}

void from_json(const nlohmann::json& j, CompletionList& c) {
  j.at("isIncomplete").get_to(c.isIncomplete);
  j.at("items").get_to(c.items);
}

void to_json(nlohmann::json& j, const CompletionResult& r) {
  if (r.has_value()) {
    j = r.value();
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, CompletionResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else if (j.is_array()) {
    r = CompletionList{
        .isIncomplete = false, .items = j.get<std::vector<CompletionItem>>()};
  } else {
    r = j.get<CompletionList>();
  }
}

// Inlay Hint Request
void to_json(nlohmann::json& j, const InlayHintParams& p) {
  j = nlohmann::json{{"textDocument", p.textDocument}, {"range", p.range}};
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, InlayHintParams& p) {
  j.at("textDocument").get_to(p.textDocument);
  j.at("range").get_to(p.range);
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

void to_json(nlohmann::json& j, const InlayHintKind& k) {
  j = static_cast<int>(k);
}

void from_json(const nlohmann::json& j, InlayHintKind& k) {
  k = static_cast<InlayHintKind>(j.get<int>());
}

void to_json(nlohmann::json& j, const InlayHint& h) {
  j = nlohmann::json{{"position", h.position}, {"label", h.label}};
  to_json_optional(j, "kind", h.kind);
  to_json_optional(j, "tooltip", h.tooltip);
  to_json_optional(j, "paddingLeft", h.paddingLeft);
  to_json_optional(j, "paddingRight", h.paddingRight);
}

void from_json(const nlohmann::json& j, InlayHint& h) {
  j.at("position").get_to(h.position);
  j.at("label").get_to(h.label);
  from_json_optional(j, "kind", h.kind);
  from_json_optional(j, "tooltip", h.tooltip);
  from_json_optional(j, "paddingLeft", h.paddingLeft);
  from_json_optional(j, "paddingRight", h.paddingRight);
}

void to_json(nlohmann::json& j, const InlayHintResult& r) {
  if (r.has_value()) {
    j = r.value();
  } else {
    j = nullptr;
  }
}

void from_json(const nlohmann::json& j, InlayHintResult& r) {
  if (j.is_null()) {
    r = std::nullopt;
  } else {
    r = j.get<std::vector<InlayHint>>();
  }
}

}  // namespace lsp

#include "lsp/basic.hpp"

#include <stdexcept>

#include "lsp/json_utils.hpp"

namespace lsp {

// Cancelation support
void to_json(nlohmann::json& j, const CancelParams& p) {
  std::visit([&j](const auto& id) { j = nlohmann::json{{"id", id}}; }, p.id);
}

void from_json(const nlohmann::json& j, CancelParams& p) {
  const auto& id = j.at("id");
  if (id.is_string()) {
    p.id = id.get<std::string>();
  } else {
    p.id = id.get<int>();
  }
}

// Position
void to_json(nlohmann::json& j, const Position& p) {
  j = nlohmann::json{{"line", p.line}, {"character", p.character}};
}

void from_json(const nlohmann::json& j, Position& p) {
  j.at("line").get_to(p.line);
  j.at("character").get_to(p.character);
}

void to_json(nlohmann::json& j, const PositionEncodingKind& p) {
  switch (p) {
    case PositionEncodingKind::kUtf8:
      j = "utf-8";
      break;
    case PositionEncodingKind::kUtf16:
      j = "utf-16";
      break;
    case PositionEncodingKind::kUtf32:
      j = "utf-32";
      break;
    default:
      throw std::runtime_error("Invalid position encoding kind");
  }
}

void from_json(const nlohmann::json& j, PositionEncodingKind& p) {
  std::string s = j.get<std::string>();
  if (s == "utf-8") {
    p = PositionEncodingKind::kUtf8;
  } else if (s == "utf-16") {
    p = PositionEncodingKind::kUtf16;
  } else if (s == "utf-32") {
    p = PositionEncodingKind::kUtf32;
  } else {
    throw std::runtime_error("Invalid position encoding kind");
  }
}

// Range
void to_json(nlohmann::json& j, const Range& r) {
  j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, Range& r) {
  j.at("start").get_to(r.start);
  j.at("end").get_to(r.end);
}

// Text Document Item
void to_json(nlohmann::json& j, const TextDocumentItem& t) {
  j = nlohmann::json{
      {"uri", t.uri},
      {"languageId", t.languageId},
      {"version", t.version},
      {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextDocumentItem& t) {
  j.at("uri").get_to(t.uri);
  j.at("languageId").get_to(t.languageId);
  j.at("version").get_to(t.version);
  j.at("text").get_to(t.text);
}

// Text Document Identifier
void to_json(nlohmann::json& j, const TextDocumentIdentifier& t) {
  j = nlohmann::json{{"uri", t.uri}};
}

void from_json(const nlohmann::json& j, TextDocumentIdentifier& t) {
  j.at("uri").get_to(t.uri);
}

void to_json(nlohmann::json& j, const VersionedTextDocumentIdentifier& v) {
  j = nlohmann::json{{"uri", v.uri}, {"version", v.version}};
}

void from_json(const nlohmann::json& j, VersionedTextDocumentIdentifier& v) {
  j.at("uri").get_to(v.uri);
  j.at("version").get_to(v.version);
}

// Text Document Position Params
void to_json(nlohmann::json& j, const TextDocumentPositionParams& t) {
  j = nlohmann::json{
      {"textDocument", t.textDocument}, {"position", t.position}};
}

void from_json(const nlohmann::json& j, TextDocumentPositionParams& t) {
  j.at("textDocument").get_to(t.textDocument);
  j.at("position").get_to(t.position);
}

// Location
void to_json(nlohmann::json& j, const Location& l) {
  j = nlohmann::json{{"uri", l.uri}, {"range", l.range}};
}

void from_json(const nlohmann::json& j, Location& l) {
  j.at("uri").get_to(l.uri);
  j.at("range").get_to(l.range);
}

// Diagnostic
void to_json(nlohmann::json& j, const DiagnosticSeverity& d) {
  j = static_cast<int>(d);
}

void from_json(const nlohmann::json& j, DiagnosticSeverity& d) {
  d = static_cast<DiagnosticSeverity>(j.get<int>());
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
  j = nlohmann::json{};
  j["range"] = d.range;
  to_json_optional(j, "severity", d.severity);
  to_json_optional(j, "code", d.code);
  to_json_optional(j, "source", d.source);
  j["message"] = d.message;
}

void from_json(const nlohmann::json& j, Diagnostic& d) {
  j.at("range").get_to(d.range);
  from_json_optional(j, "severity", d.severity);
  from_json_optional(j, "code", d.code);
  from_json_optional(j, "source", d.source);
  j.at("message").get_to(d.message);
}

// Markup Content
void to_json(nlohmann::json& j, const MarkupKind& m) {
  switch (m) {
    case MarkupKind::kPlainText:
      j = "plaintext";
      break;
    case MarkupKind::kMarkdown:
      j = "markdown";
      break;
    default:
      throw std::runtime_error("Invalid markup kind");
  }
}

void from_json(const nlohmann::json& j, MarkupKind& m) {
  std::string s = j.get<std::string>();
  if (s == "plaintext") {
    m = MarkupKind::kPlainText;
  } else if (s == "markdown") {
    m = MarkupKind::kMarkdown;
  } else {
    throw std::runtime_error("Invalid markup kind");
  }
}

void to_json(nlohmann::json& j, const MarkupContent& m) {
  j = nlohmann::json{{"kind", m.kind}, {"value", m.value}};
}

void from_json(const nlohmann::json& j, MarkupContent& m) {
  j.at("kind").get_to(m.kind);
  j.at("value").get_to(m.value);
}

// Work Done Progress
void to_json(nlohmann::json& j, const WorkDoneProgressParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "workDoneToken", p.workDoneToken);
}

void from_json(const nlohmann::json& j, WorkDoneProgressParams& p) {
  from_json_optional(j, "workDoneToken", p.workDoneToken);
}

void to_json(nlohmann::json& j, const PartialResultParams& p) {
  j = nlohmann::json::object();
  to_json_optional(j, "partialResultToken", p.partialResultToken);
}

void from_json(const nlohmann::json& j, PartialResultParams& p) {
  from_json_optional(j, "partialResultToken", p.partialResultToken);
}

// Trace Value
void to_json(nlohmann::json& j, const TraceValue& t) {
  switch (t) {
    case TraceValue::kOff:
      j = "off";
      break;
    case TraceValue::kMessages:
      j = "messages";
      break;
    case TraceValue::kVerbose:
      j = "verbose";
      break;
    default:
      throw std::runtime_error("Invalid trace value");
  }
}

void from_json(const nlohmann::json& j, TraceValue& t) {
  std::string s = j.get<std::string>();
  if (s == "off") {
    t = TraceValue::kOff;
  } else if (s == "messages") {
    t = TraceValue::kMessages;
  } else if (s == "verbose") {
    t = TraceValue::kVerbose;
  } else {
    throw std::runtime_error("Invalid trace value");
  }
}

// Workspace Folder
void to_json(nlohmann::json& j, const WorkspaceFolder& w) {
  j = nlohmann::json{{"uri", w.uri}, {"name", w.name}};
}

void from_json(const nlohmann::json& j, WorkspaceFolder& w) {
  j.at("uri").get_to(w.uri);
  j.at("name").get_to(w.name);
}

}  // namespace lsp

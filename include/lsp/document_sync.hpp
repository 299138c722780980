#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// DidOpenTextDocument Notification
struct DidOpenTextDocumentParams {
  TextDocumentItem textDocument;
};

void to_json(nlohmann::json& j, const DidOpenTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidOpenTextDocumentParams& p);

// DidChangeTextDocument Notification
// The deprecated rangeLength is not read; the range alone locates the edit
struct TextDocumentContentPartialChangeEvent {
  Range range;
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentContentPartialChangeEvent& e);
void from_json(
    const nlohmann::json& j, TextDocumentContentPartialChangeEvent& e);

struct TextDocumentContentFullChangeEvent {
  std::string text;
};

void to_json(nlohmann::json& j, const TextDocumentContentFullChangeEvent& e);
void from_json(const nlohmann::json& j, TextDocumentContentFullChangeEvent& e);

using TextDocumentContentChangeEvent = std::variant<
    TextDocumentContentPartialChangeEvent, TextDocumentContentFullChangeEvent>;

void to_json(nlohmann::json& j, const TextDocumentContentChangeEvent& e);
void from_json(const nlohmann::json& j, TextDocumentContentChangeEvent& e);

struct DidChangeTextDocumentParams {
  VersionedTextDocumentIdentifier textDocument;
  std::vector<TextDocumentContentChangeEvent> contentChanges;
};

void to_json(nlohmann::json& j, const DidChangeTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidChangeTextDocumentParams& p);

// DidCloseTextDocument Notification
struct DidCloseTextDocumentParams {
  TextDocumentIdentifier textDocument;
};

void to_json(nlohmann::json& j, const DidCloseTextDocumentParams& p);
void from_json(const nlohmann::json& j, DidCloseTextDocumentParams& p);

}  // namespace lsp

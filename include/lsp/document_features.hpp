#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsp/basic.hpp"

namespace lsp {

// Hover Request
struct HoverParams : TextDocumentPositionParams, WorkDoneProgressParams {};

void to_json(nlohmann::json& j, const HoverParams& p);
void from_json(const nlohmann::json& j, HoverParams& p);

// A plain string is a MarkedString; clients render it as-is
using HoverContents = std::variant<std::string, MarkupContent>;

void to_json(nlohmann::json& j, const HoverContents& c);
void from_json(const nlohmann::json& j, HoverContents& c);

struct Hover {
  HoverContents contents;
  std::optional<Range> range;
};

void to_json(nlohmann::json& j, const Hover& h);
void from_json(const nlohmann::json& j, Hover& h);

using HoverResult = std::optional<Hover>;

void to_json(nlohmann::json& j, const HoverResult& r);
void from_json(const nlohmann::json& j, HoverResult& r);

// Completion Request
enum class CompletionTriggerKind {
  kInvoked = 1,
  kTriggerCharacter = 2,
  kTriggerForIncompleteCompletions = 3
};

struct CompletionContext {
  CompletionTriggerKind triggerKind;
  std::optional<std::string> triggerCharacter;
};

void to_json(nlohmann::json& j, const CompletionContext& c);
void from_json(const nlohmann::json& j, CompletionContext& c);

struct CompletionParams : TextDocumentPositionParams,
                          WorkDoneProgressParams,
                          PartialResultParams {
  std::optional<CompletionContext> context;
};

void to_json(nlohmann::json& j, const CompletionParams& p);
void from_json(const nlohmann::json& j, CompletionParams& p);

enum class CompletionItemKind {
  kText = 1,
  kMethod,
  kFunction,
  kConstructor,
  kField,
  kVariable,
  kClass,
  kInterface,
  kModule,
  kProperty,
  kUnit,
  kValue,
  kEnum,
  kKeyword,
  kSnippet,
  kColor,
  kFile,
  kReference,
  kFolder,
  kEnumMember,
  kConstant,
  kStruct,
  kEvent,
  kOperator,
  kTypeParameter,
};

void to_json(nlohmann::json& j, const CompletionItemKind& k);
void from_json(const nlohmann::json& j, CompletionItemKind& k);

struct CompletionItem {
  std::string label;
  std::optional<CompletionItemKind> kind;
  std::optional<std::string> detail;
  std::optional<MarkupContent> documentation;
  std::optional<std::string> sortText;
  std::optional<std::string> insertText;
};

void to_json(nlohmann::json& j, const CompletionItem& c);
void from_json(const nlohmann::json& j, CompletionItem& c);

struct CompletionList {
  bool isIncomplete = false;
  std::vector<CompletionItem> items;
};

void to_json(nlohmann::json& j, const CompletionList& c);
void from_json(const nlohmann::json& j, CompletionList& c);

// A CompletionList is always returned so clients re-query after edits
using CompletionResult = std::optional<CompletionList>;

void to_json(nlohmann::json& j, const CompletionResult& r);
void from_json(const nlohmann::json& j, CompletionResult& r);

// Inlay Hint Request
struct InlayHintParams : WorkDoneProgressParams {
  TextDocumentIdentifier textDocument;
  Range range{};
};

void to_json(nlohmann::json& j, const InlayHintParams& p);
void from_json(const nlohmann::json& j, InlayHintParams& p);

enum class InlayHintKind { kType = 1, kParameter = 2 };

void to_json(nlohmann::json& j, const InlayHintKind& k);
void from_json(const nlohmann::json& j, InlayHintKind& k);

struct InlayHint {
  Position position;
  std::string label;
  std::optional<InlayHintKind> kind;
  std::optional<std::string> tooltip;
  std::optional<bool> paddingLeft;
  std::optional<bool> paddingRight;
};

void to_json(nlohmann::json& j, const InlayHint& h);
void from_json(const nlohmann::json& j, InlayHint& h);

using InlayHintResult = std::optional<std::vector<InlayHint>>;

void to_json(nlohmann::json& j, const InlayHintResult& r);
void from_json(const nlohmann::json& j, InlayHintResult& r);

}  // namespace lsp

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/document_features.hpp>

#include "lspshim/document/position_codec.hpp"
#include "lspshim/document/text_document.hpp"

namespace lspshim::parser {

// Per-line outcome of decoding backend output
template <typename T>
struct Parsed {
  T value;
};

// A line that carries no data (blank lines)
struct Skipped {
  std::string raw_line;
};

// A line that could not be decoded; the rest of the output still is
struct Malformed {
  std::string raw_line;
  std::string reason;
};

template <typename T>
using LineResult = std::variant<Parsed<T>, Skipped, Malformed>;

template <typename T>
struct ParseOutcome {
  std::vector<T> items;
  std::vector<Skipped> skipped;
  std::vector<Malformed> malformed;
};

// Hover: the whole output, trailing whitespace trimmed, as plain text
auto ParseHover(std::string_view output) -> lsp::HoverResult;

// Completion: one candidate per line, `label[\tkind[\tdetail]]`
auto ParseCompletionLine(std::string_view line)
    -> LineResult<lsp::CompletionItem>;
auto ParseCompletion(std::string_view output)
    -> ParseOutcome<lsp::CompletionItem>;

// `function`, `Variable`, `3`, ... as an LSP completion item kind
auto ParseCompletionItemKind(std::string_view text)
    -> std::optional<lsp::CompletionItemKind>;

// Definition: `path:line:col[:endLine:endCol]` in line-column mode,
// `path:offset[:endOffset]` in offset mode. Numbers are taken from the right
// so paths may contain ':'.
struct RawDefinition {
  std::string path;
  BackendPoint start;
  std::optional<BackendPoint> end;
};

auto ParseDefinitionLine(std::string_view line, PositionMode mode)
    -> LineResult<RawDefinition>;

// First definition found in the output
struct DefinitionOutcome {
  std::optional<RawDefinition> definition;
  std::vector<Skipped> skipped;
  std::vector<Malformed> malformed;
};

auto ParseDefinition(std::string_view output, PositionMode mode)
    -> DefinitionOutcome;

// Paths that never name a navigable file
auto IsNavigablePath(std::string_view path) -> bool;

// Check: `<start>[-<end>]: <severity>: <message>` or `<start>: inlay: <label>`
// where a coordinate is `line:col` or a byte offset
struct RawDiagnostic {
  BackendPoint start;
  std::optional<BackendPoint> end;
  lsp::DiagnosticSeverity severity;
  std::string message;
};

struct RawInlayHint {
  BackendPoint position;
  std::string label;
};

using CheckEntry = std::variant<RawDiagnostic, RawInlayHint>;

auto ParseCheckLine(std::string_view line) -> LineResult<CheckEntry>;

struct CheckOutcome {
  std::vector<lsp::Diagnostic> diagnostics;
  std::vector<lsp::InlayHint> inlay_hints;
  std::vector<Skipped> skipped;
  std::vector<Malformed> malformed;
};

// Decode check output and map every coordinate onto `snapshot`
auto ParseCheck(
    std::string_view output, const DocumentSnapshot& snapshot,
    const PositionCodec& codec, std::string_view source) -> CheckOutcome;

// Map a backend range onto `snapshot`; a missing end collapses to the start
auto ToProtocolRange(
    const DocumentSnapshot& snapshot, const PositionCodec& codec,
    const BackendPoint& start, const std::optional<BackendPoint>& end)
    -> lsp::Range;

// Split output into lines, dropping the `\r` of CRLF endings
auto SplitLines(std::string_view output) -> std::vector<std::string_view>;

}  // namespace lspshim::parser

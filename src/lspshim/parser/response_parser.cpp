#include "lspshim/parser/response_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <iterator>
#include <utility>

namespace lspshim::parser {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";
constexpr std::string_view kFieldSeparator = ": ";

auto TrimRight(std::string_view text) -> std::string_view {
  auto end = text.find_last_not_of(kWhitespace);
  return end == std::string_view::npos ? std::string_view{}
                                       : text.substr(0, end + 1);
}

auto Trim(std::string_view text) -> std::string_view {
  auto begin = text.find_first_not_of(kWhitespace);
  if (begin == std::string_view::npos) {
    return {};
  }
  return TrimRight(text.substr(begin));
}

auto Normalize(std::string_view text) -> std::string {
  std::string result;
  result.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '-' || c == '_' || c == ' ') {
      continue;
    }
    result.push_back(static_cast<char>(std::tolower(c)));
  }
  return result;
}

auto ParseNumber(std::string_view text) -> std::optional<int> {
  text = Trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value < 0) {
    return std::nullopt;
  }
  return value;
}

// `line:col` or `offset`
auto ParsePoint(std::string_view text) -> std::optional<BackendPoint> {
  auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    auto offset = ParseNumber(text);
    if (!offset) {
      return std::nullopt;
    }
    return BackendPoint{.first = *offset, .second = std::nullopt};
  }
  auto line = ParseNumber(text.substr(0, colon));
  auto column = ParseNumber(text.substr(colon + 1));
  if (!line || !column) {
    return std::nullopt;
  }
  return BackendPoint{.first = *line, .second = *column};
}

auto ParseSeverity(std::string_view text)
    -> std::optional<lsp::DiagnosticSeverity> {
  auto normalized = Normalize(text);
  if (normalized == "error") {
    return lsp::DiagnosticSeverity::kError;
  }
  if (normalized == "warning") {
    return lsp::DiagnosticSeverity::kWarning;
  }
  if (normalized == "info" || normalized == "information") {
    return lsp::DiagnosticSeverity::kInformation;
  }
  if (normalized == "hint") {
    return lsp::DiagnosticSeverity::kHint;
  }
  return std::nullopt;
}

template <typename T>
auto MalformedLine(std::string_view line, std::string reason)
    -> LineResult<T> {
  return Malformed{.raw_line = std::string(line), .reason = std::move(reason)};
}

}  // namespace

auto SplitLines(std::string_view output) -> std::vector<std::string_view> {
  std::vector<std::string_view> lines;
  while (!output.empty()) {
    auto newline = output.find('\n');
    auto line = output.substr(0, newline);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    if (newline == std::string_view::npos) {
      break;
    }
    output.remove_prefix(newline + 1);
  }
  return lines;
}

auto ParseHover(std::string_view output) -> lsp::HoverResult {
  auto text = TrimRight(output);
  if (text.empty()) {
    return std::nullopt;
  }
  return lsp::Hover{.contents = std::string(text)};
}

auto ParseCompletionItemKind(std::string_view text)
    -> std::optional<lsp::CompletionItemKind> {
  static constexpr std::array<std::string_view, 25> kKindNames = {
      "text",     "method",     "function",  "constructor",  "field",
      "variable", "class",      "interface", "module",       "property",
      "unit",     "value",      "enum",      "keyword",      "snippet",
      "color",    "file",       "reference", "folder",       "enummember",
      "constant", "struct",     "event",     "operator",     "typeparameter",
  };

  if (auto number = ParseNumber(text)) {
    if (*number >= 1 && *number <= static_cast<int>(kKindNames.size())) {
      return static_cast<lsp::CompletionItemKind>(*number);
    }
    return std::nullopt;
  }

  auto normalized = Normalize(text);
  auto it = std::ranges::find(kKindNames, normalized);
  if (it == kKindNames.end()) {
    return std::nullopt;
  }
  return static_cast<lsp::CompletionItemKind>(
      std::distance(kKindNames.begin(), it) + 1);
}

auto ParseCompletionLine(std::string_view line)
    -> LineResult<lsp::CompletionItem> {
  if (Trim(line).empty()) {
    return Skipped{.raw_line = std::string(line)};
  }

  auto first_tab = line.find('\t');
  auto label = TrimRight(line.substr(0, first_tab));
  if (Trim(label).empty()) {
    return MalformedLine<lsp::CompletionItem>(line, "empty label");
  }

  lsp::CompletionItem item{.label = std::string(label)};
  if (first_tab == std::string_view::npos) {
    return Parsed<lsp::CompletionItem>{.value = std::move(item)};
  }

  auto rest = line.substr(first_tab + 1);
  auto second_tab = rest.find('\t');
  auto kind_text = Trim(rest.substr(0, second_tab));
  if (!kind_text.empty()) {
    auto kind = ParseCompletionItemKind(kind_text);
    if (!kind) {
      return MalformedLine<lsp::CompletionItem>(
          line, "unknown completion kind '" + std::string(kind_text) + "'");
    }
    item.kind = *kind;
  }

  if (second_tab != std::string_view::npos) {
    auto detail = Trim(rest.substr(second_tab + 1));
    if (!detail.empty()) {
      item.detail = std::string(detail);
    }
  }

  return Parsed<lsp::CompletionItem>{.value = std::move(item)};
}

auto ParseCompletion(std::string_view output)
    -> ParseOutcome<lsp::CompletionItem> {
  ParseOutcome<lsp::CompletionItem> outcome;
  for (auto line : SplitLines(output)) {
    auto result = ParseCompletionLine(line);
    if (auto* parsed = std::get_if<Parsed<lsp::CompletionItem>>(&result)) {
      outcome.items.push_back(std::move(parsed->value));
    } else if (auto* skipped = std::get_if<Skipped>(&result)) {
      outcome.skipped.push_back(std::move(*skipped));
    } else {
      outcome.malformed.push_back(std::get<Malformed>(std::move(result)));
    }
  }
  return outcome;
}

auto ParseDefinitionLine(std::string_view line, PositionMode mode)
    -> LineResult<RawDefinition> {
  auto trimmed = Trim(line);
  if (trimmed.empty()) {
    return Skipped{.raw_line = std::string(line)};
  }

  const std::size_t max_numbers = (mode == PositionMode::kLineColumn) ? 4 : 2;

  // Peel numeric fields off the right end
  std::vector<int> numbers;
  std::vector<std::size_t> path_ends;
  auto path = trimmed;
  while (numbers.size() < max_numbers) {
    auto colon = path.rfind(':');
    if (colon == std::string_view::npos) {
      break;
    }
    auto number = ParseNumber(path.substr(colon + 1));
    if (!number) {
      break;
    }
    numbers.push_back(*number);
    path_ends.push_back(path.size());
    path = path.substr(0, colon);
  }
  std::ranges::reverse(numbers);

  RawDefinition definition;
  switch (mode) {
    case PositionMode::kLineColumn:
      if (numbers.size() == 3) {
        // The leading number belongs to the path
        path = trimmed.substr(0, path_ends.back());
        numbers.erase(numbers.begin());
      }
      if (numbers.size() < 2) {
        return MalformedLine<RawDefinition>(
            line, "expected path:line:column");
      }
      definition.start =
          BackendPoint{.first = numbers[0], .second = numbers[1]};
      if (numbers.size() == 4) {
        definition.end =
            BackendPoint{.first = numbers[2], .second = numbers[3]};
      }
      break;
    case PositionMode::kOffset:
      if (numbers.empty()) {
        return MalformedLine<RawDefinition>(line, "expected path:offset");
      }
      definition.start = BackendPoint{.first = numbers[0]};
      if (numbers.size() == 2) {
        definition.end = BackendPoint{.first = numbers[1]};
      }
      break;
  }

  definition.path = std::string(path);
  return Parsed<RawDefinition>{.value = std::move(definition)};
}

auto ParseDefinition(std::string_view output, PositionMode mode)
    -> DefinitionOutcome {
  DefinitionOutcome outcome;
  for (auto line : SplitLines(output)) {
    auto result = ParseDefinitionLine(line, mode);
    if (auto* parsed = std::get_if<Parsed<RawDefinition>>(&result)) {
      outcome.definition = std::move(parsed->value);
      break;
    }
    if (auto* skipped = std::get_if<Skipped>(&result)) {
      outcome.skipped.push_back(std::move(*skipped));
    } else {
      outcome.malformed.push_back(std::get<Malformed>(std::move(result)));
    }
  }
  return outcome;
}

auto IsNavigablePath(std::string_view path) -> bool {
  return !path.empty() && path != "__prelude__";
}

auto ParseCheckLine(std::string_view line) -> LineResult<CheckEntry> {
  auto trimmed = Trim(line);
  if (trimmed.empty()) {
    return Skipped{.raw_line = std::string(line)};
  }

  auto first = trimmed.find(kFieldSeparator);
  if (first == std::string_view::npos) {
    return MalformedLine<CheckEntry>(line, "missing location separator");
  }
  auto location = trimmed.substr(0, first);
  auto rest = trimmed.substr(first + kFieldSeparator.size());

  auto second = rest.find(kFieldSeparator);
  if (second == std::string_view::npos) {
    return MalformedLine<CheckEntry>(line, "missing severity separator");
  }
  auto severity_text = Trim(rest.substr(0, second));
  auto message = Trim(rest.substr(second + kFieldSeparator.size()));
  if (message.empty()) {
    return MalformedLine<CheckEntry>(line, "empty message");
  }

  auto dash = location.find('-');
  auto start = ParsePoint(location.substr(0, dash));
  if (!start) {
    return MalformedLine<CheckEntry>(
        line, "bad location '" + std::string(location) + "'");
  }
  std::optional<BackendPoint> end;
  if (dash != std::string_view::npos) {
    end = ParsePoint(location.substr(dash + 1));
    if (!end) {
      return MalformedLine<CheckEntry>(
          line, "bad location '" + std::string(location) + "'");
    }
  }

  if (Normalize(severity_text) == "inlay") {
    return Parsed<CheckEntry>{
        .value =
            RawInlayHint{.position = *start, .label = std::string(message)}};
  }

  auto severity = ParseSeverity(severity_text);
  if (!severity) {
    return MalformedLine<CheckEntry>(
        line, "unknown severity '" + std::string(severity_text) + "'");
  }

  return Parsed<CheckEntry>{
      .value = RawDiagnostic{
          .start = *start,
          .end = end,
          .severity = *severity,
          .message = std::string(message)}};
}

auto ToProtocolRange(
    const DocumentSnapshot& snapshot, const PositionCodec& codec,
    const BackendPoint& start, const std::optional<BackendPoint>& end)
    -> lsp::Range {
  auto start_position = codec.FromPoint(snapshot, start);
  auto end_position =
      end.has_value() ? codec.FromPoint(snapshot, *end) : start_position;
  if (end_position < start_position) {
    std::swap(start_position, end_position);
  }
  return lsp::Range{.start = start_position, .end = end_position};
}

auto ParseCheck(
    std::string_view output, const DocumentSnapshot& snapshot,
    const PositionCodec& codec, std::string_view source) -> CheckOutcome {
  CheckOutcome outcome;
  for (auto line : SplitLines(output)) {
    auto result = ParseCheckLine(line);
    if (auto* skipped = std::get_if<Skipped>(&result)) {
      outcome.skipped.push_back(std::move(*skipped));
      continue;
    }
    if (auto* malformed = std::get_if<Malformed>(&result)) {
      outcome.malformed.push_back(std::move(*malformed));
      continue;
    }

    auto& entry = std::get<Parsed<CheckEntry>>(result).value;
    if (auto* diagnostic = std::get_if<RawDiagnostic>(&entry)) {
      outcome.diagnostics.push_back(lsp::Diagnostic{
          .range = ToProtocolRange(
              snapshot, codec, diagnostic->start, diagnostic->end),
          .severity = diagnostic->severity,
          .source = std::string(source),
          .message = std::move(diagnostic->message),
      });
    } else {
      auto& hint = std::get<RawInlayHint>(entry);
      outcome.inlay_hints.push_back(lsp::InlayHint{
          .position = codec.FromPoint(snapshot, hint.position),
          .label = std::move(hint.label),
          .kind = lsp::InlayHintKind::kType,
      });
    }
  }
  return outcome;
}

}  // namespace lspshim::parser

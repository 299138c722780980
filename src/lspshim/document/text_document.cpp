#include "lspshim/document/text_document.hpp"

#include <algorithm>
#include <variant>

#include <fmt/format.h>

#include "lspshim/utils/utf8.hpp"

namespace lspshim {

DocumentSnapshot::DocumentSnapshot(
    std::string uri, std::string text, int version, std::string language_id,
    std::uint64_t session)
    : uri_(std::move(uri)),
      text_(std::move(text)),
      version_(version),
      language_id_(std::move(language_id)),
      session_(session),
      line_starts_(ComputeLineStarts(text_)) {
}

auto DocumentSnapshot::LineStart(int line) const -> std::size_t {
  line = std::clamp(line, 0, LineCount() - 1);
  return line_starts_[static_cast<std::size_t>(line)];
}

auto DocumentSnapshot::LineText(int line) const -> std::string_view {
  if (line < 0 || line >= LineCount()) {
    return {};
  }
  auto start = line_starts_[static_cast<std::size_t>(line)];
  auto end = (line + 1 < LineCount())
                 ? line_starts_[static_cast<std::size_t>(line) + 1] - 1
                 : text_.size();
  if (end > start && text_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(text_).substr(start, end - start);
}

auto DocumentSnapshot::LineOfOffset(std::size_t offset) const -> int {
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  return static_cast<int>(std::distance(line_starts_.begin(), it)) - 1;
}

auto MakeSnapshot(
    std::string uri, std::string text, int version, std::string language_id,
    std::uint64_t session) -> SnapshotPtr {
  return std::make_shared<const DocumentSnapshot>(
      std::move(uri), std::move(text), version, std::move(language_id),
      session);
}

auto ComputeLineStarts(std::string_view text) -> std::vector<std::size_t> {
  std::vector<std::size_t> starts{0};
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\n') {
      starts.push_back(i + 1);
    }
  }
  return starts;
}

auto ResolveOffset(std::string_view text, const lsp::Position& position)
    -> std::expected<std::size_t, ShimError> {
  if (position.line < 0 || position.character < 0) {
    return ShimError::Unexpected(
        ShimErrorCode::kInvalidRange,
        fmt::format(
            "negative position {}:{}", position.line, position.character));
  }

  auto starts = ComputeLineStarts(text);
  if (static_cast<std::size_t>(position.line) >= starts.size()) {
    return text.size();
  }

  auto line = static_cast<std::size_t>(position.line);
  auto start = starts[line];
  auto end = (line + 1 < starts.size()) ? starts[line + 1] - 1 : text.size();
  if (end > start && text[end - 1] == '\r') {
    --end;
  }
  auto line_text = text.substr(start, end - start);

  auto line_units = utils::BytesToUtf16Units(line_text, line_text.size());
  auto character = std::min(position.character, line_units);
  return start + utils::Utf16UnitsToBytes(line_text, character);
}

auto ApplyContentChanges(
    std::string text,
    const std::vector<lsp::TextDocumentContentChangeEvent>& changes)
    -> std::expected<std::string, ShimError> {
  for (const auto& change : changes) {
    if (const auto* full =
            std::get_if<lsp::TextDocumentContentFullChangeEvent>(&change)) {
      text = full->text;
      continue;
    }

    const auto& partial =
        std::get<lsp::TextDocumentContentPartialChangeEvent>(change);
    if (partial.range.end < partial.range.start) {
      return ShimError::Unexpected(
          ShimErrorCode::kInvalidRange, "range end precedes range start");
    }

    auto start = ResolveOffset(text, partial.range.start);
    if (!start) {
      return std::unexpected(start.error());
    }
    auto end = ResolveOffset(text, partial.range.end);
    if (!end) {
      return std::unexpected(end.error());
    }

    text.replace(*start, *end - *start, partial.text);
  }
  return text;
}

}  // namespace lspshim

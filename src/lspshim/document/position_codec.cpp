#include "lspshim/document/position_codec.hpp"

#include <algorithm>

#include "lspshim/utils/utf8.hpp"

namespace lspshim {

PositionCodec::PositionCodec(BackendConvention convention, PositionMode mode)
    : convention_(convention), mode_(mode) {
}

auto PositionCodec::Locate(
    const DocumentSnapshot& snapshot, const lsp::Position& position) const
    -> std::pair<int, std::size_t> {
  auto line = std::clamp(position.line, 0, snapshot.LineCount() - 1);
  auto line_text = snapshot.LineText(line);
  if (position.line >= snapshot.LineCount()) {
    // Past the last line resolves to the end of the document
    return {line, line_text.size()};
  }
  auto character = std::max(position.character, 0);
  return {line, utils::Utf16UnitsToBytes(line_text, character)};
}

auto PositionCodec::ToBackend(
    const DocumentSnapshot& snapshot, const lsp::Position& position) const
    -> BackendPosition {
  auto [line, byte] = Locate(snapshot, position);

  int column = 0;
  switch (convention_.column_unit) {
    case ColumnUnit::kBytes:
      column = static_cast<int>(byte);
      break;
    case ColumnUnit::kCodepoints:
      column = utils::BytesToCodepoints(snapshot.LineText(line), byte);
      break;
  }

  return BackendPosition{
      .line = line + convention_.line_base,
      .column = column + convention_.column_base,
  };
}

auto PositionCodec::FromBackend(
    const DocumentSnapshot& snapshot, const BackendPosition& position) const
    -> lsp::Position {
  auto line = std::clamp(
      position.line - convention_.line_base, 0, snapshot.LineCount() - 1);
  auto line_text = snapshot.LineText(line);
  auto column = std::max(position.column - convention_.column_base, 0);

  std::size_t byte = 0;
  switch (convention_.column_unit) {
    case ColumnUnit::kBytes:
      byte = utils::FloorToCharBoundary(
          line_text, static_cast<std::size_t>(column));
      break;
    case ColumnUnit::kCodepoints:
      byte = utils::CodepointsToBytes(line_text, column);
      break;
  }

  return lsp::Position{
      .line = line,
      .character = utils::BytesToUtf16Units(line_text, byte),
  };
}

auto PositionCodec::ToOffset(
    const DocumentSnapshot& snapshot, const lsp::Position& position) const
    -> std::size_t {
  auto [line, byte] = Locate(snapshot, position);
  return snapshot.LineStart(line) + byte;
}

auto PositionCodec::FromOffset(
    const DocumentSnapshot& snapshot, std::size_t offset) const
    -> lsp::Position {
  offset = std::min(offset, snapshot.Text().size());
  auto line = snapshot.LineOfOffset(offset);
  auto line_text = snapshot.LineText(line);
  // Offsets inside the line terminator clamp to the end of the line text
  auto byte = utils::FloorToCharBoundary(
      line_text, std::min(offset - snapshot.LineStart(line), line_text.size()));
  return lsp::Position{
      .line = line,
      .character = utils::BytesToUtf16Units(line_text, byte),
  };
}

auto PositionCodec::FromPoint(
    const DocumentSnapshot& snapshot, const BackendPoint& point) const
    -> lsp::Position {
  if (point.second.has_value()) {
    return FromBackend(
        snapshot,
        BackendPosition{.line = point.first, .column = *point.second});
  }
  return FromOffset(
      snapshot, static_cast<std::size_t>(std::max(point.first, 0)));
}

}  // namespace lspshim

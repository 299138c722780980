#pragma once

#include <cstddef>
#include <optional>
#include <utility>

#include <lsp/basic.hpp>

#include "lspshim/document/text_document.hpp"

namespace lspshim {

enum class ColumnUnit {
  kBytes,       // UTF-8 bytes
  kCodepoints,  // Unicode scalar values
};

// How the backend addresses a location in the document
enum class PositionMode {
  kLineColumn,
  kOffset,
};

// Numbering convention of the backend for line/column positions
struct BackendConvention {
  int line_base = 1;
  int column_base = 0;
  ColumnUnit column_unit = ColumnUnit::kBytes;
};

struct BackendPosition {
  int line;
  int column;

  auto operator==(const BackendPosition&) const -> bool = default;
};

// A coordinate as printed by the backend: `line:column` when both parts are
// present, a byte offset otherwise
struct BackendPoint {
  int first;
  std::optional<int> second;
};

// Converts between protocol positions (UTF-16 code units, 0-based) and the
// backend's coordinates. Conversions need the line text, so every call takes
// the snapshot the coordinate belongs to.
class PositionCodec {
 public:
  explicit PositionCodec(
      BackendConvention convention = {},
      PositionMode mode = PositionMode::kLineColumn);

  [[nodiscard]] auto Convention() const -> const BackendConvention& {
    return convention_;
  }

  [[nodiscard]] auto Mode() const -> PositionMode {
    return mode_;
  }

  // Protocol columns past the end of a line, or inside a surrogate pair,
  // are clamped to the nearest character boundary before conversion
  [[nodiscard]] auto ToBackend(
      const DocumentSnapshot& snapshot, const lsp::Position& position) const
      -> BackendPosition;

  [[nodiscard]] auto FromBackend(
      const DocumentSnapshot& snapshot, const BackendPosition& position) const
      -> lsp::Position;

  // Absolute UTF-8 byte offset of a protocol position
  [[nodiscard]] auto ToOffset(
      const DocumentSnapshot& snapshot, const lsp::Position& position) const
      -> std::size_t;

  [[nodiscard]] auto FromOffset(
      const DocumentSnapshot& snapshot, std::size_t offset) const
      -> lsp::Position;

  // Map a coordinate parsed from backend output
  [[nodiscard]] auto FromPoint(
      const DocumentSnapshot& snapshot, const BackendPoint& point) const
      -> lsp::Position;

 private:
  // Clamp the position and resolve it to (line, byte-in-line)
  [[nodiscard]] auto Locate(
      const DocumentSnapshot& snapshot, const lsp::Position& position) const
      -> std::pair<int, std::size_t>;

  BackendConvention convention_;
  PositionMode mode_;
};

}  // namespace lspshim

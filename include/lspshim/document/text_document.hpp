#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <lsp/basic.hpp>
#include <lsp/document_sync.hpp>

#include "lspshim/error/error.hpp"

namespace lspshim {

// Immutable copy of an open document, shared between the store and every
// request admitted against this version
class DocumentSnapshot {
 public:
  DocumentSnapshot(
      std::string uri, std::string text, int version,
      std::string language_id = "", std::uint64_t session = 0);

  [[nodiscard]] auto Uri() const -> const std::string& {
    return uri_;
  }

  [[nodiscard]] auto Text() const -> const std::string& {
    return text_;
  }

  [[nodiscard]] auto Version() const -> int {
    return version_;
  }

  [[nodiscard]] auto LanguageId() const -> const std::string& {
    return language_id_;
  }

  // Identifies the open/close cycle the snapshot belongs to; every didOpen
  // starts a new session and changes keep it
  [[nodiscard]] auto Session() const -> std::uint64_t {
    return session_;
  }

  // Number of lines; an empty document and a trailing newline both count
  // the final (empty) line
  [[nodiscard]] auto LineCount() const -> int {
    return static_cast<int>(line_starts_.size());
  }

  // Byte offset of the first character of `line`
  [[nodiscard]] auto LineStart(int line) const -> std::size_t;

  // Text of `line` without its terminator (`\n` or `\r\n`)
  [[nodiscard]] auto LineText(int line) const -> std::string_view;

  // Line containing the byte offset (offsets past the end map to the last)
  [[nodiscard]] auto LineOfOffset(std::size_t offset) const -> int;

 private:
  std::string uri_;
  std::string text_;
  int version_;
  std::string language_id_;
  std::uint64_t session_;
  std::vector<std::size_t> line_starts_;
};

using SnapshotPtr = std::shared_ptr<const DocumentSnapshot>;

auto MakeSnapshot(
    std::string uri, std::string text, int version,
    std::string language_id = "", std::uint64_t session = 0) -> SnapshotPtr;

// Byte offsets of the start of every line in `text`
auto ComputeLineStarts(std::string_view text) -> std::vector<std::size_t>;

// Resolve a protocol (UTF-16) position to a byte offset in `text`. A character
// past the end of its line resolves to the line end, and a line past the last
// one resolves to the end of the text. Fails with kInvalidRange only for
// negative positions.
auto ResolveOffset(std::string_view text, const lsp::Position& position)
    -> std::expected<std::size_t, ShimError>;

// Apply an ordered batch of content changes. Each range is resolved against
// the text produced by the preceding changes of the same batch. Nothing is
// returned on failure, so callers keep their original text untouched.
auto ApplyContentChanges(
    std::string text,
    const std::vector<lsp::TextDocumentContentChangeEvent>& changes)
    -> std::expected<std::string, ShimError>;

}  // namespace lspshim

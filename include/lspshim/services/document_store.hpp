#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <lsp/document_sync.hpp>
#include <spdlog/spdlog.h>

#include "lspshim/document/text_document.hpp"
#include "lspshim/error/error.hpp"

namespace lspshim::services {

// Authoritative table of open documents
// Mutations run on a strand in the order they are posted; readers receive
// shared immutable snapshots, so an in-flight request never observes a
// partially applied change batch
class DocumentStore {
 public:
  explicit DocumentStore(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Insert a new document, fails with kAlreadyOpen if the URI is present
  auto Open(
      std::string uri, std::string text, int version, std::string language_id)
      -> asio::awaitable<std::expected<SnapshotPtr, ShimError>>;

  // Apply a batch of changes as one all-or-nothing update
  // The incoming version must be exactly one greater than the current one
  auto ApplyChange(
      std::string uri, int version,
      std::vector<lsp::TextDocumentContentChangeEvent> changes)
      -> asio::awaitable<std::expected<SnapshotPtr, ShimError>>;

  auto Close(std::string uri)
      -> asio::awaitable<std::expected<void, ShimError>>;

  // Current snapshot of the document
  auto Snapshot(std::string uri)
      -> asio::awaitable<std::expected<SnapshotPtr, ShimError>>;

  auto Contains(std::string uri) -> asio::awaitable<bool>;

  // Get all open document URIs
  auto Uris() -> asio::awaitable<std::vector<std::string>>;

 private:
  std::shared_ptr<spdlog::logger> logger_;

  // Strand for thread-safe access
  asio::strand<asio::any_io_executor> strand_;

  // Document storage
  std::unordered_map<std::string, SnapshotPtr> documents_;
  std::uint64_t next_session_ = 1;
};

}  // namespace lspshim::services

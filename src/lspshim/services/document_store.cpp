#include "lspshim/services/document_store.hpp"

#include <fmt/format.h>

namespace lspshim::services {

DocumentStore::DocumentStore(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      strand_(asio::make_strand(executor)) {
}

auto DocumentStore::Open(
    std::string uri, std::string text, int version, std::string language_id)
    -> asio::awaitable<std::expected<SnapshotPtr, ShimError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (documents_.contains(uri)) {
    co_return ShimError::Unexpected(ShimErrorCode::kAlreadyOpen, uri);
  }

  auto snapshot = MakeSnapshot(
      uri, std::move(text), version, std::move(language_id), next_session_++);
  documents_.emplace(std::move(uri), snapshot);
  co_return snapshot;
}

auto DocumentStore::ApplyChange(
    std::string uri, int version,
    std::vector<lsp::TextDocumentContentChangeEvent> changes)
    -> asio::awaitable<std::expected<SnapshotPtr, ShimError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    co_return ShimError::Unexpected(ShimErrorCode::kUnknownDocument, uri);
  }

  const auto& current = it->second;
  if (version != current->Version() + 1) {
    co_return ShimError::Unexpected(
        ShimErrorCode::kStaleVersion,
        fmt::format(
            "{} is at version {}, received {}", uri, current->Version(),
            version));
  }

  auto text = ApplyContentChanges(current->Text(), changes);
  if (!text) {
    logger_->debug(
        "DocumentStore rejected change for {}: {}", uri,
        text.error().message());
    co_return std::unexpected(text.error());
  }

  auto snapshot = MakeSnapshot(
      uri, std::move(*text), version, current->LanguageId(),
      current->Session());
  it->second = snapshot;
  co_return snapshot;
}

auto DocumentStore::Close(std::string uri)
    -> asio::awaitable<std::expected<void, ShimError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (documents_.erase(uri) == 0) {
    co_return ShimError::Unexpected(ShimErrorCode::kUnknownDocument, uri);
  }
  co_return std::expected<void, ShimError>{};
}

auto DocumentStore::Snapshot(std::string uri)
    -> asio::awaitable<std::expected<SnapshotPtr, ShimError>> {
  co_await asio::post(strand_, asio::use_awaitable);

  auto it = documents_.find(uri);
  if (it == documents_.end()) {
    co_return ShimError::Unexpected(ShimErrorCode::kUnknownDocument, uri);
  }
  co_return it->second;
}

auto DocumentStore::Contains(std::string uri) -> asio::awaitable<bool> {
  co_await asio::post(strand_, asio::use_awaitable);

  co_return documents_.contains(uri);
}

auto DocumentStore::Uris() -> asio::awaitable<std::vector<std::string>> {
  co_await asio::post(strand_, asio::use_awaitable);

  std::vector<std::string> uris;
  uris.reserve(documents_.size());
  for (const auto& [uri, _] : documents_) {
    uris.push_back(uri);
  }
  co_return uris;
}

}  // namespace lspshim::services

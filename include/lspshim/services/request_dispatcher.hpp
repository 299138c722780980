#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/document_features.hpp>
#include <lsp/error.hpp>
#include <lsp/navigation.hpp>
#include <lsp/window.hpp>
#include <spdlog/spdlog.h>

#include "lspshim/backend/backend_invoker.hpp"
#include "lspshim/core/shim_settings.hpp"
#include "lspshim/document/text_document.hpp"
#include "lspshim/error/error.hpp"
#include "lspshim/parser/response_parser.hpp"
#include "lspshim/services/document_store.hpp"

namespace lspshim::services {

// Serves capability requests by running the backend against a snapshot
//
// Every request takes the document snapshot at admission. Edits that arrive
// while the backend runs never affect the text sent to it, nor the snapshot
// used to map its coordinates back. Requests for the same document run
// concurrently; each is tracked in a per-URI in-flight counter.
class RequestDispatcher {
 public:
  using SettingsProvider =
      std::function<asio::awaitable<ShimSettings>(std::string uri)>;

  // Receives failures worth surfacing to the user
  using MessageSink = std::function<void(lsp::MessageType, std::string)>;

  RequestDispatcher(
      std::shared_ptr<DocumentStore> store,
      std::shared_ptr<backend::BackendInvoker> invoker,
      SettingsProvider settings_provider,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto SetMessageSink(MessageSink sink) -> void {
    message_sink_ = std::move(sink);
  }

  auto Hover(std::string uri, lsp::Position position)
      -> asio::awaitable<std::expected<lsp::HoverResult, lsp::error::LspError>>;

  auto Completion(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<lsp::CompletionResult, lsp::error::LspError>>;

  auto Definition(std::string uri, lsp::Position position)
      -> asio::awaitable<
          std::expected<lsp::DefinitionResult, lsp::error::LspError>>;

  // Run the check capability against an already admitted snapshot
  auto Check(SnapshotPtr snapshot, ShimSettings settings)
      -> asio::awaitable<std::expected<parser::CheckOutcome, ShimError>>;

  // Number of requests currently being served for `uri`
  [[nodiscard]] auto InFlight(const std::string& uri) const -> int;

  [[nodiscard]] auto IsIdle(const std::string& uri) const -> bool {
    return InFlight(uri) == 0;
  }

 private:
  // Counts a request as in flight for the lifetime of the guard
  class InFlightGuard {
   public:
    InFlightGuard(RequestDispatcher& dispatcher, std::string uri);
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard(InFlightGuard&&) = delete;
    auto operator=(const InFlightGuard&) -> InFlightGuard& = delete;
    auto operator=(InFlightGuard&&) -> InFlightGuard& = delete;
    ~InFlightGuard();

   private:
    RequestDispatcher& dispatcher_;
    std::string uri_;
  };

  struct Admission {
    SnapshotPtr snapshot;
    ShimSettings settings;
  };

  auto Admit(std::string uri)
      -> asio::awaitable<std::expected<Admission, ShimError>>;

  auto Run(
      backend::CapabilityKind kind, const Admission& admission,
      std::optional<lsp::Position> cursor)
      -> asio::awaitable<
          std::expected<backend::BackendResult, backend::InvokeError>>;

  // Snapshot of the file a definition points into: the admitted snapshot for
  // the requesting document, the open snapshot for other open documents, the
  // on-disk text otherwise
  auto ResolveTarget(const Admission& admission, const std::string& path)
      -> asio::awaitable<std::optional<SnapshotPtr>>;

  void LogDiscarded(
      backend::CapabilityKind kind, std::size_t skipped,
      const std::vector<parser::Malformed>& malformed);

  void Notify(lsp::MessageType type, std::string message);

  std::shared_ptr<DocumentStore> store_;
  std::shared_ptr<backend::BackendInvoker> invoker_;
  SettingsProvider settings_provider_;
  std::shared_ptr<spdlog::logger> logger_;

  MessageSink message_sink_;

  std::unordered_map<std::string, int> in_flight_;
};

}  // namespace lspshim::services

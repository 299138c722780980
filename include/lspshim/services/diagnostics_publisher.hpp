#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <asio.hpp>
#include <lsp/basic.hpp>
#include <lsp/document_features.hpp>
#include <spdlog/spdlog.h>

#include "lspshim/document/text_document.hpp"
#include "lspshim/services/debounce_policy.hpp"
#include "lspshim/services/document_store.hpp"
#include "lspshim/services/request_dispatcher.hpp"

namespace lspshim::services {

// Runs the check capability and publishes full diagnostic sets
//
// Open checks run inline so exactly one notification precedes the end of
// the open handler. Change checks go through the DebouncePolicy and always
// check the newest snapshot when they fire. A failed check leaves the last
// published set in place.
class DiagnosticsPublisher {
 public:
  // Sends one publishDiagnostics notification (set by LSP server layer)
  using DiagnosticPublisher = std::function<asio::awaitable<void>(
      std::string uri, std::optional<int> version,
      std::vector<lsp::Diagnostic> diagnostics)>;

  DiagnosticsPublisher(
      asio::any_io_executor executor, std::shared_ptr<DocumentStore> store,
      std::shared_ptr<RequestDispatcher> dispatcher,
      RequestDispatcher::SettingsProvider settings_provider,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto SetDiagnosticPublisher(DiagnosticPublisher publisher) -> void {
    diagnostic_publisher_ = std::move(publisher);
  }

  auto SetMessageSink(RequestDispatcher::MessageSink sink) -> void {
    message_sink_ = std::move(sink);
  }

  // Whether the client accepts publishDiagnostics at all
  auto SetEnabled(bool enabled) -> void {
    enabled_ = enabled;
  }

  // Replace the policy used for change-triggered checks
  auto SetDebouncePolicy(std::unique_ptr<DebouncePolicy> policy) -> void;

  // Pick EagerPolicy (zero) or TimerDebouncePolicy for `delay`
  auto SetDebounceDelay(std::chrono::milliseconds delay) -> void;

  auto OnDocumentOpened(SnapshotPtr snapshot) -> asio::awaitable<void>;

  auto OnDocumentChanged(SnapshotPtr snapshot) -> void;

  // Drops pending work and publishes an empty set
  auto OnDocumentClosed(std::string uri) -> asio::awaitable<void>;

  // Check every open document again (configuration changed)
  auto RevalidateAll() -> asio::awaitable<void>;

  // Inlay hints of the last successful check that fall inside `range`
  [[nodiscard]] auto GetInlayHints(
      const std::string& uri, const lsp::Range& range) const
      -> std::vector<lsp::InlayHint>;

 private:
  // Check the newest snapshot of `uri`, if it is still open
  auto CheckLatest(std::string uri) -> asio::awaitable<void>;

  auto RunCheck(SnapshotPtr snapshot) -> asio::awaitable<void>;

  auto Publish(
      std::string uri, std::optional<int> version,
      std::vector<lsp::Diagnostic> diagnostics) -> asio::awaitable<void>;

  asio::any_io_executor executor_;
  std::shared_ptr<DocumentStore> store_;
  std::shared_ptr<RequestDispatcher> dispatcher_;
  RequestDispatcher::SettingsProvider settings_provider_;
  std::shared_ptr<spdlog::logger> logger_;

  DiagnosticPublisher diagnostic_publisher_;
  RequestDispatcher::MessageSink message_sink_;

  std::unique_ptr<DebouncePolicy> policy_;
  std::chrono::milliseconds debounce_delay_;

  bool enabled_ = true;
  bool disabled_logged_ = false;

  // Version of the last set published per document; older results are
  // dropped when checks complete out of order
  std::unordered_map<std::string, int> published_versions_;

  std::unordered_map<std::string, std::vector<lsp::InlayHint>> inlay_hints_;

  static constexpr auto kDefaultDebounceDelay = std::chrono::milliseconds(500);
};

}  // namespace lspshim::services

#include "lspshim/services/diagnostics_publisher.hpp"

#include <utility>

#include <fmt/format.h>

namespace lspshim::services {

DiagnosticsPublisher::DiagnosticsPublisher(
    asio::any_io_executor executor, std::shared_ptr<DocumentStore> store,
    std::shared_ptr<RequestDispatcher> dispatcher,
    RequestDispatcher::SettingsProvider settings_provider,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      store_(std::move(store)),
      dispatcher_(std::move(dispatcher)),
      settings_provider_(std::move(settings_provider)),
      logger_(logger ? logger : spdlog::default_logger()),
      policy_(MakeDebouncePolicy(executor, kDefaultDebounceDelay, logger_)),
      debounce_delay_(kDefaultDebounceDelay) {
}

auto DiagnosticsPublisher::SetDebouncePolicy(
    std::unique_ptr<DebouncePolicy> policy) -> void {
  policy_ = std::move(policy);
}

auto DiagnosticsPublisher::SetDebounceDelay(std::chrono::milliseconds delay)
    -> void {
  if (delay == debounce_delay_) {
    return;
  }
  logger_->debug("Diagnostics debounce set to {}ms", delay.count());
  debounce_delay_ = delay;
  policy_ = MakeDebouncePolicy(executor_, delay, logger_);
}

auto DiagnosticsPublisher::OnDocumentOpened(SnapshotPtr snapshot)
    -> asio::awaitable<void> {
  co_await RunCheck(std::move(snapshot));
}

auto DiagnosticsPublisher::OnDocumentChanged(SnapshotPtr snapshot) -> void {
  auto uri = snapshot->Uri();
  policy_->Schedule(uri, [this, uri]() -> asio::awaitable<void> {
    co_await CheckLatest(uri);
  });
}

auto DiagnosticsPublisher::OnDocumentClosed(std::string uri)
    -> asio::awaitable<void> {
  policy_->Cancel(uri);
  inlay_hints_.erase(uri);
  published_versions_.erase(uri);

  // Clear the client's view of the closed document
  if (enabled_) {
    co_await Publish(uri, std::nullopt, {});
  }
}

auto DiagnosticsPublisher::RevalidateAll() -> asio::awaitable<void> {
  auto uris = co_await store_->Uris();
  logger_->debug("Revalidating {} open document(s)", uris.size());
  for (auto& uri : uris) {
    co_await CheckLatest(std::move(uri));
  }
}

auto DiagnosticsPublisher::GetInlayHints(
    const std::string& uri, const lsp::Range& range) const
    -> std::vector<lsp::InlayHint> {
  auto it = inlay_hints_.find(uri);
  if (it == inlay_hints_.end()) {
    return {};
  }

  std::vector<lsp::InlayHint> hints;
  for (const auto& hint : it->second) {
    if (range.start <= hint.position && hint.position <= range.end) {
      hints.push_back(hint);
    }
  }
  return hints;
}

auto DiagnosticsPublisher::CheckLatest(std::string uri)
    -> asio::awaitable<void> {
  auto snapshot = co_await store_->Snapshot(uri);
  if (!snapshot) {
    logger_->debug("Skipping check for closed document {}", uri);
    co_return;
  }
  co_await RunCheck(std::move(*snapshot));
}

auto DiagnosticsPublisher::RunCheck(SnapshotPtr snapshot)
    -> asio::awaitable<void> {
  const auto uri = snapshot->Uri();
  const auto version = snapshot->Version();

  if (!enabled_) {
    if (!disabled_logged_) {
      logger_->info(
          "Client does not accept publishDiagnostics, checks are skipped");
      disabled_logged_ = true;
    }
    co_return;
  }

  auto settings = co_await settings_provider_(uri);
  if (!settings.capabilities.check.enabled) {
    logger_->debug("Check capability disabled for {}", uri);
    co_return;
  }
  const auto max_problems = settings.diagnostics.max_problems;
  const auto show_hints = settings.diagnostics.inlay_hints;

  auto outcome = co_await dispatcher_->Check(snapshot, std::move(settings));
  if (!outcome) {
    // Last-known-good diagnostics stay published
    logger_->warn(
        "Check failed for {} (version {}): {}", uri, version,
        outcome.error().message());
    if (message_sink_) {
      message_sink_(
          lsp::MessageType::kError,
          fmt::format(
              "Check failed for {}: {}", uri, outcome.error().message()));
    }
    co_return;
  }

  // The document may have been closed, or closed and opened again, meanwhile
  auto current = co_await store_->Snapshot(uri);
  if (!current || (*current)->Session() != snapshot->Session()) {
    logger_->debug(
        "Dropping check result for {} version {} from a closed session", uri,
        version);
    co_return;
  }
  if (auto it = published_versions_.find(uri);
      it != published_versions_.end() && it->second > version) {
    logger_->debug(
        "Dropping check result for {} version {} (version {} published)", uri,
        version, it->second);
    co_return;
  }
  published_versions_[uri] = version;

  auto diagnostics = std::move(outcome->diagnostics);
  if (max_problems >= 0 &&
      diagnostics.size() > static_cast<std::size_t>(max_problems)) {
    diagnostics.resize(static_cast<std::size_t>(max_problems));
  }

  if (show_hints) {
    inlay_hints_[uri] = std::move(outcome->inlay_hints);
  } else {
    inlay_hints_.erase(uri);
  }

  co_await Publish(uri, version, std::move(diagnostics));
}

auto DiagnosticsPublisher::Publish(
    std::string uri, std::optional<int> version,
    std::vector<lsp::Diagnostic> diagnostics) -> asio::awaitable<void> {
  logger_->debug(
      "Publishing {} diagnostic(s) for {}", diagnostics.size(), uri);
  if (diagnostic_publisher_) {
    co_await diagnostic_publisher_(
        std::move(uri), version, std::move(diagnostics));
  }
}

}  // namespace lspshim::services

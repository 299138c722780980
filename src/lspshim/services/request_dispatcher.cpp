#include "lspshim/services/request_dispatcher.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <fmt/format.h>

#include "lspshim/backend/command_builder.hpp"
#include "lspshim/utils/scoped_timer.hpp"
#include "lspshim/utils/uri.hpp"

namespace lspshim::services {

using backend::CapabilityKind;
using backend::InvokeErrorKind;
using lsp::error::LspError;

namespace {

auto IsCancelled(const asio::cancellation_state& state) -> bool {
  return state.cancelled() != asio::cancellation_type::none;
}

auto ReadFile(const std::filesystem::path& path) -> std::optional<std::string> {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream content;
  content << file.rdbuf();
  return content.str();
}

}  // namespace

RequestDispatcher::InFlightGuard::InFlightGuard(
    RequestDispatcher& dispatcher, std::string uri)
    : dispatcher_(dispatcher), uri_(std::move(uri)) {
  ++dispatcher_.in_flight_[uri_];
}

RequestDispatcher::InFlightGuard::~InFlightGuard() {
  auto it = dispatcher_.in_flight_.find(uri_);
  if (it != dispatcher_.in_flight_.end() && --it->second <= 0) {
    dispatcher_.in_flight_.erase(it);
  }
}

RequestDispatcher::RequestDispatcher(
    std::shared_ptr<DocumentStore> store,
    std::shared_ptr<backend::BackendInvoker> invoker,
    SettingsProvider settings_provider, std::shared_ptr<spdlog::logger> logger)
    : store_(std::move(store)),
      invoker_(std::move(invoker)),
      settings_provider_(std::move(settings_provider)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto RequestDispatcher::InFlight(const std::string& uri) const -> int {
  auto it = in_flight_.find(uri);
  return it == in_flight_.end() ? 0 : it->second;
}

auto RequestDispatcher::Admit(std::string uri)
    -> asio::awaitable<std::expected<Admission, ShimError>> {
  // The snapshot is taken first; settings lookups may wait on the client
  auto snapshot = co_await store_->Snapshot(uri);
  if (!snapshot) {
    co_return std::unexpected(snapshot.error());
  }
  auto settings = co_await settings_provider_(uri);
  co_return Admission{
      .snapshot = std::move(*snapshot), .settings = std::move(settings)};
}

auto RequestDispatcher::Run(
    CapabilityKind kind, const Admission& admission,
    std::optional<lsp::Position> cursor)
    -> asio::awaitable<
        std::expected<backend::BackendResult, backend::InvokeError>> {
  auto cancellation = co_await asio::this_coro::cancellation_state;
  if (IsCancelled(cancellation)) {
    co_return std::unexpected(backend::InvokeError{
        .kind = InvokeErrorKind::kCancelled,
        .message = "request cancelled before the backend started"});
  }

  auto request = backend::BuildBackendRequest(
      kind, admission.snapshot, cursor, admission.settings);
  auto result = co_await invoker_->Invoke(
      std::move(request), admission.settings.backend.timeout);

  if (!result) {
    const auto& error = result.error();
    logger_->debug(
        "Backend {} for {} failed: {}", backend::CapabilityName(kind),
        admission.snapshot->Uri(), error.message);
    if (error.result && !error.result->error_output.empty()) {
      logger_->debug("Backend stderr: {}", error.result->error_output);
    }
  }
  co_return result;
}

void RequestDispatcher::LogDiscarded(
    CapabilityKind kind, std::size_t skipped,
    const std::vector<parser::Malformed>& malformed) {
  if (skipped > 0) {
    logger_->trace(
        "Backend {} output: {} blank line(s) skipped",
        backend::CapabilityName(kind), skipped);
  }
  for (const auto& line : malformed) {
    logger_->warn(
        "Backend {} output: ignoring '{}' ({})", backend::CapabilityName(kind),
        line.raw_line, line.reason);
  }
}

void RequestDispatcher::Notify(lsp::MessageType type, std::string message) {
  if (message_sink_) {
    message_sink_(type, std::move(message));
  }
}

auto RequestDispatcher::Hover(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::HoverResult, LspError>> {
  co_await asio::this_coro::throw_if_cancelled(false);
  InFlightGuard guard(*this, uri);
  utils::ScopedTimer timer(fmt::format("Hover {}", uri), logger_);

  auto admission = co_await Admit(uri);
  if (!admission) {
    co_return UnexpectedLspError(admission.error());
  }
  if (!admission->settings.capabilities.hover.enabled) {
    co_return lsp::HoverResult{};
  }

  auto result = co_await Run(CapabilityKind::kHover, *admission, position);
  if (!result) {
    if (result.error().kind == InvokeErrorKind::kNonZeroExit) {
      co_return lsp::HoverResult{};
    }
    co_return UnexpectedLspError(result.error().ToShimError());
  }

  co_return parser::ParseHover(result->output);
}

auto RequestDispatcher::Completion(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::CompletionResult, LspError>> {
  co_await asio::this_coro::throw_if_cancelled(false);
  InFlightGuard guard(*this, uri);
  utils::ScopedTimer timer(fmt::format("Completion {}", uri), logger_);

  auto admission = co_await Admit(uri);
  if (!admission) {
    co_return UnexpectedLspError(admission.error());
  }
  if (!admission->settings.capabilities.completion.enabled) {
    co_return lsp::CompletionList{};
  }

  auto result =
      co_await Run(CapabilityKind::kCompletion, *admission, position);
  if (!result) {
    if (result.error().kind == InvokeErrorKind::kNonZeroExit) {
      co_return lsp::CompletionList{};
    }
    co_return UnexpectedLspError(result.error().ToShimError());
  }

  auto outcome = parser::ParseCompletion(result->output);
  LogDiscarded(
      CapabilityKind::kCompletion, outcome.skipped.size(), outcome.malformed);
  co_return lsp::CompletionList{
      .isIncomplete = false, .items = std::move(outcome.items)};
}

auto RequestDispatcher::Definition(std::string uri, lsp::Position position)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, LspError>> {
  co_await asio::this_coro::throw_if_cancelled(false);
  InFlightGuard guard(*this, uri);
  utils::ScopedTimer timer(fmt::format("Definition {}", uri), logger_);

  auto admission = co_await Admit(uri);
  if (!admission) {
    co_return UnexpectedLspError(admission.error());
  }
  if (!admission->settings.capabilities.definition.enabled) {
    co_return lsp::DefinitionResult{};
  }

  auto result =
      co_await Run(CapabilityKind::kDefinition, *admission, position);
  if (!result) {
    co_return UnexpectedLspError(result.error().ToShimError());
  }

  const auto mode = admission->settings.position.mode;
  auto outcome = parser::ParseDefinition(result->output, mode);
  LogDiscarded(
      CapabilityKind::kDefinition, outcome.skipped.size(), outcome.malformed);
  if (!outcome.definition ||
      !parser::IsNavigablePath(outcome.definition->path)) {
    co_return lsp::DefinitionResult{};
  }

  const auto& definition = *outcome.definition;
  auto target = co_await ResolveTarget(*admission, definition.path);
  if (!target) {
    logger_->warn("Definition target {} does not exist", definition.path);
    Notify(
        lsp::MessageType::kError,
        fmt::format("File {} does not exist", definition.path));
    co_return lsp::DefinitionResult{};
  }

  PositionCodec codec(admission->settings.position.convention, mode);
  auto range = parser::ToProtocolRange(
      **target, codec, definition.start, definition.end);
  co_return lsp::DefinitionResult{
      lsp::Location{.uri = (*target)->Uri(), .range = range}};
}

auto RequestDispatcher::ResolveTarget(
    const Admission& admission, const std::string& path)
    -> asio::awaitable<std::optional<SnapshotPtr>> {
  const auto& snapshot = admission.snapshot;
  if (path == snapshot->Uri()) {
    co_return snapshot;
  }

  std::filesystem::path target_path(path);
  if (target_path.is_relative() && utils::IsFileUri(snapshot->Uri())) {
    std::filesystem::path document_path(utils::UriToPath(snapshot->Uri()));
    target_path = document_path.parent_path() / target_path;
  }
  target_path = target_path.lexically_normal();

  auto target_uri = utils::PathToUri(target_path.string());
  if (target_uri == snapshot->Uri()) {
    co_return snapshot;
  }

  if (auto open = co_await store_->Snapshot(target_uri)) {
    co_return std::move(*open);
  }

  auto text = ReadFile(target_path);
  if (!text) {
    co_return std::nullopt;
  }
  co_return MakeSnapshot(std::move(target_uri), std::move(*text), 0);
}

auto RequestDispatcher::Check(SnapshotPtr snapshot, ShimSettings settings)
    -> asio::awaitable<std::expected<parser::CheckOutcome, ShimError>> {
  co_await asio::this_coro::throw_if_cancelled(false);
  InFlightGuard guard(*this, snapshot->Uri());
  utils::ScopedTimer timer(
      fmt::format(
          "Check {} (version {})", snapshot->Uri(), snapshot->Version()),
      logger_);

  Admission admission{
      .snapshot = std::move(snapshot), .settings = std::move(settings)};
  auto result =
      co_await Run(CapabilityKind::kCheck, admission, std::nullopt);

  // Checkers commonly exit non-zero when they report problems; what they
  // printed is still the diagnostic set of this snapshot
  std::string output;
  if (result) {
    output = std::move(result->output);
  } else if (
      result.error().kind == InvokeErrorKind::kNonZeroExit &&
      result.error().result) {
    output = std::move(result.error().result->output);
  } else {
    co_return std::unexpected(result.error().ToShimError());
  }

  const auto& position = admission.settings.position;
  PositionCodec codec(position.convention, position.mode);
  auto outcome = parser::ParseCheck(
      output, *admission.snapshot, codec,
      admission.settings.backend.executable);
  LogDiscarded(
      CapabilityKind::kCheck, outcome.skipped.size(), outcome.malformed);
  co_return outcome;
}

}  // namespace lspshim::services

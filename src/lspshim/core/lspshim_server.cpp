#include "lspshim/core/lspshim_server.hpp"

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "lsp/document_features.hpp"
#include "lspshim/error/error.hpp"
#include "lspshim/utils/uri.hpp"

namespace lspshim {

using lsp::LspError;
using lsp::LspErrorCode;
using lsp::Ok;

namespace {

constexpr std::string_view kServerName = "lspshim";
constexpr std::string_view kServerVersion = "0.1.0";
constexpr std::string_view kConfigurationSection = "lspshim";
constexpr std::string_view kConfigurationRegistrationId =
    "lspshim-did-change-configuration";
constexpr std::string_view kDidChangeConfigurationMethod =
    "workspace/didChangeConfiguration";

auto WorkspaceRootOf(const lsp::InitializeParams& params)
    -> std::optional<std::filesystem::path> {
  if (params.workspaceFolders && !params.workspaceFolders->empty()) {
    return utils::UriToPath(params.workspaceFolders->front().uri);
  }
  if (params.rootUri) {
    return utils::UriToPath(*params.rootUri);
  }
  if (params.rootPath) {
    return std::filesystem::path(*params.rootPath);
  }
  return std::nullopt;
}

}  // namespace

LspshimServer::LspshimServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<backend::BackendInvoker> invoker,
    std::shared_ptr<lsp::CancellationRegistry> cancellations,
    std::shared_ptr<spdlog::logger> logger)
    : lsp::LspServer(
          executor, std::move(endpoint), std::move(cancellations), logger),
      logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      store_(std::make_shared<services::DocumentStore>(executor, logger_)),
      settings_(std::make_shared<SettingsManager>(executor, logger_)) {
  auto settings_provider =
      [settings = settings_](std::string uri) -> asio::awaitable<ShimSettings> {
    co_return co_await settings->GetSettings(std::move(uri));
  };

  dispatcher_ = std::make_shared<services::RequestDispatcher>(
      store_, std::move(invoker), settings_provider, logger_);
  diagnostics_ = std::make_unique<services::DiagnosticsPublisher>(
      executor_, store_, dispatcher_, settings_provider, logger_);

  auto message_sink = [this](lsp::MessageType type, std::string message) {
    NotifyClient(type, std::move(message));
  };
  dispatcher_->SetMessageSink(message_sink);
  diagnostics_->SetMessageSink(message_sink);

  // Set up diagnostic publisher callback
  diagnostics_->SetDiagnosticPublisher(
      [this](
          std::string uri, std::optional<int> version,
          std::vector<lsp::Diagnostic> diagnostics) -> asio::awaitable<void> {
        auto result = co_await PublishDiagnostics(
            {.uri = std::move(uri),
             .version = version,
             .diagnostics = std::move(diagnostics)});
        if (!result) {
          logger_->warn(
              "Dropped diagnostics notification: {}", result.error().Message());
        }
      });
}

void LspshimServer::NotifyClient(lsp::MessageType type, std::string message) {
  auto coroutine = [this, type,
                    message = std::move(message)]() -> asio::awaitable<void> {
    auto result = co_await LogMessage({.type = type, .message = message});
    if (!result) {
      logger_->debug("Dropped log message: {}", message);
    }
  };
  asio::co_spawn(executor_, std::move(coroutine), asio::detached);
}

auto LspshimServer::ReloadConfiguration() -> asio::awaitable<void> {
  if (workspace_root_) {
    co_await settings_->LoadConfigFile(*workspace_root_);
  }
  diagnostics_->SetDebounceDelay(
      settings_->GetGlobalSettings().diagnostics.debounce);
}

auto LspshimServer::OnInitialize(lsp::InitializeParams params)
    -> asio::awaitable<std::expected<lsp::InitializeResult, lsp::LspError>> {
  workspace_root_ = WorkspaceRootOf(params);

  // Record what the client can do; absent capabilities mean unsupported
  bool publishes_diagnostics = false;
  if (const auto& capabilities = params.capabilities) {
    if (const auto& workspace = capabilities->workspace) {
      client_pulls_configuration_ = workspace->configuration.value_or(false);
      if (const auto& did_change = workspace->didChangeConfiguration) {
        client_registers_configuration_ =
            did_change->dynamicRegistration.value_or(false);
      }
    }
    if (const auto& text_document = capabilities->textDocument) {
      publishes_diagnostics = text_document->publishDiagnostics.has_value();
    }
    // Positions are always exchanged in UTF-16, the protocol default
    if (capabilities->general && capabilities->general->positionEncodings) {
      Logger()->debug(
          "Client position encodings: {}",
          fmt::join(*capabilities->general->positionEncodings, ", "));
    }
  }
  diagnostics_->SetEnabled(publishes_diagnostics);

  Logger()->info(
      "Client capabilities: configuration={} dynamic configuration={} "
      "publishDiagnostics={}",
      client_pulls_configuration_, client_registers_configuration_,
      publishes_diagnostics);

  lsp::TextDocumentSyncOptions sync_options{
      .openClose = true,
      .change = lsp::TextDocumentSyncKind::kIncremental,
  };

  lsp::ServerCapabilities::Workspace workspace{
      .workspaceFolders =
          lsp::WorkspaceFoldersServerCapabilities{
              .supported = true,
              .changeNotifications = true,
          },
  };

  lsp::ServerCapabilities capabilities{
      .positionEncoding = lsp::PositionEncodingKind::kUtf16,
      .textDocumentSync = sync_options,
      .completionProvider = lsp::CompletionOptions{},
      .hoverProvider = true,
      .definitionProvider = true,
      .inlayHintProvider =
          lsp::InlayHintOptions{
              .resolveProvider = false,
          },
      .workspace = workspace,
  };

  co_return lsp::InitializeResult{
      .capabilities = capabilities,
      .serverInfo = lsp::InitializeResult::ServerInfo{
          .name = std::string(kServerName),
          .version = std::string(kServerVersion)}};
}

auto LspshimServer::OnInitialized(lsp::InitializedParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  initialized_ = true;

  if (client_pulls_configuration_) {
    settings_->SetFetcher(
        [this](std::string uri)
            -> asio::awaitable<std::optional<nlohmann::json>> {
          auto result = co_await GetConfiguration(lsp::ConfigurationParams{
              .items = {lsp::ConfigurationItem{
                  .scopeUri = std::move(uri),
                  .section = std::string(kConfigurationSection)}}});
          if (!result || result->empty()) {
            co_return std::nullopt;
          }
          co_return result->front();
        });
  }

  co_await ReloadConfiguration();

  if (client_registers_configuration_) {
    auto register_configuration = [this]() -> asio::awaitable<void> {
      Logger()->info("Registering for configuration changes");
      auto registration = lsp::Registration{
          .id = std::string(kConfigurationRegistrationId),
          .method = std::string(kDidChangeConfigurationMethod),
      };
      auto result = co_await RegisterCapability(
          lsp::RegistrationParams{.registrations = {registration}});
      if (!result) {
        Logger()->error(
            "Failed to register for configuration changes: {}",
            result.error().Message());
      }
    };
    asio::co_spawn(executor_, register_configuration, asio::detached);
  }

  co_return Ok();
}

auto LspshimServer::OnSetTrace(lsp::SetTraceParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->debug(
      "OnSetTrace received: {}", nlohmann::json(params.value).dump());
  co_return Ok();
}

auto LspshimServer::OnShutdown(lsp::ShutdownParams /*unused*/)
    -> asio::awaitable<std::expected<lsp::ShutdownResult, lsp::LspError>> {
  shutdown_requested_ = true;
  co_return lsp::ShutdownResult{};
}

auto LspshimServer::OnExit(lsp::ExitParams /*unused*/)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  if (!shutdown_requested_) {
    Logger()->warn("Exit received without a prior shutdown request");
  }
  co_await lsp::LspServer::Shutdown();
  co_return Ok();
}

auto LspshimServer::OnDidOpenTextDocument(
    lsp::DidOpenTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  auto& text_doc = params.textDocument;
  Logger()->debug("OnDidOpenTextDocument received: {}", text_doc.uri);

  auto snapshot = co_await store_->Open(
      text_doc.uri, std::move(text_doc.text), text_doc.version,
      text_doc.languageId);
  if (!snapshot) {
    NotifyClient(lsp::MessageType::kError, snapshot.error().message());
    co_return UnexpectedLspError(snapshot.error());
  }

  co_await diagnostics_->OnDocumentOpened(std::move(*snapshot));
  co_return Ok();
}

auto LspshimServer::OnDidChangeTextDocument(
    lsp::DidChangeTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  const auto& uri = params.textDocument.uri;
  Logger()->debug(
      "OnDidChangeTextDocument received: {} (version {})", uri,
      params.textDocument.version);

  auto snapshot = co_await store_->ApplyChange(
      uri, params.textDocument.version, std::move(params.contentChanges));
  if (!snapshot) {
    NotifyClient(lsp::MessageType::kError, snapshot.error().message());
    co_return UnexpectedLspError(snapshot.error());
  }

  diagnostics_->OnDocumentChanged(std::move(*snapshot));
  co_return Ok();
}

auto LspshimServer::OnDidCloseTextDocument(
    lsp::DidCloseTextDocumentParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  const auto& uri = params.textDocument.uri;
  Logger()->debug("OnDidCloseTextDocument received: {}", uri);

  auto closed = co_await store_->Close(uri);
  if (!closed) {
    NotifyClient(lsp::MessageType::kError, closed.error().message());
    co_return UnexpectedLspError(closed.error());
  }

  settings_->Forget(uri);
  co_await diagnostics_->OnDocumentClosed(uri);
  co_return Ok();
}

auto LspshimServer::OnGotoDefinition(lsp::DefinitionParams params)
    -> asio::awaitable<std::expected<lsp::DefinitionResult, lsp::LspError>> {
  Logger()->debug("OnGotoDefinition received: {}", params.textDocument.uri);
  co_return co_await dispatcher_->Definition(
      params.textDocument.uri, params.position);
}

auto LspshimServer::OnHover(lsp::HoverParams params)
    -> asio::awaitable<std::expected<lsp::HoverResult, lsp::LspError>> {
  Logger()->debug("OnHover received: {}", params.textDocument.uri);
  co_return co_await dispatcher_->Hover(
      params.textDocument.uri, params.position);
}

auto LspshimServer::OnCompletion(lsp::CompletionParams params)
    -> asio::awaitable<std::expected<lsp::CompletionResult, lsp::LspError>> {
  Logger()->debug("OnCompletion received: {}", params.textDocument.uri);
  co_return co_await dispatcher_->Completion(
      params.textDocument.uri, params.position);
}

auto LspshimServer::OnInlayHint(lsp::InlayHintParams params)
    -> asio::awaitable<std::expected<lsp::InlayHintResult, lsp::LspError>> {
  const auto& uri = params.textDocument.uri;
  Logger()->debug("OnInlayHint received: {}", uri);

  if (!co_await store_->Contains(uri)) {
    co_return UnexpectedLspError(
        ShimError::Make(ShimErrorCode::kUnknownDocument, uri));
  }
  co_return diagnostics_->GetInlayHints(uri, params.range);
}

auto LspshimServer::OnDidChangeConfiguration(
    lsp::DidChangeConfigurationParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  Logger()->info("OnDidChangeConfiguration received");

  // Pushed settings are either the whole configuration or our section
  const auto& settings = params.settings;
  const std::string section(kConfigurationSection);
  if (settings.is_object() && settings.contains(section)) {
    settings_->SetGlobal(settings.at(section));
  } else if (settings.is_object() && !settings.empty()) {
    settings_->SetGlobal(settings);
  }
  settings_->ClearCache();

  co_await ReloadConfiguration();

  // Settings may change flags or executables, so every open document is
  // checked again
  asio::co_spawn(executor_, diagnostics_->RevalidateAll(), asio::detached);
  co_return Ok();
}

auto LspshimServer::OnDidChangeWorkspaceFolders(
    lsp::DidChangeWorkspaceFoldersParams params)
    -> asio::awaitable<std::expected<void, lsp::LspError>> {
  for (const auto& folder : params.event.added) {
    Logger()->info("Workspace folder added: {}", folder.uri);
  }
  for (const auto& folder : params.event.removed) {
    Logger()->info("Workspace folder removed: {}", folder.uri);
  }
  co_return Ok();
}

}  // namespace lspshim

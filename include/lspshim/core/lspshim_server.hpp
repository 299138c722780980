#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <asio.hpp>

#include "lsp/lifecycle.hpp"
#include "lsp/lsp_server.hpp"
#include "lspshim/backend/backend_invoker.hpp"
#include "lspshim/core/settings_manager.hpp"
#include "lspshim/services/diagnostics_publisher.hpp"
#include "lspshim/services/document_store.hpp"
#include "lspshim/services/request_dispatcher.hpp"

namespace lspshim {

class LspshimServer : public lsp::LspServer {
 public:
  LspshimServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<backend::BackendInvoker> invoker,
      std::shared_ptr<lsp::CancellationRegistry> cancellations = nullptr,
      std::shared_ptr<spdlog::logger> logger = nullptr);

 private:
  // Server state
  bool initialized_ = false;
  bool shutdown_requested_ = false;

  // Logger
  std::shared_ptr<spdlog::logger> logger_;

  // Executor
  asio::any_io_executor executor_;

  std::shared_ptr<services::DocumentStore> store_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<services::RequestDispatcher> dispatcher_;
  std::unique_ptr<services::DiagnosticsPublisher> diagnostics_;

  // Negotiated in initialize
  bool client_pulls_configuration_ = false;
  bool client_registers_configuration_ = false;

  // Workspace root from the initialize request
  std::optional<std::filesystem::path> workspace_root_;

  // Forward a failure to the client; notifications have no response
  void NotifyClient(lsp::MessageType type, std::string message);

  // Reload .lspshim and re-apply workspace-wide settings
  auto ReloadConfiguration() -> asio::awaitable<void>;

 protected:
  // Initialize Request
  auto OnInitialize(lsp::InitializeParams params) -> asio::awaitable<
      std::expected<lsp::InitializeResult, lsp::LspError>> override;

  // Initialized Notification
  auto OnInitialized(lsp::InitializedParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // SetTrace Notification
  auto OnSetTrace(lsp::SetTraceParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Shutdown Request
  auto OnShutdown(lsp::ShutdownParams params) -> asio::awaitable<
      std::expected<lsp::ShutdownResult, lsp::LspError>> override;

  // Exit Notification
  auto OnExit(lsp::ExitParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Open Text Document Notification
  auto OnDidOpenTextDocument(lsp::DidOpenTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Change Text Document Notification
  auto OnDidChangeTextDocument(lsp::DidChangeTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Did Close Text Document Notification
  auto OnDidCloseTextDocument(lsp::DidCloseTextDocumentParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // Goto Definition Request
  auto OnGotoDefinition(lsp::DefinitionParams params) -> asio::awaitable<
      std::expected<lsp::DefinitionResult, lsp::LspError>> override;

  // Hover Request
  auto OnHover(lsp::HoverParams params) -> asio::awaitable<
      std::expected<lsp::HoverResult, lsp::LspError>> override;

  // Completion Request
  auto OnCompletion(lsp::CompletionParams params) -> asio::awaitable<
      std::expected<lsp::CompletionResult, lsp::LspError>> override;

  // Inlay Hint Request
  auto OnInlayHint(lsp::InlayHintParams params) -> asio::awaitable<
      std::expected<lsp::InlayHintResult, lsp::LspError>> override;

  // DidChangeConfiguration Notification
  auto OnDidChangeConfiguration(lsp::DidChangeConfigurationParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;

  // DidChangeWorkspaceFolders Notification
  auto OnDidChangeWorkspaceFolders(lsp::DidChangeWorkspaceFoldersParams params)
      -> asio::awaitable<std::expected<void, lsp::LspError>> override;
};

}  // namespace lspshim

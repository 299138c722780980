#include "lsp/lsp_server.hpp"

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lsp {

using lsp::error::LspError;
using lsp::error::Ok;

LspServer::LspServer(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
    std::shared_ptr<CancellationRegistry> cancellations,
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      endpoint_(std::move(endpoint)),
      executor_(executor),
      work_guard_(asio::make_work_guard(executor)),
      cancellations_(
          cancellations ? std::move(cancellations)
                        : std::make_shared<CancellationRegistry>(logger_)) {
}

auto LspServer::Start() -> asio::awaitable<std::expected<void, LspError>> {
  // Register method handlers
  RegisterHandlers();

  // Start the endpoint and wait for shutdown
  auto result = co_await endpoint_->Start();
  if (result.has_value()) {
    Logger()->debug("LspServer endpoint started");
  } else {
    Logger()->error("LspServer endpoint error: {}", result.error().Message());
    co_return LspError::UnexpectedFromRpcError(result.error());
  }

  // Wait for shutdown
  auto shutdown_result = co_await endpoint_->WaitForShutdown();
  if (shutdown_result.has_value()) {
    Logger()->debug("LspServer endpoint wait for shutdown completed");
  } else {
    Logger()->error(
        "LspServer endpoint wait for shutdown error: {}",
        shutdown_result.error().Message());
    co_return LspError::UnexpectedFromRpcError(shutdown_result.error());
  }

  co_return Ok();
}

auto LspServer::Shutdown() -> asio::awaitable<std::expected<void, LspError>> {
  Logger()->debug("Server shutting down");

  if (endpoint_) {
    auto result = co_await endpoint_->Shutdown();
    if (result.has_value()) {
      Logger()->debug("LspServer endpoint shutdown");
    } else {
      Logger()->error(
          "LspServer endpoint shutdown error: {}", result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
  }

  // Release work guard to allow threads to finish
  work_guard_.reset();

  co_return Ok();
}

void LspServer::RegisterHandlers() {
  RegisterLifecycleHandlers();
  RegisterDocumentSyncHandlers();
  RegisterLanguageFeatureHandlers();
  RegisterWorkspaceFeatureHandlers();
}

void LspServer::RegisterLifecycleHandlers() {
  // Initialize Request
  endpoint_->RegisterMethodCall<InitializeParams, InitializeResult, LspError>(
      "initialize",
      [this](const InitializeParams& params) { return OnInitialize(params); });

  // Initialized Notification
  endpoint_->RegisterNotification<InitializedParams, LspError>(
      "initialized", [this](const InitializedParams& params) {
        return OnInitialized(params);
      });

  // SetTrace Notification
  endpoint_->RegisterNotification<SetTraceParams, LspError>(
      "$/setTrace",
      [this](const SetTraceParams& params) { return OnSetTrace(params); });

  // Shutdown Request
  endpoint_->RegisterMethodCall<ShutdownParams, ShutdownResult, LspError>(
      "shutdown",
      [this](const ShutdownParams& params) { return OnShutdown(params); });

  // Exit Notification
  endpoint_->RegisterNotification<ExitParams, LspError>(
      "exit", [this](const ExitParams& params) { return OnExit(params); });

  // Cancel Request Notification
  endpoint_->RegisterNotification<CancelParams, LspError>(
      "$/cancelRequest",
      [this](const CancelParams& params) { return OnCancelRequest(params); });
}

void LspServer::RegisterDocumentSyncHandlers() {
  // DidOpenTextDocument Notification
  endpoint_->RegisterNotification<DidOpenTextDocumentParams, LspError>(
      "textDocument/didOpen", [this](const DidOpenTextDocumentParams& params) {
        return OnDidOpenTextDocument(params);
      });

  // DidChangeTextDocument Notification
  endpoint_->RegisterNotification<DidChangeTextDocumentParams, LspError>(
      "textDocument/didChange",
      [this](const DidChangeTextDocumentParams& params) {
        return OnDidChangeTextDocument(params);
      });

  // DidCloseTextDocument Notification
  endpoint_->RegisterNotification<DidCloseTextDocumentParams, LspError>(
      "textDocument/didClose",
      [this](const DidCloseTextDocumentParams& params) {
        return OnDidCloseTextDocument(params);
      });
}

void LspServer::RegisterLanguageFeatureHandlers() {
  // Goto Definition Request
  endpoint_->RegisterMethodCall<DefinitionParams, DefinitionResult, LspError>(
      "textDocument/definition", [this](const DefinitionParams& params) {
        return ServeGotoDefinition(params);
      });

  // Hover Request
  endpoint_->RegisterMethodCall<HoverParams, HoverResult, LspError>(
      "textDocument/hover",
      [this](const HoverParams& params) { return ServeHover(params); });

  // Inlay Hint Request
  endpoint_->RegisterMethodCall<InlayHintParams, InlayHintResult, LspError>(
      "textDocument/inlayHint",
      [this](const InlayHintParams& params) { return OnInlayHint(params); });

  // Completion Request
  endpoint_->RegisterMethodCall<CompletionParams, CompletionResult, LspError>(
      "textDocument/completion",
      [this](const CompletionParams& params) {
        return ServeCompletion(params);
      });
}

auto LspServer::OnCancelRequest(CancelParams params)
    -> asio::awaitable<std::expected<void, LspError>> {
  // Unknown ids belong to requests that already completed
  cancellations_->Cancel(params.id);
  co_return Ok();
}

auto LspServer::ServeGotoDefinition(DefinitionParams params)
    -> asio::awaitable<std::expected<DefinitionResult, LspError>> {
  co_return co_await RunCancellable<DefinitionResult>(
      "textDocument/definition", params,
      [this, params]() { return OnGotoDefinition(params); });
}

auto LspServer::ServeHover(HoverParams params)
    -> asio::awaitable<std::expected<HoverResult, LspError>> {
  co_return co_await RunCancellable<HoverResult>(
      "textDocument/hover", params,
      [this, params]() { return OnHover(params); });
}

auto LspServer::ServeCompletion(CompletionParams params)
    -> asio::awaitable<std::expected<CompletionResult, LspError>> {
  co_return co_await RunCancellable<CompletionResult>(
      "textDocument/completion", params,
      [this, params]() { return OnCompletion(params); });
}

void LspServer::RegisterWorkspaceFeatureHandlers() {
  // DidChangeConfiguration Notification
  endpoint_->RegisterNotification<DidChangeConfigurationParams, LspError>(
      "workspace/didChangeConfiguration",
      [this](const DidChangeConfigurationParams& params) {
        return OnDidChangeConfiguration(params);
      });

  // DidChangeWorkspaceFolders Notification
  endpoint_->RegisterNotification<DidChangeWorkspaceFoldersParams, LspError>(
      "workspace/didChangeWorkspaceFolders",
      [this](const DidChangeWorkspaceFoldersParams& params) {
        return OnDidChangeWorkspaceFolders(params);
      });
}

}  // namespace lsp

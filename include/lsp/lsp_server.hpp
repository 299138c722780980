#pragma once

#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/error/error.hpp>
#include <spdlog/spdlog.h>

#include "lsp/cancellation.hpp"
#include "lsp/diagnostic.hpp"
#include "lsp/document_features.hpp"
#include "lsp/document_sync.hpp"
#include "lsp/error.hpp"
#include "lsp/lifecycle.hpp"
#include "lsp/navigation.hpp"
#include "lsp/window.hpp"
#include "lsp/workspace.hpp"

namespace lsp {

using lsp::error::LspError;
using lsp::error::LspErrorCode;
using lsp::error::Ok;

class LspServer {
 public:
  LspServer(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint,
      std::shared_ptr<CancellationRegistry> cancellations,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  LspServer(const LspServer&) = delete;
  LspServer(LspServer&&) = delete;
  auto operator=(const LspServer&) -> LspServer& = delete;
  auto operator=(LspServer&&) -> LspServer& = delete;

  virtual ~LspServer() = default;

  auto Start() -> asio::awaitable<std::expected<void, LspError>>;
  auto Shutdown() -> asio::awaitable<std::expected<void, LspError>>;
  auto Logger() -> std::shared_ptr<spdlog::logger> {
    return logger_;
  }

 protected:
  void RegisterHandlers();

 private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<jsonrpc::endpoint::RpcEndpoint> endpoint_;
  asio::any_io_executor executor_;
  asio::executor_work_guard<asio::any_io_executor> work_guard_;
  std::shared_ptr<CancellationRegistry> cancellations_;

  void RegisterLifecycleHandlers();
  void RegisterDocumentSyncHandlers();
  void RegisterLanguageFeatureHandlers();
  void RegisterWorkspaceFeatureHandlers();

 protected:
  // Cancel Request Notification
  auto OnCancelRequest(CancelParams params)
      -> asio::awaitable<std::expected<void, LspError>>;

  // Position requests served so that `$/cancelRequest` reaches them
  auto ServeGotoDefinition(DefinitionParams params)
      -> asio::awaitable<std::expected<DefinitionResult, LspError>>;
  auto ServeHover(HoverParams params)
      -> asio::awaitable<std::expected<HoverResult, LspError>>;
  auto ServeCompletion(CompletionParams params)
      -> asio::awaitable<std::expected<CompletionResult, LspError>>;

  // Run `handler` with the cancellation slot of the request it serves bound
  // to it. Requests that were not admitted run without one.
  template <typename Result>
  auto RunCancellable(
      std::string_view method, TextDocumentPositionParams target,
      std::function<asio::awaitable<std::expected<Result, LspError>>()>
          handler) -> asio::awaitable<std::expected<Result, LspError>> {
    auto ticket = cancellations_->Claim(method, target);
    if (!ticket) {
      co_return co_await handler();
    }
    if (ticket->cancelled) {
      co_return LspError::UnexpectedFromCode(LspErrorCode::kRequestCancelled);
    }

    auto task = [handler = std::move(handler)]()
        -> asio::awaitable<std::expected<Result, LspError>> {
      // Cancellation is reported through the result, not as an exception
      co_await asio::this_coro::throw_if_cancelled(false);
      co_return co_await handler();
    };
    auto [exception, result] = co_await asio::co_spawn(
        executor_, std::move(task),
        asio::bind_cancellation_slot(
            ticket->signal->slot(), asio::as_tuple(asio::use_awaitable)));
    if (exception) {
      std::rethrow_exception(exception);
    }
    co_return result;
  }

  // Initialize Request
  virtual auto OnInitialize(InitializeParams /*unused*/)
      -> asio::awaitable<std::expected<InitializeResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInitialize is not implemented");
  }

  // Initialized Notification
  virtual auto OnInitialized(InitializedParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnInitialized is not implemented");
  }

  // Register Capability
  auto RegisterCapability(RegistrationParams params)
      -> asio::awaitable<std::expected<RegistrationResult, LspError>> {
    auto result = co_await endpoint_
                      ->SendMethodCall<RegistrationParams, RegistrationResult>(
                          "client/registerCapability", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to register capability: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return result.value();
  }

  // SetTrace Notification
  virtual auto OnSetTrace(SetTraceParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnSetTrace is not implemented");
  }

  // Shutdown Request
  virtual auto OnShutdown(ShutdownParams /*unused*/)
      -> asio::awaitable<std::expected<ShutdownResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnShutdown is not implemented");
  }

  // Exit Notification
  virtual auto OnExit(ExitParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnExit is not implemented");
  }

  // DidOpenTextDocument Notification
  virtual auto OnDidOpenTextDocument(DidOpenTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidOpenTextDocument is not implemented");
  }

  // DidChangeTextDocument Notification
  virtual auto OnDidChangeTextDocument(DidChangeTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeTextDocument is not implemented");
  }

  // DidCloseTextDocument Notification
  virtual auto OnDidCloseTextDocument(DidCloseTextDocumentParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidCloseTextDocument is not implemented");
  }

  // Goto Definition Request
  virtual auto OnGotoDefinition(DefinitionParams /*unused*/)
      -> asio::awaitable<std::expected<DefinitionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnGotoDefinition is not implemented");
  }

  // Hover Request
  virtual auto OnHover(HoverParams /*unused*/)
      -> asio::awaitable<std::expected<HoverResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnHover is not implemented");
  }

  // Inlay Hint Request
  virtual auto OnInlayHint(InlayHintParams /*unused*/)
      -> asio::awaitable<std::expected<InlayHintResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnInlayHint is not implemented");
  }

  // Completion Request
  virtual auto OnCompletion(CompletionParams /*unused*/)
      -> asio::awaitable<std::expected<CompletionResult, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented, "OnCompletion is not implemented");
  }

  // PublishDiagnostics Notification
  auto PublishDiagnostics(PublishDiagnosticsParams params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result =
        co_await endpoint_->SendNotification<PublishDiagnosticsParams>(
            "textDocument/publishDiagnostics", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to publish diagnostics: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }

  // Get Configuration Request
  auto GetConfiguration(ConfigurationParams params)
      -> asio::awaitable<std::expected<ConfigurationResult, LspError>> {
    auto result =
        co_await endpoint_
            ->SendMethodCall<ConfigurationParams, ConfigurationResult>(
                "workspace/configuration", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to fetch configuration: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return result.value();
  }

  // DidChangeConfiguration Notification
  virtual auto OnDidChangeConfiguration(
      DidChangeConfigurationParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeConfiguration is not implemented");
  }

  // DidChangeWorkspaceFolders Notification
  virtual auto OnDidChangeWorkspaceFolders(
      DidChangeWorkspaceFoldersParams /*unused*/)
      -> asio::awaitable<std::expected<void, LspError>> {
    co_return LspError::UnexpectedFromCode(
        LspErrorCode::kMethodNotImplemented,
        "OnDidChangeWorkspaceFolders is not implemented");
  }

  // LogMessage Notification
  auto LogMessage(LogMessageParams params)
      -> asio::awaitable<std::expected<void, LspError>> {
    auto result = co_await endpoint_->SendNotification<LogMessageParams>(
        "window/logMessage", params);
    if (!result) {
      Logger()->error(
          "LspServer failed to send log message: {}",
          result.error().Message());
      co_return LspError::UnexpectedFromRpcError(result.error());
    }
    co_return Ok();
  }
};

}  // namespace lsp

#include "lspshim/core/lspshim_server.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include <asio.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lsp/cancellation.hpp"
#include "lspshim/backend/process_backend_invoker.hpp"
#include "test/lspshim/common/async_fixture.hpp"
#include "test/lspshim/common/fake_backend_invoker.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using lsp::error::LspErrorCode;
using lspshim::test::FakeBackendInvoker;
using lspshim::backend::ProcessBackendInvoker;
using lspshim::test::RunAsyncTest;
using lspshim::test::Sleep;
using namespace std::chrono_literals;

namespace {

constexpr auto kUri = "file:///tmp/a.nu";
constexpr auto kText = "let x = 1\nprint x";

// Exposes the protocol handlers so they can be driven without a transport.
// Only paths that never write to the client are exercised here.
class TestLspshimServer : public lspshim::LspshimServer {
 public:
  using LspshimServer::LspshimServer;

  using LspshimServer::OnCancelRequest;
  using LspshimServer::OnCompletion;
  using LspshimServer::OnDidChangeConfiguration;
  using LspshimServer::OnDidCloseTextDocument;
  using LspshimServer::OnDidOpenTextDocument;
  using LspshimServer::OnHover;
  using LspshimServer::OnInitialize;
  using LspshimServer::OnInitialized;
  using LspshimServer::OnInlayHint;
  using LspshimServer::OnShutdown;
  using LspshimServer::ServeHover;
};

auto Identifier(std::string uri) -> lsp::TextDocumentIdentifier {
  return lsp::TextDocumentIdentifier{.uri = std::move(uri)};
}

auto OpenParams() -> lsp::DidOpenTextDocumentParams {
  return lsp::DidOpenTextDocumentParams{
      .textDocument = lsp::TextDocumentItem{
          .uri = kUri, .languageId = "nu", .version = 1, .text = kText}};
}

auto HoverAt(int line, int character) -> lsp::HoverParams {
  lsp::HoverParams params;
  params.textDocument = Identifier(kUri);
  params.position = lsp::Position{.line = line, .character = character};
  return params;
}

// Hover request for HoverAt(1, 6) as the client writes it
constexpr auto kHoverRequest =
    R"({"jsonrpc":"2.0","id":7,"method":"textDocument/hover",)"
    R"("params":{"textDocument":{"uri":"file:///tmp/a.nu"},)"
    R"("position":{"line":1,"character":6}}})";

constexpr auto kHoverResponse = R"({"jsonrpc":"2.0","id":7,"result":null})";

}  // namespace

TEST_CASE("LspshimServer advertises its capabilities", "[server]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto backend = std::make_shared<FakeBackendInvoker>(executor);
    TestLspshimServer server(executor, nullptr, backend);

    auto result = co_await server.OnInitialize(lsp::InitializeParams{});
    REQUIRE(result.has_value());

    const auto& capabilities = result->capabilities;
    REQUIRE(capabilities.positionEncoding == lsp::PositionEncodingKind::kUtf16);
    REQUIRE(capabilities.hoverProvider == true);
    REQUIRE(capabilities.definitionProvider == true);
    REQUIRE(capabilities.completionProvider.has_value());
    REQUIRE(capabilities.inlayHintProvider.has_value());
    REQUIRE(result->serverInfo.has_value());
    REQUIRE(result->serverInfo->name == "lspshim");
  });
}

TEST_CASE("LspshimServer routes requests to the backend", "[server]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto backend = std::make_shared<FakeBackendInvoker>(executor);
    TestLspshimServer server(executor, nullptr, backend);

    auto initialize = co_await server.OnInitialize(lsp::InitializeParams{});
    REQUIRE(initialize.has_value());
    auto initialized = co_await server.OnInitialized(lsp::InitializedParams{});
    REQUIRE(initialized.has_value());

    auto opened = co_await server.OnDidOpenTextDocument(OpenParams());
    REQUIRE(opened.has_value());

    // No publishDiagnostics capability, so opening runs no check
    REQUIRE(backend->Requests().empty());

    backend->Reply("x: int\n");
    auto hover = co_await server.OnHover(HoverAt(1, 6));
    REQUIRE(hover.has_value());
    REQUIRE(hover->has_value());
    REQUIRE(std::get<std::string>((*hover)->contents) == "x: int");
    REQUIRE(backend->Requests().size() == 1);
    REQUIRE(backend->Requests()[0].argv.front() == "nu");

    backend->Reply("print\tfunction\n");
    lsp::CompletionParams completion_params;
    completion_params.textDocument = Identifier(kUri);
    completion_params.position = lsp::Position{.line = 1, .character = 2};
    auto completion = co_await server.OnCompletion(completion_params);
    REQUIRE(completion.has_value());
    REQUIRE(completion->has_value());
    REQUIRE((*completion)->items.size() == 1);
    REQUIRE((*completion)->items[0].label == "print");

    auto closed = co_await server.OnDidCloseTextDocument(
        lsp::DidCloseTextDocumentParams{.textDocument = Identifier(kUri)});
    REQUIRE(closed.has_value());

    auto after_close = co_await server.OnHover(HoverAt(0, 0));
    REQUIRE(!after_close.has_value());
    REQUIRE(after_close.error().Code() == LspErrorCode::kInvalidParams);

    auto shutdown = co_await server.OnShutdown(lsp::ShutdownParams{});
    REQUIRE(shutdown.has_value());
  });
}

TEST_CASE("LspshimServer rejects inlay hints for unknown URIs", "[server]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto backend = std::make_shared<FakeBackendInvoker>(executor);
    TestLspshimServer server(executor, nullptr, backend);

    lsp::InlayHintParams params;
    params.textDocument = Identifier("file:///tmp/missing.nu");
    auto result = co_await server.OnInlayHint(params);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().Code() == LspErrorCode::kInvalidParams);
  });
}

TEST_CASE("LspshimServer kills the backend of a cancelled hover", "[server]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    using namespace asio::experimental::awaitable_operators;

    auto cancellations = std::make_shared<lsp::CancellationRegistry>();
    auto backend = std::make_shared<ProcessBackendInvoker>(executor);
    TestLspshimServer server(executor, nullptr, backend, cancellations);

    auto configured = co_await server.OnDidChangeConfiguration(
        lsp::DidChangeConfigurationParams{
            .settings = nlohmann::json::parse(
                R"({"lspshim":{"executable":"/bin/sh",)"
                R"("args":["-c","exec sleep 5"],"timeoutMs":10000}})")});
    REQUIRE(configured.has_value());
    auto opened = co_await server.OnDidOpenTextDocument(OpenParams());
    REQUIRE(opened.has_value());

    cancellations->ObserveIncoming(kHoverRequest);

    auto cancel_later = [&]() -> asio::awaitable<void> {
      co_await Sleep(executor, 200ms);
      auto cancelled =
          co_await server.OnCancelRequest(lsp::CancelParams{.id = 7});
      REQUIRE(cancelled.has_value());
    };

    const auto started = std::chrono::steady_clock::now();
    auto hover =
        co_await (server.ServeHover(HoverAt(1, 6)) && cancel_later());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(!hover.has_value());
    REQUIRE(hover.error().Code() == LspErrorCode::kRequestCancelled);
    REQUIRE(elapsed < 3s);

    // The response the endpoint writes for it never reaches the client
    REQUIRE_FALSE(cancellations->ShouldSend(kHoverResponse));
    REQUIRE(cancellations->PendingCount() == 0);
  });
}

TEST_CASE(
    "LspshimServer skips the backend for requests cancelled before they run",
    "[server]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto cancellations = std::make_shared<lsp::CancellationRegistry>();
    auto backend = std::make_shared<FakeBackendInvoker>(executor);
    TestLspshimServer server(executor, nullptr, backend, cancellations);

    auto opened = co_await server.OnDidOpenTextDocument(OpenParams());
    REQUIRE(opened.has_value());

    cancellations->ObserveIncoming(kHoverRequest);
    auto cancelled =
        co_await server.OnCancelRequest(lsp::CancelParams{.id = 7});
    REQUIRE(cancelled.has_value());

    backend->Reply("x: int\n");
    auto hover = co_await server.ServeHover(HoverAt(1, 6));
    REQUIRE(!hover.has_value());
    REQUIRE(hover.error().Code() == LspErrorCode::kRequestCancelled);
    REQUIRE(backend->Requests().empty());
    REQUIRE_FALSE(cancellations->ShouldSend(kHoverResponse));
  });
}

TEST_CASE("LspshimServer serves requests nobody cancels", "[server]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    auto cancellations = std::make_shared<lsp::CancellationRegistry>();
    auto backend = std::make_shared<FakeBackendInvoker>(executor);
    TestLspshimServer server(executor, nullptr, backend, cancellations);

    auto opened = co_await server.OnDidOpenTextDocument(OpenParams());
    REQUIRE(opened.has_value());

    cancellations->ObserveIncoming(kHoverRequest);
    backend->Reply("x: int\n");
    auto hover = co_await server.ServeHover(HoverAt(1, 6));
    REQUIRE(hover.has_value());
    REQUIRE(hover->has_value());
    REQUIRE(cancellations->ShouldSend(kHoverResponse));
    REQUIRE(cancellations->PendingCount() == 0);
  });
}

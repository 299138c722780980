#include "lsp/cancellation.hpp"

#include <string>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using lsp::CancellationRegistry;

namespace {

constexpr auto kHoverRequest =
    R"({"jsonrpc":"2.0","id":7,"method":"textDocument/hover",)"
    R"("params":{"textDocument":{"uri":"file:///tmp/a.nu"},)"
    R"("position":{"line":1,"character":6}}})";

constexpr auto kHoverResponse = R"({"jsonrpc":"2.0","id":7,"result":null})";

auto Target(int line, int character) -> lsp::TextDocumentPositionParams {
  lsp::TextDocumentPositionParams target;
  target.textDocument.uri = "file:///tmp/a.nu";
  target.position = lsp::Position{.line = line, .character = character};
  return target;
}

}  // namespace

TEST_CASE("CancellationRegistry admits position requests", "[cancellation]") {
  CancellationRegistry registry;

  registry.ObserveIncoming(kHoverRequest);
  REQUIRE(registry.PendingCount() == 1);

  // Different position or method does not match
  REQUIRE_FALSE(registry.Claim("textDocument/hover", Target(0, 0)));
  REQUIRE_FALSE(registry.Claim("textDocument/completion", Target(1, 6)));

  auto ticket = registry.Claim("textDocument/hover", Target(1, 6));
  REQUIRE(ticket.has_value());
  REQUIRE(std::get<int>(ticket->id) == 7);
  REQUIRE(ticket->signal != nullptr);
  REQUIRE_FALSE(ticket->cancelled);

  // A claimed admission is not handed out twice
  REQUIRE_FALSE(registry.Claim("textDocument/hover", Target(1, 6)));

  REQUIRE(registry.ShouldSend(kHoverResponse));
  REQUIRE(registry.PendingCount() == 0);
}

TEST_CASE("CancellationRegistry ignores other messages", "[cancellation]") {
  CancellationRegistry registry;

  registry.ObserveIncoming("not json");
  registry.ObserveIncoming(
      R"({"jsonrpc":"2.0","method":"textDocument/didOpen","params":{}})");
  registry.ObserveIncoming(
      R"({"jsonrpc":"2.0","id":1,"method":"textDocument/inlayHint",)"
      R"("params":{}})");
  // Malformed params are left for the endpoint to reject
  registry.ObserveIncoming(
      R"({"jsonrpc":"2.0","id":2,"method":"textDocument/hover",)"
      R"("params":{"position":1}})");
  REQUIRE(registry.PendingCount() == 0);

  REQUIRE(registry.ShouldSend("not json"));
  REQUIRE(registry.ShouldSend(
      R"({"jsonrpc":"2.0","method":"window/logMessage","params":{}})"));
  REQUIRE(registry.ShouldSend(R"({"jsonrpc":"2.0","id":99,"result":null})"));
}

TEST_CASE(
    "CancellationRegistry drops the response of a cancelled request",
    "[cancellation]") {
  CancellationRegistry registry;
  registry.ObserveIncoming(kHoverRequest);

  auto ticket = registry.Claim("textDocument/hover", Target(1, 6));
  REQUIRE(ticket.has_value());

  bool emitted = false;
  ticket->signal->slot().assign([&emitted](asio::cancellation_type type) {
    emitted = (type & asio::cancellation_type::terminal) !=
              asio::cancellation_type::none;
  });

  REQUIRE(registry.Cancel(lsp::RequestId{7}));
  REQUIRE(emitted);

  REQUIRE_FALSE(registry.ShouldSend(kHoverResponse));
  REQUIRE(registry.PendingCount() == 0);
}

TEST_CASE(
    "CancellationRegistry marks requests cancelled before they run",
    "[cancellation]") {
  CancellationRegistry registry;
  registry.Admit(
      lsp::RequestId{std::string("abc")}, "textDocument/definition",
      "file:///tmp/a.nu", lsp::Position{.line = 1, .character = 6});

  REQUIRE(registry.Cancel(lsp::RequestId{std::string("abc")}));

  auto ticket = registry.Claim("textDocument/definition", Target(1, 6));
  REQUIRE(ticket.has_value());
  REQUIRE(ticket->cancelled);

  REQUIRE_FALSE(
      registry.ShouldSend(R"({"jsonrpc":"2.0","id":"abc","result":null})"));
}

TEST_CASE(
    "CancellationRegistry ignores cancels for unknown ids", "[cancellation]") {
  CancellationRegistry registry;
  REQUIRE_FALSE(registry.Cancel(lsp::RequestId{42}));
  REQUIRE(registry.PendingCount() == 0);
}

#include "lspshim/services/diagnostics_publisher.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <asio.hpp>
#include <asio/experimental/awaitable_operators.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/lspshim/common/async_fixture.hpp"
#include "test/lspshim/common/fake_backend_invoker.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using lspshim::ShimSettings;
using lspshim::SnapshotPtr;
using lspshim::backend::InvokeErrorKind;
using lspshim::services::DiagnosticsPublisher;
using lspshim::services::DocumentStore;
using lspshim::services::RequestDispatcher;
using lspshim::test::FakeBackendInvoker;
using lspshim::test::RunAsyncTest;
using lspshim::test::Sleep;
using namespace std::chrono_literals;

namespace {

constexpr auto kUri = "file:///tmp/a.nu";
constexpr auto kText = "let x = 1\nprint y";
constexpr auto kUnknownVariable = "2:6-2:7: error: unknown variable y\n";

struct Published {
  std::string uri;
  std::optional<int> version;
  std::vector<lsp::Diagnostic> diagnostics;
};

struct PublisherFixture {
  explicit PublisherFixture(asio::any_io_executor executor)
      : store(std::make_shared<DocumentStore>(executor)),
        backend(std::make_shared<FakeBackendInvoker>(executor)),
        dispatcher(std::make_shared<RequestDispatcher>(
            store, backend, Settings())),
        publisher(executor, store, dispatcher, Settings()) {
    publisher.SetDiagnosticPublisher(
        [this](
            std::string uri, std::optional<int> version,
            std::vector<lsp::Diagnostic> diagnostics)
            -> asio::awaitable<void> {
          published.push_back(Published{
              .uri = std::move(uri),
              .version = version,
              .diagnostics = std::move(diagnostics)});
          co_return;
        });
    publisher.SetMessageSink(
        [this](lsp::MessageType /*type*/, std::string message) {
          messages.push_back(std::move(message));
        });
  }

  auto Settings() -> RequestDispatcher::SettingsProvider {
    return [this](std::string /*uri*/) -> asio::awaitable<ShimSettings> {
      co_return settings;
    };
  }

  auto Open() -> asio::awaitable<SnapshotPtr> {
    auto opened = co_await store->Open(kUri, kText, 1, "nu");
    REQUIRE(opened.has_value());
    co_await publisher.OnDocumentOpened(*opened);
    co_return *opened;
  }

  // Apply a full replacement and notify the publisher like didChange does
  auto Change(int version, std::string text) -> asio::awaitable<SnapshotPtr> {
    auto changed = co_await store->ApplyChange(
        kUri, version,
        {lsp::TextDocumentContentFullChangeEvent{.text = std::move(text)}});
    REQUIRE(changed.has_value());
    publisher.OnDocumentChanged(*changed);
    co_return *changed;
  }

  ShimSettings settings;
  std::shared_ptr<DocumentStore> store;
  std::shared_ptr<FakeBackendInvoker> backend;
  std::shared_ptr<RequestDispatcher> dispatcher;
  DiagnosticsPublisher publisher;
  std::vector<Published> published;
  std::vector<std::string> messages;
};

auto Everything() -> lsp::Range {
  return lsp::Range{
      .start = {.line = 0, .character = 0},
      .end = {.line = 100, .character = 0}};
}

}  // namespace

TEST_CASE(
    "DiagnosticsPublisher publishes once when a document opens",
    "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    fixture.backend->Reply(kUnknownVariable);

    co_await fixture.Open();

    REQUIRE(fixture.published.size() == 1);
    const auto& published = fixture.published[0];
    REQUIRE(published.uri == kUri);
    REQUIRE(published.version == 1);
    REQUIRE(published.diagnostics.size() == 1);
    REQUIRE(published.diagnostics[0].message == "unknown variable y");
    REQUIRE(published.diagnostics[0].range.start.line == 1);
    REQUIRE(published.diagnostics[0].range.start.character == 6);
  });
}

TEST_CASE(
    "DiagnosticsPublisher keeps the last set when a check fails",
    "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    fixture.publisher.SetDebounceDelay(0ms);
    fixture.backend->Reply(kUnknownVariable);
    co_await fixture.Open();

    fixture.backend->Fail(InvokeErrorKind::kSpawnFailed);
    co_await fixture.Change(2, "let x = 1\nprint x");
    co_await Sleep(executor, 20ms);

    REQUIRE(fixture.backend->Requests().size() == 2);
    REQUIRE(fixture.published.size() == 1);
    REQUIRE(fixture.messages.size() == 1);
  });
}

TEST_CASE(
    "DiagnosticsPublisher publishes failing check output", "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    fixture.backend->Fail(InvokeErrorKind::kNonZeroExit, kUnknownVariable);

    co_await fixture.Open();

    REQUIRE(fixture.published.size() == 1);
    REQUIRE(fixture.published[0].diagnostics.size() == 1);
    REQUIRE(fixture.messages.empty());
  });
}

TEST_CASE(
    "DiagnosticsPublisher debounces bursts of changes", "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    fixture.publisher.SetDebounceDelay(40ms);
    fixture.backend->Reply(kUnknownVariable);
    co_await fixture.Open();

    fixture.backend->Reply("");
    co_await fixture.Change(2, "let x = 1\nprint x");
    co_await fixture.Change(3, "let x = 2\nprint x");
    co_await fixture.Change(4, "let x = 3\nprint x");
    co_await Sleep(executor, 200ms);

    // One check for the open, one for the whole burst
    REQUIRE(fixture.backend->Requests().size() == 2);
    REQUIRE(fixture.backend->Requests()[1].snapshot->Version() == 4);
    REQUIRE(fixture.published.size() == 2);
    REQUIRE(fixture.published[1].version == 4);
    REQUIRE(fixture.published[1].diagnostics.empty());
  });
}

TEST_CASE(
    "DiagnosticsPublisher drops results older than the published set",
    "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    using asio::experimental::awaitable_operators::operator&&;

    PublisherFixture fixture(executor);
    auto opened = co_await fixture.store->Open(kUri, kText, 1, "nu");
    REQUIRE(opened.has_value());
    auto changed = co_await fixture.store->ApplyChange(
        kUri, 2, {lsp::TextDocumentContentFullChangeEvent{.text = "ls"}});
    REQUIRE(changed.has_value());

    // The check of version 1 finishes last
    fixture.backend->SetHook(
        [executor](const lspshim::backend::BackendRequest& request)
            -> asio::awaitable<void> {
          if (request.snapshot->Version() == 1) {
            co_await Sleep(executor, 50ms);
          }
        });

    co_await (
        fixture.publisher.OnDocumentOpened(*opened) &&
        fixture.publisher.OnDocumentOpened(*changed));

    REQUIRE(fixture.backend->Requests().size() == 2);
    REQUIRE(fixture.published.size() == 1);
    REQUIRE(fixture.published[0].version == 2);
  });
}

TEST_CASE(
    "DiagnosticsPublisher drops results from a closed session",
    "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    using asio::experimental::awaitable_operators::operator&&;

    PublisherFixture fixture(executor);
    fixture.publisher.SetDebounceDelay(10ms);
    fixture.backend->Reply(kUnknownVariable);
    fixture.backend->Reply(kUnknownVariable);
    fixture.backend->Reply("");

    // The check of the first session is still running when it is closed
    fixture.backend->SetHook(
        [executor](const lspshim::backend::BackendRequest& request)
            -> asio::awaitable<void> {
          if (request.snapshot->Text() == "print old") {
            co_await Sleep(executor, 80ms);
          }
        });

    auto first_session = [&]() -> asio::awaitable<void> {
      auto opened = co_await fixture.store->Open(kUri, "print old", 5, "nu");
      REQUIRE(opened.has_value());
      co_await fixture.publisher.OnDocumentOpened(*opened);
    };
    auto reopen = [&]() -> asio::awaitable<void> {
      co_await Sleep(executor, 10ms);
      auto closed = co_await fixture.store->Close(kUri);
      REQUIRE(closed.has_value());
      co_await fixture.publisher.OnDocumentClosed(kUri);
      co_await fixture.Open();
    };
    co_await (first_session() && reopen());

    REQUIRE(fixture.backend->Requests().size() == 2);
    REQUIRE(fixture.published.size() == 2);
    REQUIRE(!fixture.published[0].version.has_value());
    REQUIRE(fixture.published[1].version == 1);

    // Versions of the new session are published from 1 upward
    co_await fixture.Change(2, "print z");
    co_await Sleep(executor, 100ms);
    REQUIRE(fixture.backend->Requests().size() == 3);
    REQUIRE(fixture.published.size() == 3);
    REQUIRE(fixture.published[2].version == 2);
    REQUIRE(fixture.published[2].diagnostics.empty());
  });
}

TEST_CASE(
    "DiagnosticsPublisher clears diagnostics on close", "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    fixture.publisher.SetDebounceDelay(30ms);
    fixture.backend->Reply(kUnknownVariable);
    co_await fixture.Open();

    // A change still waiting on the debounce must not run after close
    co_await fixture.Change(2, "print z");
    auto closed = co_await fixture.store->Close(kUri);
    REQUIRE(closed.has_value());
    co_await fixture.publisher.OnDocumentClosed(kUri);
    co_await Sleep(executor, 100ms);

    REQUIRE(fixture.backend->Requests().size() == 1);
    REQUIRE(fixture.published.size() == 2);
    REQUIRE(fixture.published[1].uri == kUri);
    REQUIRE(!fixture.published[1].version.has_value());
    REQUIRE(fixture.published[1].diagnostics.empty());
    REQUIRE(fixture.publisher.GetInlayHints(kUri, Everything()).empty());
  });
}

TEST_CASE("DiagnosticsPublisher caps the number of problems", "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    fixture.settings.diagnostics.max_problems = 2;
    fixture.backend->Reply(
        "1:0: error: first\n"
        "1:1: warning: second\n"
        "2:0: hint: third\n");

    co_await fixture.Open();

    REQUIRE(fixture.published.size() == 1);
    REQUIRE(fixture.published[0].diagnostics.size() == 2);
    REQUIRE(fixture.published[0].diagnostics[1].message == "second");
  });
}

TEST_CASE("DiagnosticsPublisher keeps inlay hints", "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);

    SECTION("Hints are served by range") {
      fixture.backend->Reply("1:5: inlay: : int\n");
      co_await fixture.Open();

      auto hints = fixture.publisher.GetInlayHints(kUri, Everything());
      REQUIRE(hints.size() == 1);
      REQUIRE(hints[0].label == ": int");
      REQUIRE(hints[0].position.line == 0);
      REQUIRE(hints[0].position.character == 5);

      auto second_line = fixture.publisher.GetInlayHints(
          kUri,
          lsp::Range{
              .start = {.line = 1, .character = 0},
              .end = {.line = 1, .character = 7}});
      REQUIRE(second_line.empty());
    }

    SECTION("Hints can be turned off") {
      fixture.settings.diagnostics.inlay_hints = false;
      fixture.backend->Reply("1:5: inlay: : int\n");
      co_await fixture.Open();

      REQUIRE(fixture.publisher.GetInlayHints(kUri, Everything()).empty());
    }
  });
}

TEST_CASE(
    "DiagnosticsPublisher skips checks the client cannot receive",
    "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);

    SECTION("Client without publishDiagnostics") {
      fixture.publisher.SetEnabled(false);
      co_await fixture.Open();
      auto closed = co_await fixture.store->Close(kUri);
      REQUIRE(closed.has_value());
      co_await fixture.publisher.OnDocumentClosed(kUri);
    }

    SECTION("Check capability disabled") {
      fixture.settings.capabilities.check.enabled = false;
      co_await fixture.Open();
    }

    REQUIRE(fixture.backend->Requests().empty());
    REQUIRE(fixture.published.empty());
  });
}

TEST_CASE(
    "DiagnosticsPublisher revalidates every open document", "[diagnostics]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    PublisherFixture fixture(executor);
    auto first = co_await fixture.store->Open("file:///tmp/a.nu", "", 1, "nu");
    auto second = co_await fixture.store->Open("file:///tmp/b.nu", "", 1, "nu");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());

    co_await fixture.publisher.RevalidateAll();

    REQUIRE(fixture.backend->Requests().size() == 2);
    REQUIRE(fixture.published.size() == 2);
  });
}

#include "lspshim/backend/process_backend_invoker.hpp"

#include <chrono>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

#include "test/lspshim/common/async_fixture.hpp"

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using lspshim::backend::BackendRequest;
using lspshim::backend::CapabilityKind;
using lspshim::backend::InvokeErrorKind;
using lspshim::backend::ProcessBackendInvoker;
using lspshim::test::RunAsyncTest;
using lspshim::test::Sleep;
using namespace std::chrono_literals;

namespace {

constexpr auto kDefaultTimeout = std::chrono::milliseconds(5000);

auto ShellRequest(std::string script, std::string text = "")
    -> BackendRequest {
  return BackendRequest{
      .kind = CapabilityKind::kCheck,
      .snapshot = lspshim::MakeSnapshot("file:///tmp/a.nu", std::move(text), 1),
      .argv = {"/bin/sh", "-c", std::move(script)},
  };
}

}  // namespace

TEST_CASE("ProcessBackendInvoker feeds the text on stdin", "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ProcessBackendInvoker invoker(executor);

    auto result = co_await invoker.Invoke(
        ShellRequest("cat", "let x = 1\nprint x"), kDefaultTimeout);
    REQUIRE(result.has_value());
    REQUIRE(result->output == "let x = 1\nprint x");
    REQUIRE(result->exit_status == 0);
  });
}

TEST_CASE(
    "ProcessBackendInvoker streams input larger than a pipe buffer",
    "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ProcessBackendInvoker invoker(executor);
    const std::string text(256 * 1024, 'x');

    auto result =
        co_await invoker.Invoke(ShellRequest("cat", text), kDefaultTimeout);
    REQUIRE(result.has_value());
    REQUIRE(result->output.size() == text.size());
  });
}

TEST_CASE("ProcessBackendInvoker captures stderr separately", "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ProcessBackendInvoker invoker(executor);

    auto result = co_await invoker.Invoke(
        ShellRequest("echo out; echo oops >&2"), kDefaultTimeout);
    REQUIRE(result.has_value());
    REQUIRE(result->output == "out\n");
    REQUIRE(result->error_output == "oops\n");
  });
}

TEST_CASE(
    "ProcessBackendInvoker reports non-zero exit with its output",
    "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ProcessBackendInvoker invoker(executor);

    auto result = co_await invoker.Invoke(
        ShellRequest("echo partial; exit 3"), kDefaultTimeout);
    REQUIRE(!result.has_value());
    REQUIRE(result.error().kind == InvokeErrorKind::kNonZeroExit);
    REQUIRE(result.error().result.has_value());
    REQUIRE(result.error().result->output == "partial\n");
    REQUIRE(result.error().result->exit_status == 3);
  });
}

TEST_CASE("ProcessBackendInvoker kills a backend on timeout", "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ProcessBackendInvoker invoker(executor);

    const auto start = std::chrono::steady_clock::now();
    auto result = co_await invoker.Invoke(ShellRequest("sleep 5"), 100ms);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(!result.has_value());
    REQUIRE(result.error().kind == InvokeErrorKind::kTimeout);
    REQUIRE(elapsed < 3s);
  });
}

TEST_CASE("ProcessBackendInvoker reports spawn failures", "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    ProcessBackendInvoker invoker(executor);

    SECTION("Missing executable") {
      auto request = ShellRequest("");
      request.argv = {"/nonexistent/lspshim-test-backend", "--ide-check"};
      auto result = co_await invoker.Invoke(request, kDefaultTimeout);
      REQUIRE(!result.has_value());
      REQUIRE(result.error().kind == InvokeErrorKind::kSpawnFailed);
    }

    SECTION("Empty command line") {
      auto request = ShellRequest("");
      request.argv.clear();
      auto result = co_await invoker.Invoke(request, kDefaultTimeout);
      REQUIRE(!result.has_value());
      REQUIRE(result.error().kind == InvokeErrorKind::kSpawnFailed);
    }
  });
}

TEST_CASE("ProcessBackendInvoker abandons a cancelled call", "[invoker]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    using Outcome = std::expected<
        lspshim::backend::BackendResult, lspshim::backend::InvokeError>;

    ProcessBackendInvoker invoker(executor);
    asio::cancellation_signal signal;
    std::optional<Outcome> outcome;

    const auto start = std::chrono::steady_clock::now();
    asio::co_spawn(
        executor, invoker.Invoke(ShellRequest("sleep 5"), 10s),
        asio::bind_cancellation_slot(
            signal.slot(),
            [&outcome](std::exception_ptr error, Outcome result) {
              if (!error) {
                outcome = std::move(result);
              }
            }));

    co_await Sleep(executor, 100ms);
    signal.emit(asio::cancellation_type::terminal);

    for (int i = 0; i < 300 && !outcome; ++i) {
      co_await Sleep(executor, 10ms);
    }

    REQUIRE(outcome.has_value());
    REQUIRE(!outcome->has_value());
    REQUIRE(outcome->error().kind == InvokeErrorKind::kCancelled);
    REQUIRE(std::chrono::steady_clock::now() - start < 3s);
  });
}

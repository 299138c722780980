#include "lspshim/services/debounce_policy.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

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

using lspshim::services::CheckTask;
using lspshim::services::EagerPolicy;
using lspshim::services::MakeDebouncePolicy;
using lspshim::services::TimerDebouncePolicy;
using lspshim::test::RunAsyncTest;
using lspshim::test::Sleep;
using namespace std::chrono_literals;

namespace {

// Task that counts its runs per URI
auto CountingTask(std::map<std::string, int>& runs, std::string uri)
    -> CheckTask {
  return [&runs, uri]() -> asio::awaitable<void> {
    ++runs[uri];
    co_return;
  };
}

}  // namespace

TEST_CASE("TimerDebouncePolicy collapses bursts", "[debounce]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    TimerDebouncePolicy policy(executor, 30ms);
    std::map<std::string, int> runs;

    for (int i = 0; i < 5; ++i) {
      policy.Schedule("file:///a.nu", CountingTask(runs, "file:///a.nu"));
      co_await Sleep(executor, 5ms);
    }
    REQUIRE(policy.PendingCount() == 1);
    REQUIRE(runs.empty());

    co_await Sleep(executor, 150ms);
    REQUIRE(runs["file:///a.nu"] == 1);
    REQUIRE(policy.PendingCount() == 0);
  });
}

TEST_CASE("TimerDebouncePolicy keeps documents apart", "[debounce]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    TimerDebouncePolicy policy(executor, 20ms);
    std::map<std::string, int> runs;

    policy.Schedule("file:///a.nu", CountingTask(runs, "file:///a.nu"));
    policy.Schedule("file:///b.nu", CountingTask(runs, "file:///b.nu"));
    REQUIRE(policy.PendingCount() == 2);

    co_await Sleep(executor, 120ms);
    REQUIRE(runs["file:///a.nu"] == 1);
    REQUIRE(runs["file:///b.nu"] == 1);
  });
}

TEST_CASE("TimerDebouncePolicy cancel drops pending work", "[debounce]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    TimerDebouncePolicy policy(executor, 20ms);
    std::map<std::string, int> runs;

    policy.Schedule("file:///a.nu", CountingTask(runs, "file:///a.nu"));
    policy.Cancel("file:///a.nu");
    REQUIRE(policy.PendingCount() == 0);

    co_await Sleep(executor, 100ms);
    REQUIRE(runs.empty());
  });
}

TEST_CASE(
    "TimerDebouncePolicy pending work dies with the policy", "[debounce]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    std::map<std::string, int> runs;
    {
      TimerDebouncePolicy policy(executor, 20ms);
      policy.Schedule("file:///a.nu", CountingTask(runs, "file:///a.nu"));
    }

    co_await Sleep(executor, 100ms);
    REQUIRE(runs.empty());
  });
}

TEST_CASE("EagerPolicy runs every request", "[debounce]") {
  RunAsyncTest([](asio::any_io_executor executor) -> asio::awaitable<void> {
    EagerPolicy policy(executor);
    std::map<std::string, int> runs;

    policy.Schedule("file:///a.nu", CountingTask(runs, "file:///a.nu"));
    policy.Schedule("file:///a.nu", CountingTask(runs, "file:///a.nu"));
    REQUIRE(policy.PendingCount() == 0);

    co_await Sleep(executor, 10ms);
    REQUIRE(runs["file:///a.nu"] == 2);
  });
}

TEST_CASE("MakeDebouncePolicy picks the policy from the delay", "[debounce]") {
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  auto eager = MakeDebouncePolicy(executor, 0ms);
  REQUIRE(dynamic_cast<EagerPolicy*>(eager.get()) != nullptr);

  auto timed = MakeDebouncePolicy(executor, 250ms);
  auto* timer_policy = dynamic_cast<TimerDebouncePolicy*>(timed.get());
  REQUIRE(timer_policy != nullptr);
  REQUIRE(timer_policy->Delay() == 250ms);
}

#include "app/app_setup.hpp"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

TEST_CASE("ParsePipeName accepts both spellings", "[app]") {
  using Args = std::vector<std::string>;

  REQUIRE(
      app::ParsePipeName(Args{"lspshim", "--pipe=/tmp/lsp.sock"}) ==
      "/tmp/lsp.sock");
  REQUIRE(
      app::ParsePipeName(Args{"lspshim", "--stdio", "--pipe", "/tmp/lsp.sock"})
      == "/tmp/lsp.sock");

  REQUIRE(!app::ParsePipeName(Args{"lspshim"}).has_value());
  REQUIRE(!app::ParsePipeName(Args{"lspshim", "--pipe="}).has_value());
  REQUIRE(!app::ParsePipeName(Args{"lspshim", "--pipe"}).has_value());
  REQUIRE(!app::ParsePipeName(Args{"lspshim", "--piped=x"}).has_value());
}

TEST_CASE("SetupLoggers registers the named loggers", "[app]") {
  auto loggers = app::SetupLoggers();

  for (const auto* name : {"transport", "jsonrpc", "lspshim", "backend"}) {
    INFO(name);
    REQUIRE(loggers.contains(name));
    REQUIRE(spdlog::get(name) == loggers[name]);
  }
  REQUIRE(loggers["jsonrpc"]->level() == spdlog::level::info);
}

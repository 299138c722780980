#include "lspshim/backend/command_builder.hpp"

#include <optional>
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

using lspshim::backend::BuildBackendRequest;
using lspshim::backend::CapabilityKind;

namespace {

using Argv = std::vector<std::string>;

auto NuSettings() -> lspshim::ShimSettings {
  lspshim::ShimSettings settings;
  settings.backend.executable = "nu";
  settings.backend.args = {"--no-config-file"};
  settings.backend.include_dirs = {"lib"};
  return settings;
}

auto Cursor(int line, int character) -> std::optional<lsp::Position> {
  return lsp::Position{.line = line, .character = character};
}

}  // namespace

TEST_CASE("BuildBackendRequest lays out the command line", "[command]") {
  auto snapshot =
      lspshim::MakeSnapshot("file:///tmp/a.nu", "let x = 1\r\nprint x", 4);
  auto settings = NuSettings();

  SECTION("Hover in line-column mode") {
    auto request = BuildBackendRequest(
        CapabilityKind::kHover, snapshot, Cursor(1, 7), settings);

    const Argv expected = {
        "nu",          "--no-config-file", "--include-path", "lib",
        "--ide-hover", "2:7",              "/tmp/a.nu"};
    REQUIRE(request.argv == expected);
    REQUIRE(request.kind == CapabilityKind::kHover);
    REQUIRE(request.snapshot == snapshot);
    REQUIRE(request.position.has_value());
    REQUIRE(request.position->line == 2);
    REQUIRE(request.position->column == 7);
    REQUIRE(!request.offset.has_value());
  }

  SECTION("Completion in offset mode") {
    settings.position.mode = lspshim::PositionMode::kOffset;
    auto request = BuildBackendRequest(
        CapabilityKind::kCompletion, snapshot, Cursor(1, 6), settings);

    REQUIRE(request.argv.size() == 7);
    REQUIRE(request.argv[4] == "--ide-complete");
    REQUIRE(request.argv[5] == "17");
    REQUIRE(request.offset == 17);
    REQUIRE(!request.position.has_value());
  }

  SECTION("Check has no cursor") {
    settings.backend.args.clear();
    settings.backend.include_dirs.clear();
    auto request = BuildBackendRequest(
        CapabilityKind::kCheck, snapshot, std::nullopt, settings);
    REQUIRE(request.argv == Argv{"nu", "--ide-check", "/tmp/a.nu"});
  }

  SECTION("Flags follow the configuration") {
    settings.capabilities.definition.flag = "--goto";
    auto request = BuildBackendRequest(
        CapabilityKind::kDefinition, snapshot, Cursor(0, 4), settings);
    REQUIRE(request.argv[4] == "--goto");
    REQUIRE(request.argv[5] == "1:4");
  }
}

TEST_CASE(
    "BuildBackendRequest appends no path for non-file URIs", "[command]") {
  auto snapshot = lspshim::MakeSnapshot("untitled:Untitled-1", "ls", 1);
  lspshim::ShimSettings settings;

  auto request = BuildBackendRequest(
      CapabilityKind::kHover, snapshot, Cursor(0, 1), settings);
  REQUIRE(request.argv == Argv{"nu", "--ide-hover", "1:1"});
}

TEST_CASE("BuildBackendRequest decodes escaped file URIs", "[command]") {
  auto snapshot =
      lspshim::MakeSnapshot("file:///tmp/my%20dir/a.nu", "ls", 1);
  lspshim::ShimSettings settings;

  auto request = BuildBackendRequest(
      CapabilityKind::kCheck, snapshot, std::nullopt, settings);
  REQUIRE(request.argv.back() == "/tmp/my dir/a.nu");
}

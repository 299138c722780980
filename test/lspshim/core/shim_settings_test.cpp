#include "lspshim/core/shim_settings.hpp"

#include <chrono>
#include <string>
#include <vector>

#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

constexpr auto kLogLevel = spdlog::level::debug;

auto main(int argc, char* argv[]) -> int {
  spdlog::set_level(kLogLevel);
  spdlog::set_pattern("[%l] %v");

  return Catch::Session().run(argc, argv);
}

using lspshim::ShimSettings;
using namespace std::chrono_literals;

TEST_CASE("ShimSettings defaults", "[settings]") {
  ShimSettings settings;
  REQUIRE(settings.backend.executable == "nu");
  REQUIRE(settings.backend.timeout == 10000ms);
  REQUIRE(settings.capabilities.hover.flag == "--ide-hover");
  REQUIRE(settings.capabilities.completion.flag == "--ide-complete");
  REQUIRE(settings.capabilities.definition.flag == "--ide-goto-def");
  REQUIRE(settings.capabilities.check.flag == "--ide-check");
  REQUIRE(settings.position.convention.line_base == 1);
  REQUIRE(settings.position.convention.column_base == 0);
  REQUIRE(
      settings.position.convention.column_unit == lspshim::ColumnUnit::kBytes);
  REQUIRE(settings.diagnostics.debounce == 500ms);
  REQUIRE(settings.diagnostics.max_problems == 1000);
}

TEST_CASE("ApplyClientSettings overlays known fields", "[settings]") {
  ShimSettings settings;
  auto json = nlohmann::json::parse(R"({
    "executable": "/opt/nu/bin/nu",
    "includeDirs": ["lib"],
    "maxInvocationTime": 3000,
    "maxNumberOfProblems": 10,
    "capabilities": {"hover": {"enabled": false}, "check": {"flag": "--lint"}},
    "position": {"lineBase": 0, "columnUnit": "codepoints", "mode": "offset"},
    "diagnostics": {"debounceMs": 0},
    "hints": {"showInferredTypes": false}
  })");

  lspshim::ApplyClientSettings(json, settings);

  REQUIRE(settings.backend.executable == "/opt/nu/bin/nu");
  REQUIRE(settings.backend.include_dirs == std::vector<std::string>{"lib"});
  REQUIRE(settings.backend.timeout == 3000ms);
  REQUIRE(settings.diagnostics.max_problems == 10);
  REQUIRE(!settings.capabilities.hover.enabled);
  REQUIRE(settings.capabilities.check.enabled);
  REQUIRE(settings.capabilities.check.flag == "--lint");
  REQUIRE(settings.position.convention.line_base == 0);
  REQUIRE(
      settings.position.convention.column_unit ==
      lspshim::ColumnUnit::kCodepoints);
  REQUIRE(settings.position.mode == lspshim::PositionMode::kOffset);
  REQUIRE(settings.diagnostics.debounce == 0ms);
  REQUIRE(!settings.diagnostics.inlay_hints);
}

TEST_CASE("ApplyClientSettings ignores malformed fields", "[settings]") {
  ShimSettings settings;
  settings.backend.executable = "nu-nightly";
  auto json = nlohmann::json::parse(R"({
    "executable": 42,
    "maxInvocationTime": -5,
    "includeDirs": "lib",
    "position": {"columnUnit": "furlongs"},
    "unknownSetting": true
  })");

  lspshim::ApplyClientSettings(json, settings);

  REQUIRE(settings.backend.executable == "nu-nightly");
  REQUIRE(settings.backend.timeout == 10000ms);
  REQUIRE(settings.backend.include_dirs.empty());
  REQUIRE(
      settings.position.convention.column_unit == lspshim::ColumnUnit::kBytes);

  SECTION("Non-object settings change nothing") {
    lspshim::ApplyClientSettings(nlohmann::json::array({1, 2}), settings);
    lspshim::ApplyClientSettings(nullptr, settings);
    REQUIRE(settings.backend.executable == "nu-nightly");
  }
}

TEST_CASE("ApplyClientSettings requires a positive timeout", "[settings]") {
  ShimSettings settings;

  SECTION("timeoutMs") {
    lspshim::ApplyClientSettings(
        nlohmann::json::parse(R"({"timeoutMs": 0})"), settings);
    REQUIRE(settings.backend.timeout == 10000ms);
  }

  SECTION("maxInvocationTime") {
    lspshim::ApplyClientSettings(
        nlohmann::json::parse(R"({"maxInvocationTime": 0})"), settings);
    REQUIRE(settings.backend.timeout == 10000ms);
  }

  SECTION("A zero debounce is allowed") {
    lspshim::ApplyClientSettings(
        nlohmann::json::parse(
            R"({"timeoutMs": 1, "diagnostics": {"debounceMs": 0}})"),
        settings);
    REQUIRE(settings.backend.timeout == 1ms);
    REQUIRE(settings.diagnostics.debounce == 0ms);
  }
}

TEST_CASE("CapabilitiesSettings selects by kind", "[settings]") {
  ShimSettings settings;
  using lspshim::backend::CapabilityKind;

  settings.capabilities.For(CapabilityKind::kCompletion).enabled = false;
  REQUIRE(!settings.capabilities.completion.enabled);
  REQUIRE(
      settings.capabilities.For(CapabilityKind::kDefinition).flag ==
      "--ide-goto-def");
}

TEST_CASE("Position option names", "[settings]") {
  REQUIRE(lspshim::ParseColumnUnit("Bytes") == lspshim::ColumnUnit::kBytes);
  REQUIRE(
      lspshim::ParseColumnUnit("characters") ==
      lspshim::ColumnUnit::kCodepoints);
  REQUIRE(!lspshim::ParseColumnUnit("utf-16").has_value());
  REQUIRE(
      lspshim::ParsePositionMode("line-column") ==
      lspshim::PositionMode::kLineColumn);
  REQUIRE(!lspshim::ParsePositionMode("lines").has_value());
}

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lspshim/backend/backend_request.hpp"
#include "lspshim/document/position_codec.hpp"

namespace lspshim {

struct BackendSettings {
  std::string executable = "nu";
  std::vector<std::string> args;
  std::chrono::milliseconds timeout{10000};

  // Each entry is passed as `--include-path <dir>`
  std::vector<std::string> include_dirs;
};

struct CapabilitySettings {
  bool enabled = true;
  std::string flag;
};

struct CapabilitiesSettings {
  CapabilitySettings hover{.enabled = true, .flag = "--ide-hover"};
  CapabilitySettings completion{.enabled = true, .flag = "--ide-complete"};
  CapabilitySettings definition{.enabled = true, .flag = "--ide-goto-def"};
  CapabilitySettings check{.enabled = true, .flag = "--ide-check"};

  [[nodiscard]] auto For(backend::CapabilityKind kind) const
      -> const CapabilitySettings&;
  auto For(backend::CapabilityKind kind) -> CapabilitySettings&;
};

struct PositionSettings {
  BackendConvention convention;
  PositionMode mode = PositionMode::kLineColumn;
};

struct DiagnosticsSettings {
  // Zero runs the check eagerly on every change
  std::chrono::milliseconds debounce{500};
  int max_problems = 1000;
  bool inlay_hints = true;
};

// Everything the adapter needs to run the backend for one document
struct ShimSettings {
  BackendSettings backend;
  CapabilitiesSettings capabilities;
  PositionSettings position;
  DiagnosticsSettings diagnostics;
};

// Overlay client-supplied settings (camelCase JSON, the `lspshim` section)
// onto `settings`. Malformed fields are logged and leave the previous value.
void ApplyClientSettings(
    const nlohmann::json& json, ShimSettings& settings,
    std::shared_ptr<spdlog::logger> logger = nullptr);

auto ParseColumnUnit(std::string_view text) -> std::optional<ColumnUnit>;
auto ParsePositionMode(std::string_view text) -> std::optional<PositionMode>;

}  // namespace lspshim

#include "lspshim/core/shim_settings.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

namespace lspshim {

namespace {

auto ToLower(std::string_view text) -> std::string {
  std::string result(text);
  std::ranges::transform(result, result.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return result;
}

// Read `key` into `target` when present and well-typed
template <typename T>
void ReadField(
    const nlohmann::json& json, const char* key, T& target,
    spdlog::logger& logger) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    logger.warn("Ignoring malformed setting '{}': {}", key, e.what());
  }
}

// Durations must be positive; `allow_zero` admits 0 as well
void ReadMilliseconds(
    const nlohmann::json& json, const char* key,
    std::chrono::milliseconds& target, spdlog::logger& logger,
    bool allow_zero = false) {
  std::int64_t value = target.count();
  ReadField(json, key, value, logger);
  if (value < 0 || (value == 0 && !allow_zero)) {
    logger.warn("Ignoring out-of-range setting '{}': {}", key, value);
    return;
  }
  target = std::chrono::milliseconds(value);
}

void ReadCapability(
    const nlohmann::json& json, const char* key, CapabilitySettings& target,
    spdlog::logger& logger) {
  auto it = json.find(key);
  if (it == json.end() || !it->is_object()) {
    return;
  }
  ReadField(*it, "enabled", target.enabled, logger);
  ReadField(*it, "flag", target.flag, logger);
}

}  // namespace

auto CapabilitiesSettings::For(backend::CapabilityKind kind) const
    -> const CapabilitySettings& {
  switch (kind) {
    case backend::CapabilityKind::kHover:
      return hover;
    case backend::CapabilityKind::kCompletion:
      return completion;
    case backend::CapabilityKind::kDefinition:
      return definition;
    case backend::CapabilityKind::kCheck:
      return check;
  }
  return check;
}

auto CapabilitiesSettings::For(backend::CapabilityKind kind)
    -> CapabilitySettings& {
  return const_cast<CapabilitySettings&>(
      static_cast<const CapabilitiesSettings&>(*this).For(kind));
}

auto ParseColumnUnit(std::string_view text) -> std::optional<ColumnUnit> {
  auto lowered = ToLower(text);
  if (lowered == "bytes" || lowered == "byte") {
    return ColumnUnit::kBytes;
  }
  if (lowered == "codepoints" || lowered == "characters") {
    return ColumnUnit::kCodepoints;
  }
  return std::nullopt;
}

auto ParsePositionMode(std::string_view text) -> std::optional<PositionMode> {
  auto lowered = ToLower(text);
  if (lowered == "line-column") {
    return PositionMode::kLineColumn;
  }
  if (lowered == "offset") {
    return PositionMode::kOffset;
  }
  return std::nullopt;
}

void ApplyClientSettings(
    const nlohmann::json& json, ShimSettings& settings,
    std::shared_ptr<spdlog::logger> logger) {
  if (!logger) {
    logger = spdlog::default_logger();
  }
  if (!json.is_object()) {
    if (!json.is_null()) {
      logger->warn("Ignoring client settings: expected an object");
    }
    return;
  }

  // Backend
  ReadField(json, "executable", settings.backend.executable, *logger);
  ReadField(json, "args", settings.backend.args, *logger);
  ReadField(json, "includeDirs", settings.backend.include_dirs, *logger);
  ReadMilliseconds(
      json, "maxInvocationTime", settings.backend.timeout, *logger);
  ReadMilliseconds(json, "timeoutMs", settings.backend.timeout, *logger);

  // Capabilities
  if (auto it = json.find("capabilities");
      it != json.end() && it->is_object()) {
    ReadCapability(*it, "hover", settings.capabilities.hover, *logger);
    ReadCapability(
        *it, "completion", settings.capabilities.completion, *logger);
    ReadCapability(
        *it, "definition", settings.capabilities.definition, *logger);
    ReadCapability(*it, "check", settings.capabilities.check, *logger);
  }

  // Position
  if (auto it = json.find("position"); it != json.end() && it->is_object()) {
    auto& position = settings.position;
    ReadField(*it, "lineBase", position.convention.line_base, *logger);
    ReadField(*it, "columnBase", position.convention.column_base, *logger);

    std::string unit;
    ReadField(*it, "columnUnit", unit, *logger);
    if (!unit.empty()) {
      if (auto parsed = ParseColumnUnit(unit)) {
        position.convention.column_unit = *parsed;
      } else {
        logger->warn("Ignoring unknown column unit '{}'", unit);
      }
    }

    std::string mode;
    ReadField(*it, "mode", mode, *logger);
    if (!mode.empty()) {
      if (auto parsed = ParsePositionMode(mode)) {
        position.mode = *parsed;
      } else {
        logger->warn("Ignoring unknown position mode '{}'", mode);
      }
    }
  }

  // Diagnostics
  ReadField(
      json, "maxNumberOfProblems", settings.diagnostics.max_problems, *logger);
  if (auto it = json.find("diagnostics");
      it != json.end() && it->is_object()) {
    ReadMilliseconds(
        *it, "debounceMs", settings.diagnostics.debounce, *logger, true);
  }
  if (auto it = json.find("hints"); it != json.end() && it->is_object()) {
    ReadField(
        *it, "showInferredTypes", settings.diagnostics.inlay_hints, *logger);
  }
}

}  // namespace lspshim

#include "lspshim/core/shim_config_file.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include <yaml-cpp/yaml.h>

#include <spdlog/spdlog.h>

namespace lspshim {

namespace {

void LoadCapability(const YAML::Node& node, CapabilitySettings& capability) {
  if (!node) {
    return;
  }
  if (node.IsScalar()) {
    // Short form: Hover: false
    capability.enabled = node.as<bool>();
    return;
  }
  if (node["Enabled"]) {
    capability.enabled = node["Enabled"].as<bool>();
  }
  if (node["Flag"]) {
    capability.flag = node["Flag"].as<std::string>();
  }
}

// Durations must be positive; `allow_zero` admits 0 as well
void LoadMilliseconds(
    const YAML::Node& node, std::chrono::milliseconds& target,
    const std::string& name, spdlog::logger& logger, bool allow_zero = false) {
  if (!node) {
    return;
  }
  auto value = node.as<std::int64_t>();
  if (value < 0 || (value == 0 && !allow_zero)) {
    logger.warn("Ignoring out-of-range {}: {}", name, value);
    return;
  }
  target = std::chrono::milliseconds(value);
}

}  // namespace

ShimConfigFile::ShimConfigFile(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto ShimConfigFile::LoadFromFile(
    const std::filesystem::path& config_path,
    std::shared_ptr<spdlog::logger> logger) -> std::optional<ShimConfigFile> {
  ShimConfigFile config(logger);

  if (!std::filesystem::exists(config_path)) {
    config.logger_->debug(
        "No .lspshim configuration file found at {}", config_path.string());
    return std::nullopt;
  }

  try {
    // Load YAML file
    YAML::Node yaml = YAML::LoadFile(config_path.string());
    auto& settings = config.settings_;

    // Parse Backend section
    if (const auto backend = yaml["Backend"]) {
      config.has_any_settings_ = true;
      if (backend["Executable"]) {
        settings.backend.executable = backend["Executable"].as<std::string>();
      }
      if (backend["Args"]) {
        settings.backend.args.clear();
        for (const auto& arg : backend["Args"]) {
          settings.backend.args.push_back(arg.as<std::string>());
        }
      }
      LoadMilliseconds(
          backend["TimeoutMs"], settings.backend.timeout, "Backend.TimeoutMs",
          *config.logger_);
      if (backend["IncludeDirs"]) {
        settings.backend.include_dirs.clear();
        for (const auto& dir : backend["IncludeDirs"]) {
          settings.backend.include_dirs.push_back(dir.as<std::string>());
        }
      }
    }

    // Parse Capabilities section
    if (const auto capabilities = yaml["Capabilities"]) {
      config.has_any_settings_ = true;
      LoadCapability(capabilities["Hover"], settings.capabilities.hover);
      LoadCapability(
          capabilities["Completion"], settings.capabilities.completion);
      LoadCapability(
          capabilities["Definition"], settings.capabilities.definition);
      LoadCapability(capabilities["Check"], settings.capabilities.check);
    }

    // Parse Position section
    if (const auto position = yaml["Position"]) {
      config.has_any_settings_ = true;
      auto& convention = settings.position.convention;
      if (position["LineBase"]) {
        convention.line_base = position["LineBase"].as<int>();
      }
      if (position["ColumnBase"]) {
        convention.column_base = position["ColumnBase"].as<int>();
      }
      if (position["ColumnUnit"]) {
        auto raw = position["ColumnUnit"].as<std::string>();
        if (auto unit = ParseColumnUnit(raw)) {
          convention.column_unit = *unit;
        } else {
          config.logger_->warn("Unknown Position.ColumnUnit '{}'", raw);
        }
      }
      if (position["Mode"]) {
        auto raw = position["Mode"].as<std::string>();
        if (auto mode = ParsePositionMode(raw)) {
          settings.position.mode = *mode;
        } else {
          config.logger_->warn("Unknown Position.Mode '{}'", raw);
        }
      }
    }

    // Parse Diagnostics section
    if (const auto diagnostics = yaml["Diagnostics"]) {
      config.has_any_settings_ = true;
      LoadMilliseconds(
          diagnostics["DebounceMs"], settings.diagnostics.debounce,
          "Diagnostics.DebounceMs", *config.logger_, true);
      if (diagnostics["MaxProblems"]) {
        settings.diagnostics.max_problems =
            diagnostics["MaxProblems"].as<int>();
      }
      if (diagnostics["InlayHints"]) {
        settings.diagnostics.inlay_hints = diagnostics["InlayHints"].as<bool>();
      }
    }

    config.logger_->debug(
        "Loaded .lspshim configuration from {}", config_path.string());
    return config;

  } catch (const YAML::Exception& e) {
    config.logger_->error(
        "Error parsing .lspshim configuration file: {}", e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    config.logger_->error(
        "Error loading .lspshim configuration file: {}", e.what());
    return std::nullopt;
  }
}

}  // namespace lspshim

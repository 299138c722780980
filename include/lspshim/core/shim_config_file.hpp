#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

#include <spdlog/spdlog.h>

#include "lspshim/core/shim_settings.hpp"

namespace lspshim {

constexpr std::string_view kConfigFileName = ".lspshim";

// Represents the contents of a .lspshim configuration file
class ShimConfigFile {
 public:
  // Constructor with optional logger
  explicit ShimConfigFile(std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load a configuration from a .lspshim file
  // Returns std::nullopt if file doesn't exist or has critical parsing errors
  static auto LoadFromFile(
      const std::filesystem::path& config_path,
      std::shared_ptr<spdlog::logger> logger = nullptr)
      -> std::optional<ShimConfigFile>;

  // Settings from the file layered over the built-in defaults
  [[nodiscard]] auto GetSettings() const -> const ShimSettings& {
    return settings_;
  }

  [[nodiscard]] auto HasAnySettings() const -> bool {
    return has_any_settings_;
  }

 private:
  // Logger for logging
  std::shared_ptr<spdlog::logger> logger_;

  ShimSettings settings_;

  // False when the file exists but contains none of the known sections
  bool has_any_settings_ = false;
};

}  // namespace lspshim

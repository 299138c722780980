#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "lspshim/core/shim_config_file.hpp"
#include "lspshim/core/shim_settings.hpp"

namespace lspshim {

// Resolves the effective settings of each document
//
// Layers, lowest first: built-in defaults, the workspace .lspshim file, then
// either the per-document settings pulled from the client (when a fetcher is
// installed) or the global settings pushed by didChangeConfiguration.
class SettingsManager {
 public:
  // Pulls the `lspshim` section scoped to a document URI from the client
  using ConfigurationFetcher =
      std::function<asio::awaitable<std::optional<nlohmann::json>>(
          std::string uri)>;

  explicit SettingsManager(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Load the config file from the workspace root
  // Returns true if a config was found and loaded
  auto LoadConfigFile(std::filesystem::path workspace_root)
      -> asio::awaitable<bool>;

  void SetFetcher(ConfigurationFetcher fetcher);

  [[nodiscard]] auto HasFetcher() const -> bool {
    return static_cast<bool>(fetcher_);
  }

  // Replace the pushed global settings (the `lspshim` object)
  void SetGlobal(nlohmann::json settings);

  // Forget every per-document result so the next lookup pulls again
  void ClearCache();

  // Forget the cached result of one document
  void Forget(const std::string& uri);

  // Effective settings for `uri`
  auto GetSettings(std::string uri) -> asio::awaitable<ShimSettings>;

  // Defaults layered with the config file and the global settings
  [[nodiscard]] auto GetGlobalSettings() const -> ShimSettings;

 private:
  [[nodiscard]] auto BaseSettings() const -> ShimSettings;

  std::shared_ptr<spdlog::logger> logger_;

  asio::any_io_executor executor_;
  asio::strand<asio::any_io_executor> strand_;

  // The loaded configuration (if any)
  std::optional<ShimConfigFile> config_file_;

  nlohmann::json global_settings_;
  ConfigurationFetcher fetcher_;

  std::unordered_map<std::string, ShimSettings> document_settings_;
};

}  // namespace lspshim

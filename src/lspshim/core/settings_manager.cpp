#include "lspshim/core/settings_manager.hpp"

#include <utility>

namespace lspshim {

SettingsManager::SettingsManager(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()),
      executor_(executor),
      strand_(asio::make_strand(executor)) {
}

auto SettingsManager::LoadConfigFile(std::filesystem::path workspace_root)
    -> asio::awaitable<bool> {
  // Ensure we're running on the strand for thread safety
  co_await asio::post(strand_, asio::use_awaitable);

  auto config_path = workspace_root / kConfigFileName;
  auto loaded = ShimConfigFile::LoadFromFile(config_path, logger_);
  document_settings_.clear();

  if (!loaded) {
    config_file_.reset();
    co_return false;
  }

  config_file_ = std::move(loaded);
  const auto& settings = config_file_->GetSettings();
  logger_->info("SettingsManager loaded {}", config_path.string());
  logger_->debug("  Executable: {}", settings.backend.executable);
  logger_->debug("  Args: {}", settings.backend.args.size());
  logger_->debug(
      "  Include directories: {}", settings.backend.include_dirs.size());
  logger_->debug("  Debounce: {}ms", settings.diagnostics.debounce.count());
  co_return true;
}

void SettingsManager::SetFetcher(ConfigurationFetcher fetcher) {
  fetcher_ = std::move(fetcher);
  document_settings_.clear();
}

void SettingsManager::SetGlobal(nlohmann::json settings) {
  global_settings_ = std::move(settings);
  document_settings_.clear();
}

void SettingsManager::ClearCache() {
  document_settings_.clear();
}

void SettingsManager::Forget(const std::string& uri) {
  document_settings_.erase(uri);
}

auto SettingsManager::BaseSettings() const -> ShimSettings {
  return config_file_ ? config_file_->GetSettings() : ShimSettings{};
}

auto SettingsManager::GetGlobalSettings() const -> ShimSettings {
  auto settings = BaseSettings();
  if (global_settings_.is_object()) {
    ApplyClientSettings(global_settings_, settings, logger_);
  }
  return settings;
}

auto SettingsManager::GetSettings(std::string uri)
    -> asio::awaitable<ShimSettings> {
  co_await asio::post(strand_, asio::use_awaitable);

  if (!fetcher_) {
    co_return GetGlobalSettings();
  }

  if (auto it = document_settings_.find(uri); it != document_settings_.end()) {
    co_return it->second;
  }

  auto fetched = co_await fetcher_(uri);
  co_await asio::post(strand_, asio::use_awaitable);

  // A null answer falls back to the pushed settings; a failed request is
  // not cached so the next lookup asks again
  auto settings = GetGlobalSettings();
  if (!fetched) {
    co_return settings;
  }
  if (fetched->is_object()) {
    ApplyClientSettings(*fetched, settings, logger_);
  }
  document_settings_.insert_or_assign(uri, settings);
  co_return settings;
}

}  // namespace lspshim

#include "app/app_setup.hpp"

#include <array>
#include <cstdlib>
#include <string_view>
#include <unordered_map>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace app {

namespace {

constexpr std::string_view kDefaultLogLevel = "debug";
constexpr std::string_view kLogPattern = "[%n][%L] %v";
constexpr std::string_view kPipeFlag = "--pipe";

// Loggers whose level follows the user setting; the others stay fixed
struct LoggerConfig {
  std::string_view name;
  std::optional<spdlog::level::level_enum> fixed_level;
};

auto ParseLogLevel(std::string_view level_str)
    -> std::optional<spdlog::level::level_enum> {
  static const std::unordered_map<std::string_view, spdlog::level::level_enum>
      kLevelMap = {
          {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
          {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
          {"error", spdlog::level::err},   {"off", spdlog::level::off},
      };

  if (auto it = kLevelMap.find(level_str); it != kLevelMap.end()) {
    return it->second;
  }
  return std::nullopt;
}

// LSPSHIM_LOG_LEVEL wins over the generic SPDLOG_LEVEL
auto GetLogLevelFromEnv() -> spdlog::level::level_enum {
  for (const char* name : {"LSPSHIM_LOG_LEVEL", "SPDLOG_LEVEL"}) {
    const char* value = std::getenv(name);
    if (value == nullptr) {
      continue;
    }
    if (auto level = ParseLogLevel(value)) {
      return *level;
    }
    spdlog::warn("Ignoring unknown log level '{}' in {}", value, name);
  }
  return *ParseLogLevel(kDefaultLogLevel);
}

void ConfigureLogger(
    const std::shared_ptr<spdlog::logger>& logger,
    spdlog::level::level_enum level) {
  logger->set_pattern(std::string(kLogPattern));
  logger->set_level(level);
  logger->flush_on(spdlog::level::debug);
}

}  // namespace

auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string> {
  for (std::size_t i = 1; i < args.size(); ++i) {
    std::string_view arg = args[i];
    if (!arg.starts_with(kPipeFlag)) {
      continue;
    }
    arg.remove_prefix(kPipeFlag.size());
    if (arg.starts_with('=')) {
      arg.remove_prefix(1);
    } else if (arg.empty() && i + 1 < args.size()) {
      arg = args[i + 1];
    } else {
      continue;
    }
    if (!arg.empty()) {
      return std::string(arg);
    }
  }
  return std::nullopt;
}

auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> {
  const auto user_log_level = GetLogLevelFromEnv();
  spdlog::set_level(user_log_level);

  const std::array kLoggerConfigs = {
      LoggerConfig{.name = "transport", .fixed_level = spdlog::level::info},
      LoggerConfig{.name = "jsonrpc", .fixed_level = spdlog::level::info},
      LoggerConfig{.name = "lspshim", .fixed_level = std::nullopt},
      LoggerConfig{.name = "backend", .fixed_level = std::nullopt},
  };

  std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers;

  for (const auto& config : kLoggerConfigs) {
    auto logger = spdlog::stdout_color_mt(std::string(config.name));
    ConfigureLogger(logger, config.fixed_level.value_or(user_log_level));
    loggers[std::string(config.name)] = std::move(logger);
  }

  return loggers;
}

}  // namespace app

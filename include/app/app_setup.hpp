#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

namespace app {

/// Extract the pipe name from `--pipe=<name>` or `--pipe <name>`
/// Returns nullopt when neither form is present
auto ParsePipeName(const std::vector<std::string>& args)
    -> std::optional<std::string>;

/// Setup structured logging with named loggers
/// Returns the transport, jsonrpc, lspshim and backend loggers; the last two
/// follow LSPSHIM_LOG_LEVEL (or SPDLOG_LEVEL)
auto SetupLoggers()
    -> std::unordered_map<std::string, std::shared_ptr<spdlog::logger>>;

}  // namespace app

#pragma once

#include <chrono>
#include <expected>
#include <memory>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "lspshim/backend/backend_invoker.hpp"

namespace lspshim::backend {

// Spawns the backend as a child process with posix_spawnp
// The snapshot text is written to the child's stdin, which is then closed;
// stdout and stderr are read to EOF concurrently. On timeout or cancellation
// the child is killed with SIGKILL and reaped before returning.
class ProcessBackendInvoker : public BackendInvoker {
 public:
  explicit ProcessBackendInvoker(
      asio::any_io_executor executor,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto Invoke(BackendRequest request, std::chrono::milliseconds timeout)
      -> asio::awaitable<std::expected<BackendResult, InvokeError>> override;

 private:
  asio::any_io_executor executor_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace lspshim::backend

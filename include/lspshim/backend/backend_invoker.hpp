#pragma once

#include <chrono>
#include <expected>

#include <asio.hpp>

#include "lspshim/backend/backend_request.hpp"

namespace lspshim::backend {

// Runs one backend invocation per call
// Implementations must honour the timeout and react to asio cancellation of
// the awaiting coroutine by abandoning the call with kCancelled
class BackendInvoker {
 public:
  BackendInvoker() = default;
  BackendInvoker(const BackendInvoker&) = delete;
  BackendInvoker(BackendInvoker&&) = delete;
  auto operator=(const BackendInvoker&) -> BackendInvoker& = delete;
  auto operator=(BackendInvoker&&) -> BackendInvoker& = delete;
  virtual ~BackendInvoker() = default;

  virtual auto Invoke(BackendRequest request, std::chrono::milliseconds timeout)
      -> asio::awaitable<std::expected<BackendResult, InvokeError>> = 0;
};

}  // namespace lspshim::backend

#pragma once

#include <expected>
#include <memory>
#include <string>

#include <asio.hpp>
#include <jsonrpc/error/error.hpp>
#include <jsonrpc/transport/transport.hpp>
#include <spdlog/spdlog.h>

#include "lsp/cancellation.hpp"

namespace lsp {

// Wraps the client transport: requests read from it are admitted to the
// cancellation registry, and responses to cancelled requests are swallowed
// instead of written.
class CancellableTransport : public jsonrpc::transport::Transport {
 public:
  CancellableTransport(
      asio::any_io_executor executor,
      std::unique_ptr<jsonrpc::transport::Transport> inner,
      std::shared_ptr<CancellationRegistry> registry,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  auto SendMessage(std::string message) -> asio::awaitable<
      std::expected<void, jsonrpc::error::RpcError>> override;

  auto ReceiveMessage() -> asio::awaitable<
      std::expected<std::string, jsonrpc::error::RpcError>> override;

  auto Close() -> asio::awaitable<
      std::expected<void, jsonrpc::error::RpcError>> override;

  void CloseNow() override;

 private:
  std::unique_ptr<jsonrpc::transport::Transport> inner_;
  std::shared_ptr<CancellationRegistry> registry_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace lsp

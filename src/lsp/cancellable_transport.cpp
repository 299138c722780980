#include "lsp/cancellable_transport.hpp"

namespace lsp {

CancellableTransport::CancellableTransport(
    asio::any_io_executor executor,
    std::unique_ptr<jsonrpc::transport::Transport> inner,
    std::shared_ptr<CancellationRegistry> registry,
    std::shared_ptr<spdlog::logger> logger)
    : jsonrpc::transport::Transport(executor),
      inner_(std::move(inner)),
      registry_(std::move(registry)),
      logger_(logger ? logger : spdlog::default_logger()) {
}

auto CancellableTransport::SendMessage(std::string message)
    -> asio::awaitable<std::expected<void, jsonrpc::error::RpcError>> {
  if (!registry_->ShouldSend(message)) {
    co_return std::expected<void, jsonrpc::error::RpcError>{};
  }
  co_return co_await inner_->SendMessage(std::move(message));
}

auto CancellableTransport::ReceiveMessage()
    -> asio::awaitable<std::expected<std::string, jsonrpc::error::RpcError>> {
  auto message = co_await inner_->ReceiveMessage();
  if (message) {
    registry_->ObserveIncoming(*message);
  }
  co_return message;
}

auto CancellableTransport::Close()
    -> asio::awaitable<std::expected<void, jsonrpc::error::RpcError>> {
  logger_->debug("Closing client transport");
  co_return co_await inner_->Close();
}

void CancellableTransport::CloseNow() {
  inner_->CloseNow();
}

}  // namespace lsp

#include <memory>
#include <string>
#include <vector>

#include <asio.hpp>
#include <jsonrpc/endpoint/endpoint.hpp>
#include <jsonrpc/transport/framed_pipe_transport.hpp>
#include <spdlog/spdlog.h>

#include "app/app_setup.hpp"
#include "app/crash_handler.hpp"
#include "lsp/cancellable_transport.hpp"
#include "lsp/cancellation.hpp"
#include "lspshim/backend/process_backend_invoker.hpp"
#include "lspshim/core/lspshim_server.hpp"

using jsonrpc::endpoint::RpcEndpoint;
using jsonrpc::transport::FramedPipeTransport;
using lsp::CancellableTransport;
using lsp::CancellationRegistry;
using lspshim::LspshimServer;
using lspshim::backend::ProcessBackendInvoker;

auto main(int argc, char* argv[]) -> int {
  // Initialize debugging features
  app::WaitForDebuggerIfRequested();
  app::InitializeSignalHandlers();

  // Parse command-line arguments
  const std::vector<std::string> args(argv, argv + argc);
  auto pipe_name_opt = app::ParsePipeName(args);
  if (!pipe_name_opt) {
    spdlog::error("Usage: lspshim --pipe=<pipe name>");
    return 1;
  }
  const std::string pipe_name = pipe_name_opt.value();

  // Setup loggers
  auto loggers = app::SetupLoggers();

  // Create the IO context
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  // Create transport and endpoint. Position requests read from the pipe are
  // tracked so `$/cancelRequest` can reach them.
  auto cancellations =
      std::make_shared<CancellationRegistry>(loggers["lspshim"]);
  auto transport = std::make_unique<CancellableTransport>(
      executor,
      std::make_unique<FramedPipeTransport>(
          executor, pipe_name, false, loggers["transport"]),
      cancellations, loggers["transport"]);

  auto endpoint = std::make_unique<RpcEndpoint>(
      executor, std::move(transport), loggers["jsonrpc"]);

  // The backend runs as a child process per request
  auto invoker =
      std::make_shared<ProcessBackendInvoker>(executor, loggers["backend"]);
  auto server = std::make_unique<LspshimServer>(
      executor, std::move(endpoint), invoker, cancellations,
      loggers["lspshim"]);

  // Start the server asynchronously
  asio::co_spawn(
      io_context,
      [&server]() -> asio::awaitable<void> {
        auto result = co_await server->Start();
        if (!result.has_value()) {
          spdlog::error("Server error: {}", result.error().Message());
        }
        co_return;
      },
      asio::detached);

  io_context.run();
  return 0;
}

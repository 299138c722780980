#include "lspshim/backend/process_backend_invoker.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <asio/experimental/awaitable_operators.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "lspshim/utils/scoped_timer.hpp"

extern char** environ;

namespace lspshim::backend {

namespace {

using asio::experimental::awaitable_operators::operator&&;
using asio::experimental::awaitable_operators::operator||;

constexpr auto kReapPollInterval = std::chrono::milliseconds(5);
constexpr std::size_t kReadChunkSize = 4096;

// Owns a raw file descriptor until handed over to asio
class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.Release()) {}
  auto operator=(const UniqueFd&) -> UniqueFd& = delete;
  auto operator=(UniqueFd&& other) noexcept -> UniqueFd& {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }
  ~UniqueFd() {
    Reset();
  }

  [[nodiscard]] auto Get() const -> int {
    return fd_;
  }

  auto Release() -> int {
    int fd = fd_;
    fd_ = -1;
    return fd;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

auto MakePipe() -> std::expected<Pipe, std::error_code> {
  std::array<int, 2> fds{};
  if (::pipe2(fds.data(), O_CLOEXEC) == -1) {
    return std::unexpected(std::error_code(errno, std::system_category()));
  }
  return Pipe{.read = UniqueFd(fds[0]), .write = UniqueFd(fds[1])};
}

// Spawn argv[0] (searched in PATH) with the given pipes wired to its stdio
auto SpawnChild(
    const std::vector<std::string>& argv, const Pipe& input,
    const Pipe& output, const Pipe& error_output)
    -> std::expected<pid_t, std::error_code> {
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  posix_spawn_file_actions_t file_actions;
  posix_spawn_file_actions_init(&file_actions);

  // Redirect file descriptors
  posix_spawn_file_actions_adddup2(
      &file_actions, input.read.Get(), STDIN_FILENO);
  posix_spawn_file_actions_adddup2(
      &file_actions, output.write.Get(), STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(
      &file_actions, error_output.write.Get(), STDERR_FILENO);

  // The originals are not needed once duplicated onto stdio
  for (const auto* pipe : {&input, &output, &error_output}) {
    posix_spawn_file_actions_addclose(&file_actions, pipe->read.Get());
    posix_spawn_file_actions_addclose(&file_actions, pipe->write.Get());
  }

  pid_t pid = 0;
  int error = ::posix_spawnp(
      &pid, c_argv[0], &file_actions, nullptr, c_argv.data(), environ);
  posix_spawn_file_actions_destroy(&file_actions);

  if (error != 0 || pid == 0) {
    return std::unexpected(std::error_code(error, std::system_category()));
  }
  return pid;
}

auto DecodeWaitStatus(int status) -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

// Kill and reap a child that is no longer wanted
void KillAndReap(pid_t pid) {
  ::kill(pid, SIGKILL);
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

auto WriteInput(asio::posix::stream_descriptor& input, const std::string& text)
    -> asio::awaitable<void> {
  co_await asio::this_coro::throw_if_cancelled(false);
  std::error_code ec;
  co_await asio::async_write(
      input, asio::buffer(text), asio::redirect_error(asio::use_awaitable, ec));
  // Closing signals EOF to the child; EPIPE from an early exit is fine here
  input.close(ec);
}

auto ReadToEnd(asio::posix::stream_descriptor& stream, std::string& into)
    -> asio::awaitable<void> {
  co_await asio::this_coro::throw_if_cancelled(false);
  std::array<char, kReadChunkSize> buffer{};
  for (;;) {
    std::error_code ec;
    auto n = co_await stream.async_read_some(
        asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
    into.append(buffer.data(), n);
    if (ec) {
      co_return;
    }
  }
}

auto WaitForDeadline(asio::steady_timer& deadline) -> asio::awaitable<void> {
  co_await asio::this_coro::throw_if_cancelled(false);
  std::error_code ec;
  co_await deadline.async_wait(asio::redirect_error(asio::use_awaitable, ec));
}

auto IsCancelled(const asio::cancellation_state& state) -> bool {
  return state.cancelled() != asio::cancellation_type::none;
}

}  // namespace

ProcessBackendInvoker::ProcessBackendInvoker(
    asio::any_io_executor executor, std::shared_ptr<spdlog::logger> logger)
    : executor_(executor),
      logger_(logger ? logger : spdlog::default_logger()) {
  // A backend that exits without draining stdin must not raise SIGPIPE here
  std::signal(SIGPIPE, SIG_IGN);
}

auto ProcessBackendInvoker::Invoke(
    BackendRequest request, std::chrono::milliseconds timeout)
    -> asio::awaitable<std::expected<BackendResult, InvokeError>> {
  co_await asio::this_coro::throw_if_cancelled(false);

  utils::ScopedTimer timer(
      fmt::format("Backend {} invocation", CapabilityName(request.kind)),
      logger_);
  const auto start = std::chrono::steady_clock::now();

  if (request.argv.empty() || request.argv.front().empty()) {
    co_return std::unexpected(InvokeError{
        .kind = InvokeErrorKind::kSpawnFailed,
        .message = "no backend executable configured"});
  }

  auto input = MakePipe();
  auto output = MakePipe();
  auto error_output = MakePipe();
  for (const auto* pipe : {&input, &output, &error_output}) {
    if (!*pipe) {
      co_return std::unexpected(InvokeError{
          .kind = InvokeErrorKind::kSpawnFailed,
          .message = fmt::format("pipe: {}", pipe->error().message())});
    }
  }

  auto pid = SpawnChild(request.argv, *input, *output, *error_output);
  if (!pid) {
    logger_->warn(
        "Failed to spawn backend '{}': {}", request.argv.front(),
        pid.error().message());
    co_return std::unexpected(InvokeError{
        .kind = InvokeErrorKind::kSpawnFailed,
        .message = fmt::format(
            "{}: {}", request.argv.front(), pid.error().message())});
  }
  logger_->debug(
      "Spawned backend pid {}: {}", *pid, fmt::join(request.argv, " "));

  // Close the child's ends in the parent so EOF is observed on exit
  input->read.Reset();
  output->write.Reset();
  error_output->write.Reset();

  asio::posix::stream_descriptor child_stdin(executor_, input->write.Release());
  asio::posix::stream_descriptor child_stdout(
      executor_, output->read.Release());
  asio::posix::stream_descriptor child_stderr(
      executor_, error_output->read.Release());

  BackendResult result;
  asio::steady_timer deadline(executor_, timeout);

  auto io_outcome = co_await (
      (WriteInput(child_stdin, request.snapshot->Text()) &&
       ReadToEnd(child_stdout, result.output) &&
       ReadToEnd(child_stderr, result.error_output)) ||
      WaitForDeadline(deadline));

  auto cancellation = co_await asio::this_coro::cancellation_state;
  if (IsCancelled(cancellation)) {
    KillAndReap(*pid);
    logger_->debug("Backend pid {} cancelled", *pid);
    co_return std::unexpected(InvokeError{
        .kind = InvokeErrorKind::kCancelled,
        .message = "request cancelled while backend was running"});
  }
  if (io_outcome.index() == 1) {
    KillAndReap(*pid);
    logger_->warn(
        "Backend pid {} timed out after {}ms", *pid, timeout.count());
    co_return std::unexpected(InvokeError{
        .kind = InvokeErrorKind::kTimeout,
        .message = fmt::format("no output after {}ms", timeout.count())});
  }

  // Output is complete; reap without blocking the executor
  int status = 0;
  for (;;) {
    auto reaped = ::waitpid(*pid, &status, WNOHANG);
    if (reaped == *pid) {
      break;
    }
    if (reaped == -1 && errno != EINTR) {
      co_return std::unexpected(InvokeError{
          .kind = InvokeErrorKind::kSpawnFailed,
          .message = fmt::format(
              "waitpid: {}",
              std::error_code(errno, std::system_category()).message())});
    }
    if (IsCancelled(cancellation)) {
      KillAndReap(*pid);
      co_return std::unexpected(InvokeError{
          .kind = InvokeErrorKind::kCancelled,
          .message = "request cancelled while backend was running"});
    }
    if (std::chrono::steady_clock::now() >= deadline.expiry()) {
      KillAndReap(*pid);
      co_return std::unexpected(InvokeError{
          .kind = InvokeErrorKind::kTimeout,
          .message = fmt::format(
              "backend did not exit within {}ms", timeout.count())});
    }
    asio::steady_timer poll(executor_, kReapPollInterval);
    std::error_code ec;
    co_await poll.async_wait(asio::redirect_error(asio::use_awaitable, ec));
  }

  result.exit_status = DecodeWaitStatus(status);
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);

  if (result.exit_status != 0) {
    logger_->debug(
        "Backend pid {} exited with status {}", *pid, result.exit_status);
    auto message = fmt::format("exit status {}", result.exit_status);
    co_return std::unexpected(InvokeError{
        .kind = InvokeErrorKind::kNonZeroExit,
        .message = std::move(message),
        .result = std::move(result)});
  }

  co_return result;
}

}  // namespace lspshim::backend

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

namespace lspshim::services {

// Deferred work for one document, typically a diagnostics check
using CheckTask = std::function<asio::awaitable<void>()>;

// Decides when a check requested by a document change actually runs
class DebouncePolicy {
 public:
  DebouncePolicy() = default;
  DebouncePolicy(const DebouncePolicy&) = delete;
  DebouncePolicy(DebouncePolicy&&) = delete;
  auto operator=(const DebouncePolicy&) -> DebouncePolicy& = delete;
  auto operator=(DebouncePolicy&&) -> DebouncePolicy& = delete;
  virtual ~DebouncePolicy() = default;

  // Request a run of `task` for `uri`, superseding any pending request
  virtual void Schedule(std::string uri, CheckTask task) = 0;

  // Drop the pending request for `uri`, if any
  virtual void Cancel(const std::string& uri) = 0;

  // Number of requests waiting to run
  [[nodiscard]] virtual auto PendingCount() const -> std::size_t = 0;
};

// Runs every request immediately
class EagerPolicy : public DebouncePolicy {
 public:
  explicit EagerPolicy(asio::any_io_executor executor);

  void Schedule(std::string uri, CheckTask task) override;
  void Cancel(const std::string& uri) override;
  [[nodiscard]] auto PendingCount() const -> std::size_t override {
    return 0;
  }

 private:
  asio::any_io_executor executor_;
};

// Runs a request once no further change arrived for `delay`
// Each URI owns one steady_timer that is restarted by every Schedule call.
class TimerDebouncePolicy : public DebouncePolicy {
 public:
  TimerDebouncePolicy(
      asio::any_io_executor executor, std::chrono::milliseconds delay,
      std::shared_ptr<spdlog::logger> logger = nullptr);

  void Schedule(std::string uri, CheckTask task) override;
  void Cancel(const std::string& uri) override;
  [[nodiscard]] auto PendingCount() const -> std::size_t override {
    return timers_.size();
  }

  [[nodiscard]] auto Delay() const -> std::chrono::milliseconds {
    return delay_;
  }

 private:
  asio::any_io_executor executor_;
  std::chrono::milliseconds delay_;
  std::shared_ptr<spdlog::logger> logger_;

  // Expires with the policy; pending handlers check it before touching state
  std::shared_ptr<void> alive_ = std::make_shared<int>(0);

  std::map<std::string, asio::steady_timer> timers_;
  std::map<std::string, std::uint64_t> generations_;
  std::uint64_t next_generation_ = 0;
};

// Zero delay selects EagerPolicy
auto MakeDebouncePolicy(
    asio::any_io_executor executor, std::chrono::milliseconds delay,
    std::shared_ptr<spdlog::logger> logger = nullptr)
    -> std::unique_ptr<DebouncePolicy>;

}  // namespace lspshim::services

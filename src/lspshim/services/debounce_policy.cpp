#include "lspshim/services/debounce_policy.hpp"

#include <utility>

namespace lspshim::services {

EagerPolicy::EagerPolicy(asio::any_io_executor executor)
    : executor_(std::move(executor)) {
}

void EagerPolicy::Schedule(std::string /*uri*/, CheckTask task) {
  asio::co_spawn(executor_, std::move(task), asio::detached);
}

void EagerPolicy::Cancel(const std::string& /*uri*/) {
}

TimerDebouncePolicy::TimerDebouncePolicy(
    asio::any_io_executor executor, std::chrono::milliseconds delay,
    std::shared_ptr<spdlog::logger> logger)
    : executor_(std::move(executor)),
      delay_(delay),
      logger_(logger ? logger : spdlog::default_logger()) {
}

void TimerDebouncePolicy::Schedule(std::string uri, CheckTask task) {
  logger_->debug(
      "Scheduling debounced check for {} ({}ms)", uri, delay_.count());

  // Cancel existing timer if any
  Cancel(uri);

  const auto generation = ++next_generation_;
  generations_[uri] = generation;

  auto [timer_it, inserted] = timers_.try_emplace(uri, executor_);
  timer_it->second.expires_after(delay_);
  timer_it->second.async_wait(
      [this, alive = std::weak_ptr<void>(alive_), uri, generation,
       task = std::move(task)](std::error_code ec) {
        // The wait may complete after the policy was replaced
        if (ec || alive.expired()) {
          return;
        }
        // A timer that already fired cannot be cancelled, so a superseded
        // wait is recognised by its generation instead
        auto it = generations_.find(uri);
        if (it == generations_.end() || it->second != generation) {
          return;
        }
        generations_.erase(it);
        timers_.erase(uri);
        logger_->debug("Debounce timer expired for {}, running check", uri);
        asio::co_spawn(executor_, std::move(task), asio::detached);
      });
}

void TimerDebouncePolicy::Cancel(const std::string& uri) {
  auto it = timers_.find(uri);
  if (it != timers_.end()) {
    it->second.cancel();
    timers_.erase(it);
  }
  generations_.erase(uri);
}

auto MakeDebouncePolicy(
    asio::any_io_executor executor, std::chrono::milliseconds delay,
    std::shared_ptr<spdlog::logger> logger) -> std::unique_ptr<DebouncePolicy> {
  if (delay <= std::chrono::milliseconds::zero()) {
    return std::make_unique<EagerPolicy>(std::move(executor));
  }
  return std::make_unique<TimerDebouncePolicy>(
      std::move(executor), delay, std::move(logger));
}

}  // namespace lspshim::services

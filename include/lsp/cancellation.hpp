#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "lsp/basic.hpp"

namespace lsp {

// Tracks in-flight position requests so `$/cancelRequest` can reach the
// coroutine serving them.
//
// The endpoint hands handlers their params but not the request id, so a
// request is admitted from the raw message stream with its id, claimed by
// the handler whose method, document and position match, and completed when
// its response is written. Responses to cancelled requests are never sent.
class CancellationRegistry {
 public:
  struct Ticket {
    RequestId id;
    std::shared_ptr<asio::cancellation_signal> signal;

    // Cancelled before the handler claimed it
    bool cancelled = false;
  };

  explicit CancellationRegistry(
      std::shared_ptr<spdlog::logger> logger = nullptr);

  // Admit requests for cancellable methods found in an incoming message
  void ObserveIncoming(std::string_view message);

  // False for a response to a cancelled request; such responses are dropped
  [[nodiscard]] auto ShouldSend(std::string_view message) -> bool;

  void Admit(
      RequestId id, std::string method, DocumentUri uri, Position position);

  // Bind the oldest unclaimed admission that matches the handler's request
  auto Claim(std::string_view method, const TextDocumentPositionParams& target)
      -> std::optional<Ticket>;

  // Emits terminal cancellation to a claimed request. False if the id is not
  // in flight.
  auto Cancel(const RequestId& id) -> bool;

  // Forget the request; returns whether it had been cancelled
  auto Complete(const RequestId& id) -> bool;

  [[nodiscard]] auto PendingCount() const -> std::size_t;

  [[nodiscard]] static auto IsCancellable(std::string_view method) -> bool;

 private:
  struct Entry {
    RequestId id;
    std::string method;
    DocumentUri uri;
    Position position;
    std::shared_ptr<asio::cancellation_signal> signal;
    bool claimed = false;
    bool cancelled = false;
  };

  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

}  // namespace lsp

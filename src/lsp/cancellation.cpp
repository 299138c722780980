#include "lsp/cancellation.hpp"

#include <algorithm>
#include <array>

#include <nlohmann/json.hpp>

namespace lsp {

namespace {

constexpr std::array<std::string_view, 3> kCancellableMethods = {
    "textDocument/hover",
    "textDocument/completion",
    "textDocument/definition",
};

auto ReadRequestId(const nlohmann::json& id) -> std::optional<RequestId> {
  if (id.is_string()) {
    return RequestId{id.get<std::string>()};
  }
  if (id.is_number_integer()) {
    return RequestId{id.get<int>()};
  }
  return std::nullopt;
}

auto FormatId(const RequestId& id) -> std::string {
  return std::visit(
      [](const auto& value) { return nlohmann::json(value).dump(); }, id);
}

}  // namespace

CancellationRegistry::CancellationRegistry(
    std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? logger : spdlog::default_logger()) {
}

auto CancellationRegistry::IsCancellable(std::string_view method) -> bool {
  return std::ranges::find(kCancellableMethods, method) !=
         kCancellableMethods.end();
}

void CancellationRegistry::ObserveIncoming(std::string_view message) {
  auto json = nlohmann::json::parse(message, nullptr, false);
  if (json.is_discarded() || !json.is_object() || !json.contains("id")) {
    return;
  }
  auto method = json.find("method");
  if (method == json.end() || !method->is_string() ||
      !IsCancellable(method->get<std::string>())) {
    return;
  }
  auto id = ReadRequestId(json.at("id"));
  if (!id) {
    return;
  }

  TextDocumentPositionParams target;
  try {
    json.at("params").get_to(target);
  } catch (const nlohmann::json::exception& e) {
    // The endpoint answers malformed params itself
    logger_->debug(
        "Not tracking request {} for cancellation: {}", FormatId(*id),
        e.what());
    return;
  }

  Admit(
      std::move(*id), method->get<std::string>(),
      std::move(target.textDocument.uri), target.position);
}

auto CancellationRegistry::ShouldSend(std::string_view message) -> bool {
  auto json = nlohmann::json::parse(message, nullptr, false);
  if (json.is_discarded() || !json.is_object() || json.contains("method") ||
      !json.contains("id")) {
    return true;
  }
  auto id = ReadRequestId(json.at("id"));
  if (!id) {
    return true;
  }
  if (Complete(*id)) {
    logger_->debug("Dropping response to cancelled request {}", FormatId(*id));
    return false;
  }
  return true;
}

void CancellationRegistry::Admit(
    RequestId id, std::string method, DocumentUri uri, Position position) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(Entry{
      .id = std::move(id),
      .method = std::move(method),
      .uri = std::move(uri),
      .position = position,
  });
}

auto CancellationRegistry::Claim(
    std::string_view method, const TextDocumentPositionParams& target)
    -> std::optional<Ticket> {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::ranges::find_if(entries_, [&](const Entry& entry) {
    return !entry.claimed && entry.method == method &&
           entry.uri == target.textDocument.uri &&
           entry.position == target.position;
  });
  if (it == entries_.end()) {
    return std::nullopt;
  }

  it->claimed = true;
  it->signal = std::make_shared<asio::cancellation_signal>();
  return Ticket{.id = it->id, .signal = it->signal, .cancelled = it->cancelled};
}

auto CancellationRegistry::Cancel(const RequestId& id) -> bool {
  std::shared_ptr<asio::cancellation_signal> signal;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::ranges::find_if(
        entries_, [&](const Entry& entry) { return entry.id == id; });
    if (it == entries_.end()) {
      logger_->debug("Cancel for request {} not in flight", FormatId(id));
      return false;
    }
    it->cancelled = true;
    signal = it->signal;
  }

  logger_->debug("Cancelling request {}", FormatId(id));
  // Emitted outside the lock; handlers may complete inline
  if (signal) {
    signal->emit(asio::cancellation_type::terminal);
  }
  return true;
}

auto CancellationRegistry::Complete(const RequestId& id) -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::ranges::find_if(
      entries_, [&](const Entry& entry) { return entry.id == id; });
  if (it == entries_.end()) {
    return false;
  }
  const bool cancelled = it->cancelled;
  entries_.erase(it);
  return cancelled;
}

auto CancellationRegistry::PendingCount() const -> std::size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace lsp

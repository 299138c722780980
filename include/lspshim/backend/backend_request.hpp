#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lspshim/document/position_codec.hpp"
#include "lspshim/document/text_document.hpp"
#include "lspshim/error/error.hpp"

namespace lspshim::backend {

enum class CapabilityKind {
  kHover,
  kCompletion,
  kDefinition,
  kCheck,
};

auto CapabilityName(CapabilityKind kind) -> std::string_view;

// One backend call, built fresh per request
struct BackendRequest {
  CapabilityKind kind;
  SnapshotPtr snapshot;

  // Cursor in the backend convention (absent for whole-document checks)
  std::optional<BackendPosition> position;
  std::optional<std::size_t> offset;

  // Full command line, argv[0] is the executable
  std::vector<std::string> argv;
};

struct BackendResult {
  std::string output;
  std::string error_output;
  int exit_status = 0;
  std::chrono::milliseconds elapsed{0};
};

enum class InvokeErrorKind {
  kSpawnFailed,
  kTimeout,
  kNonZeroExit,
  kCancelled,
};

struct InvokeError {
  InvokeErrorKind kind;
  std::string message;

  // Captured output, present for kNonZeroExit
  std::optional<BackendResult> result;

  [[nodiscard]] auto ToShimError() const -> ShimError;
};

}  // namespace lspshim::backend

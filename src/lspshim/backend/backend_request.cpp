#include "lspshim/backend/backend_request.hpp"

namespace lspshim::backend {

auto CapabilityName(CapabilityKind kind) -> std::string_view {
  switch (kind) {
    case CapabilityKind::kHover:
      return "hover";
    case CapabilityKind::kCompletion:
      return "completion";
    case CapabilityKind::kDefinition:
      return "definition";
    case CapabilityKind::kCheck:
      return "check";
  }
  return "unknown";
}

auto InvokeError::ToShimError() const -> ShimError {
  switch (kind) {
    case InvokeErrorKind::kSpawnFailed:
      return ShimError::Make(ShimErrorCode::kSpawnFailed, message);
    case InvokeErrorKind::kTimeout:
      return ShimError::Make(ShimErrorCode::kTimeout, message);
    case InvokeErrorKind::kNonZeroExit:
      return ShimError::Make(ShimErrorCode::kNonZeroExit, message);
    case InvokeErrorKind::kCancelled:
      return ShimError::Make(ShimErrorCode::kCancelled, message);
  }
  return ShimError::Make(ShimErrorCode::kSpawnFailed, message);
}

}  // namespace lspshim::backend

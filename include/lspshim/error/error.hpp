#pragma once

#include <expected>
#include <string>
#include <unordered_map>
#include <utility>

#include "lsp/error.hpp"

namespace lspshim {

/**
 * @brief Error codes for the lspshim adapter
 */
enum class ShimErrorCode {
  // No error
  kSuccess = 0,

  // Document store errors
  kAlreadyOpen,
  kUnknownDocument,
  kStaleVersion,
  kInvalidRange,

  // Backend errors
  kSpawnFailed,
  kTimeout,
  kNonZeroExit,
  kCancelled,

  // Configuration errors
  kConfigError,
};

/**
 * @brief Error class for the lspshim adapter
 */
class ShimError {
 public:
  // Default constructor - no error
  ShimError() : code_(ShimErrorCode::kSuccess) {}

  // Construct from error code
  explicit ShimError(ShimErrorCode code) : code_(code) {
    message_ = GetDefaultMessage(code);
  }

  // Construct from error code and message
  ShimError(ShimErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  // Check if there is no error
  bool ok() const { return code_ == ShimErrorCode::kSuccess; }

  // Get the error code
  ShimErrorCode code() const { return code_; }

  // Get the error message (may be empty)
  const std::string& message() const { return message_; }

  // Allow if(error) checks
  explicit operator bool() const { return !ok(); }

  // Get the default message for an error code
  static std::string GetDefaultMessage(ShimErrorCode code) {
    static const std::unordered_map<ShimErrorCode, std::string> messages = {
        {ShimErrorCode::kSuccess, "Success"},
        {ShimErrorCode::kAlreadyOpen, "Document already open"},
        {ShimErrorCode::kUnknownDocument, "Unknown document"},
        {ShimErrorCode::kStaleVersion, "Stale document version"},
        {ShimErrorCode::kInvalidRange, "Invalid range"},
        {ShimErrorCode::kSpawnFailed, "Failed to spawn backend"},
        {ShimErrorCode::kTimeout, "Backend timed out"},
        {ShimErrorCode::kNonZeroExit, "Backend exited with non-zero status"},
        {ShimErrorCode::kCancelled, "Request cancelled"},
        {ShimErrorCode::kConfigError, "Configuration error"}};

    auto it = messages.find(code);
    if (it != messages.end()) {
      return it->second;
    }
    return "Unknown error";
  }

  // Factory method for creating an error
  static ShimError Make(ShimErrorCode code, const std::string& details = "") {
    if (details.empty()) {
      return ShimError(code);
    }
    return ShimError(code, GetDefaultMessage(code) + ": " + details);
  }

  // Factory method for creating an unexpected error
  static std::unexpected<ShimError> Unexpected(
      ShimErrorCode code, const std::string& details = "") {
    return std::unexpected<ShimError>(Make(code, details));
  }

 private:
  ShimErrorCode code_ = ShimErrorCode::kSuccess;
  std::string message_;
};

// Single mapping point from domain errors to protocol errors
inline auto ToLspError(const ShimError& error) -> lsp::error::LspError {
  using lsp::error::LspError;
  using lsp::error::LspErrorCode;

  switch (error.code()) {
    case ShimErrorCode::kAlreadyOpen:
    case ShimErrorCode::kUnknownDocument:
    case ShimErrorCode::kStaleVersion:
    case ShimErrorCode::kInvalidRange:
      return LspError::FromCode(LspErrorCode::kInvalidParams, error.message());
    case ShimErrorCode::kTimeout:
    case ShimErrorCode::kNonZeroExit:
      return LspError::FromCode(LspErrorCode::kRequestFailed, error.message());
    case ShimErrorCode::kCancelled:
      return LspError::FromCode(
          LspErrorCode::kRequestCancelled, error.message());
    case ShimErrorCode::kSuccess:
    case ShimErrorCode::kSpawnFailed:
    case ShimErrorCode::kConfigError:
      break;
  }
  return LspError::FromCode(LspErrorCode::kInternalError, error.message());
}

inline auto UnexpectedLspError(const ShimError& error)
    -> std::unexpected<lsp::error::LspError> {
  return std::unexpected<lsp::error::LspError>(ToLspError(error));
}

}  // namespace lspshim

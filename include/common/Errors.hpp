#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace relay::common {

/// Base error for all relay-level exceptions.
/// Carries a machine-readable error code slug and whether the caller may retry.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;
  bool _bRetryable;

  explicit AppError(std::string sCode, std::string sMsg, bool bRetryable)
      : std::runtime_error(std::move(sMsg)),
        _sErrorCode(std::move(sCode)),
        _bRetryable(bRetryable) {}
};

/// Malformed job or request (empty item list, missing owner).
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), false) {}
};

/// Requested job id is unknown.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), false) {}
};

/// No session became available within the acquire timeout. Retryable.
struct PoolExhaustedError : AppError {
  explicit PoolExhaustedError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), true) {}
};

/// Shutdown in progress; fatal to the caller.
struct PoolClosedError : AppError {
  explicit PoolClosedError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), false) {}
};

/// Backlog ceiling reached. Retryable after backoff.
struct QueueFullError : AppError {
  explicit QueueFullError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), true) {}
};

/// Item exceeds the configured size ceiling. Policy rejection, not retryable.
struct TooLargeError : AppError {
  explicit TooLargeError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), false) {}
};

/// Network or platform error on a single item. Does not abort sibling items.
struct TransferFailedError : AppError {
  explicit TransferFailedError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), true) {}
};

/// The platform session is no longer usable (logged out, revoked, aborted).
/// Fatal to the current job; the pool discards the session.
struct SessionInvalidError : AppError {
  explicit SessionInvalidError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg), false) {}
};

}  // namespace relay::common

/**
 * @file errors.hpp
 * @brief Exception hierarchy used across articlesync.
 */

#ifndef ARTICLESYNC_ERRORS_HPP
#define ARTICLESYNC_ERRORS_HPP

#include <optional>
#include <stdexcept>
#include <string>

namespace arsync {

/// Base class for every error raised by the sync core.
class SyncError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// A network-bound operation exceeded its deadline.
class NetworkTimeoutError : public SyncError {
public:
  using SyncError::SyncError;
};

/// Transport failure or unexpected HTTP response that is not a timeout.
class NetworkFailureError : public SyncError {
public:
  using SyncError::SyncError;
};

/// Server answered with a non-success HTTP status.
class HttpStatusError : public NetworkFailureError {
public:
  HttpStatusError(long status, const std::string &message,
                  std::optional<long> retry_after = std::nullopt)
      : NetworkFailureError(message), status_(status),
        retry_after_(retry_after) {}

  long status() const noexcept { return status_; }

  /// Seconds from a `Retry-After` header, set for 429 responses.
  std::optional<long> retry_after() const noexcept { return retry_after_; }

  bool is_server_error() const noexcept {
    return status_ >= 500 && status_ < 600;
  }

private:
  long status_;
  std::optional<long> retry_after_;
};

/// Payload was malformed or lacked required fields.
class ParseFailureError : public SyncError {
public:
  using SyncError::SyncError;
};

/// The article store rejected a read or a transaction.
class StorageFailureError : public SyncError {
public:
  using SyncError::SyncError;
};

/// Work was cancelled through its cancellation token.
class OperationCancelledError : public SyncError {
public:
  using SyncError::SyncError;
};

/// Invalid configuration file or command line value.
class ConfigError : public SyncError {
public:
  using SyncError::SyncError;
};

/// Reasons the host task system may refuse a schedule request.
enum class SchedulingFailure { Unsupported, Denied, OverQuota };

/// Submission of a background task was refused by the host.
class SchedulingError : public SyncError {
public:
  SchedulingError(SchedulingFailure reason, const std::string &message)
      : SyncError(message), reason_(reason) {}

  SchedulingFailure reason() const noexcept { return reason_; }

private:
  SchedulingFailure reason_;
};

} // namespace arsync

#endif // ARTICLESYNC_ERRORS_HPP

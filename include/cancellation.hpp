/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation with deadlines and parent chaining.
 *
 * A CancellationSource owns the state; CancellationToken is the cheap,
 * copyable view handed down into blocking calls. A source created from a
 * parent token is cancelled whenever the parent is, which lets a per-item
 * timeout live under a batch-wide or host-imposed cancellation.
 */

#ifndef ARTICLESYNC_CANCELLATION_HPP
#define ARTICLESYNC_CANCELLATION_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace arsync {

enum class CancelReason { None, Cancelled, DeadlineExceeded };

namespace detail {
struct CancelState;
}

/**
 * Keeps a cancellation callback registered. Destroying the registration
 * removes the callback; it does not wait for a callback already running.
 */
class CancellationRegistration {
public:
  CancellationRegistration() = default;
  ~CancellationRegistration();

  CancellationRegistration(const CancellationRegistration &) = delete;
  CancellationRegistration &operator=(const CancellationRegistration &) = delete;
  CancellationRegistration(CancellationRegistration &&other) noexcept;
  CancellationRegistration &operator=(CancellationRegistration &&other) noexcept;

  /// Remove the callback now. Safe to call more than once.
  void reset();

private:
  friend class CancellationToken;
  CancellationRegistration(std::weak_ptr<detail::CancelState> state,
                           std::uint64_t id)
      : state_(std::move(state)), id_(id) {}

  std::weak_ptr<detail::CancelState> state_;
  std::uint64_t id_ = 0;
};

class CancellationToken {
public:
  using clock = std::chrono::steady_clock;

  /// A default token is never cancelled.
  CancellationToken() = default;

  bool is_cancelled() const;

  /// Why the token is cancelled. Explicit cancellation wins over a deadline.
  CancelReason reason() const;

  /// Earliest deadline across this token and its ancestors.
  std::optional<clock::time_point> deadline() const;

  /// Time left until the effective deadline, clamped at zero.
  std::optional<std::chrono::milliseconds> remaining() const;

  /**
   * Block for up to @p timeout or until the token is cancelled or its
   * deadline passes.
   *
   * @return `true` when the token is cancelled on return.
   */
  bool wait_for(std::chrono::milliseconds timeout) const;

  /**
   * Throw when cancelled.
   *
   * @throws OperationCancelledError on explicit cancellation.
   * @throws NetworkTimeoutError when the deadline has passed.
   */
  void throw_if_cancelled(const std::string &context) const;

  /**
   * Run @p callback once when this token, or one of its ancestors, is
   * explicitly cancelled. It runs immediately on the calling thread if that
   * already happened. Deadlines do not trigger callbacks.
   */
  CancellationRegistration on_cancel(std::function<void()> callback) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancelState> state)
      : state_(std::move(state)) {}

  std::shared_ptr<detail::CancelState> state_;
};

class CancellationSource {
public:
  CancellationSource();
  /// Create a source linked to @p parent.
  explicit CancellationSource(const CancellationToken &parent);
  ~CancellationSource();

  CancellationSource(const CancellationSource &) = delete;
  CancellationSource &operator=(const CancellationSource &) = delete;

  /// Cancel this source and every source linked under it.
  void cancel();

  void set_deadline(CancellationToken::clock::time_point deadline);
  void cancel_after(std::chrono::milliseconds timeout) {
    set_deadline(CancellationToken::clock::now() + timeout);
  }

  CancellationToken token() const { return CancellationToken(state_); }

private:
  std::shared_ptr<detail::CancelState> state_;
};

} // namespace arsync

#endif // ARTICLESYNC_CANCELLATION_HPP

#include "cancellation.hpp"
#include "errors.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace arsync {

namespace detail {
struct CancelState {
  mutable std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> cancelled{false};
  std::optional<CancellationToken::clock::time_point> deadline;
  std::shared_ptr<CancelState> parent;
  std::vector<std::weak_ptr<CancelState>> children;
  std::map<std::uint64_t, std::function<void()>> callbacks;
  std::uint64_t next_callback = 1;
};
} // namespace detail

namespace {

using detail::CancelState;

void cancel_state(const std::shared_ptr<CancelState> &state) {
  std::vector<std::weak_ptr<CancelState>> children;
  std::map<std::uint64_t, std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->cancelled.exchange(true)) {
      return;
    }
    children.swap(state->children);
    callbacks.swap(state->callbacks);
  }
  state->cv.notify_all();
  for (auto &entry : callbacks) {
    entry.second();
  }
  for (auto &weak : children) {
    if (auto child = weak.lock()) {
      cancel_state(child);
    }
  }
}

std::optional<CancellationToken::clock::time_point>
effective_deadline(const CancelState *state) {
  std::optional<CancellationToken::clock::time_point> result;
  for (; state != nullptr; state = state->parent.get()) {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->deadline && (!result || *state->deadline < *result)) {
      result = state->deadline;
    }
  }
  return result;
}

bool any_cancelled(const CancelState *state) {
  for (; state != nullptr; state = state->parent.get()) {
    if (state->cancelled.load()) {
      return true;
    }
  }
  return false;
}

} // namespace

bool CancellationToken::is_cancelled() const {
  return reason() != CancelReason::None;
}

CancelReason CancellationToken::reason() const {
  if (!state_) {
    return CancelReason::None;
  }
  if (any_cancelled(state_.get())) {
    return CancelReason::Cancelled;
  }
  auto limit = effective_deadline(state_.get());
  if (limit && clock::now() >= *limit) {
    return CancelReason::DeadlineExceeded;
  }
  return CancelReason::None;
}

std::optional<CancellationToken::clock::time_point>
CancellationToken::deadline() const {
  if (!state_) {
    return std::nullopt;
  }
  return effective_deadline(state_.get());
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
  auto limit = deadline();
  if (!limit) {
    return std::nullopt;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *limit - clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  auto until = clock::now() + timeout;
  if (!state_) {
    std::this_thread::sleep_until(until);
    return false;
  }
  while (!is_cancelled()) {
    auto wake = until;
    auto limit = effective_deadline(state_.get());
    if (limit && *limit < wake) {
      wake = *limit;
    }
    if (clock::now() >= wake) {
      break;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (!state_->cancelled.load()) {
      state_->cv.wait_until(lock, wake);
    }
  }
  return is_cancelled();
}

void CancellationToken::throw_if_cancelled(const std::string &context) const {
  switch (reason()) {
  case CancelReason::None:
    return;
  case CancelReason::Cancelled:
    throw OperationCancelledError(context + ": cancelled");
  case CancelReason::DeadlineExceeded:
    throw NetworkTimeoutError(context + ": deadline exceeded");
  }
}

CancellationRegistration
CancellationToken::on_cancel(std::function<void()> callback) const {
  if (!state_ || !callback) {
    return {};
  }
  // Ancestors cascade into this state, so registering here is enough.
  if (any_cancelled(state_.get())) {
    callback();
    return {};
  }
  std::uint64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled.load()) {
      id = state_->next_callback++;
      state_->callbacks.emplace(id, std::move(callback));
    }
  }
  if (id == 0) {
    callback();
    return {};
  }
  return CancellationRegistration(state_, id);
}

CancellationRegistration::~CancellationRegistration() { reset(); }

CancellationRegistration::CancellationRegistration(
    CancellationRegistration &&other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

CancellationRegistration &
CancellationRegistration::operator=(CancellationRegistration &&other) noexcept {
  if (this != &other) {
    reset();
    state_ = std::move(other.state_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void CancellationRegistration::reset() {
  if (id_ == 0) {
    return;
  }
  if (auto state = state_.lock()) {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->callbacks.erase(id_);
  }
  id_ = 0;
  state_.reset();
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancelState>()) {}

CancellationSource::CancellationSource(const CancellationToken &parent)
    : state_(std::make_shared<detail::CancelState>()) {
  if (!parent.state_) {
    return;
  }
  state_->parent = parent.state_;
  bool parent_cancelled = false;
  {
    std::lock_guard<std::mutex> lock(parent.state_->mutex);
    auto &siblings = parent.state_->children;
    siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                  [](const std::weak_ptr<CancelState> &w) {
                                    return w.expired();
                                  }),
                   siblings.end());
    if (parent.state_->cancelled.load()) {
      parent_cancelled = true;
    } else {
      siblings.push_back(state_);
    }
  }
  if (parent_cancelled) {
    state_->cancelled = true;
  }
}

CancellationSource::~CancellationSource() = default;

void CancellationSource::cancel() { cancel_state(state_); }

void CancellationSource::set_deadline(
    CancellationToken::clock::time_point deadline) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->deadline = deadline;
  }
  state_->cv.notify_all();
}

} // namespace arsync

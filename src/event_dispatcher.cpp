#include "event_dispatcher.hpp"
#include "log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> events_log() {
  static auto logger = category_logger("events");
  return logger;
}

/// Sets an environment variable for the lifetime of the object.
class ScopedEnvVar {
public:
  ScopedEnvVar(std::string name, const std::string &value)
      : name_(std::move(name)) {
    if (const char *old = std::getenv(name_.c_str())) {
      previous_ = old;
    }
    setenv(name_.c_str(), value.c_str(), 1);
  }
  ~ScopedEnvVar() {
    if (previous_) {
      setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      unsetenv(name_.c_str());
    }
  }
  ScopedEnvVar(const ScopedEnvVar &) = delete;
  ScopedEnvVar &operator=(const ScopedEnvVar &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

int run_with_env(const std::string &command, const SyncEvent &event,
                 const std::string &payload) {
  ScopedEnvVar name{"ARTSYNC_EVENT", event.name};
  ScopedEnvVar body{"ARTSYNC_PAYLOAD", payload};
  return std::system(command.c_str());
}

} // namespace

EventDispatcher::EventDispatcher(EventHookSettings hooks, CommandRunner runner)
    : hooks_(std::move(hooks)), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = run_with_env;
  }
  thread_ = std::thread([this] { worker(); });
}

EventDispatcher::~EventDispatcher() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void EventDispatcher::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void EventDispatcher::publish(SyncEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

void EventDispatcher::flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void EventDispatcher::worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
    if (queue_.empty()) {
      break;
    }
    SyncEvent event = std::move(queue_.front());
    queue_.pop_front();
    busy_ = true;
    lock.unlock();
    deliver(event);
    lock.lock();
    busy_ = false;
    if (queue_.empty()) {
      idle_cv_.notify_all();
    }
  }
  idle_cv_.notify_all();
}

void EventDispatcher::deliver(const SyncEvent &event) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners = listeners_;
  }
  for (const auto &listener : listeners) {
    try {
      listener(event);
    } catch (const std::exception &e) {
      events_log()->error("Listener for {} failed: {}", event.name, e.what());
    }
  }

  if (hooks_.command.empty()) {
    return;
  }
  if (!hooks_.events.empty() &&
      std::find(hooks_.events.begin(), hooks_.events.end(), event.name) ==
          hooks_.events.end()) {
    return;
  }
  nlohmann::json payload{{"event", event.name}, {"data", event.data}};
  try {
    int rc = runner_(hooks_.command, event, payload.dump());
    if (rc != 0) {
      events_log()->warn("Hook command '{}' exited with status {}",
                         hooks_.command, rc);
    }
  } catch (const std::exception &e) {
    events_log()->error("Hook command '{}' failed: {}", hooks_.command,
                        e.what());
  }
}

} // namespace arsync

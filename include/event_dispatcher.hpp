/**
 * @file event_dispatcher.hpp
 * @brief Fire-and-forget publication of sync lifecycle events.
 */

#ifndef ARTICLESYNC_EVENT_DISPATCHER_HPP
#define ARTICLESYNC_EVENT_DISPATCHER_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace arsync {

namespace events {
inline constexpr const char *kSyncStarted = "sync.started";
inline constexpr const char *kSyncStopped = "sync.stopped";
inline constexpr const char *kBatchProcessed = "batch.processed";
} // namespace events

struct SyncEvent {
  std::string name;
  nlohmann::json data = nlohmann::json::object();
};

/// External command run for published events.
struct EventHookSettings {
  std::string command;
  /// Event names that trigger the command. Empty means every event.
  std::vector<std::string> events;
};

/**
 * Delivers events to in-process listeners and an optional hook command on a
 * dedicated thread. Publishers never wait for consumers.
 */
class EventDispatcher {
public:
  using Listener = std::function<void(const SyncEvent &)>;
  /// Runs the hook command and returns its exit status.
  using CommandRunner = std::function<int(
      const std::string &command, const SyncEvent &event,
      const std::string &payload)>;

  explicit EventDispatcher(EventHookSettings hooks = {},
                           CommandRunner runner = CommandRunner{});
  /// Delivers what is already queued, then stops the worker.
  ~EventDispatcher();

  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;

  void subscribe(Listener listener);

  void publish(SyncEvent event);

  /// Block until every event published so far has been delivered.
  void flush();

private:
  void worker();
  void deliver(const SyncEvent &event);

  EventHookSettings hooks_;
  CommandRunner runner_;
  std::vector<Listener> listeners_;
  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<SyncEvent> queue_;
  bool busy_{false};
  bool stop_{false};
};

} // namespace arsync

#endif // ARTICLESYNC_EVENT_DISPATCHER_HPP

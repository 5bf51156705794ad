/**
 * @file local_task_host.hpp
 * @brief Timer-driven task host for running as a Linux daemon.
 */

#ifndef ARTICLESYNC_LOCAL_TASK_HOST_HPP
#define ARTICLESYNC_LOCAL_TASK_HOST_HPP

#include "background_scheduler.hpp"

#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace arsync {

/**
 * Launches submitted tasks at their earliest-begin time, one at a time, and
 * expires a task that outlives its time limit by cancelling its token. A
 * request that needs external power is pushed back while running on
 * battery. Submitting a kind that is already pending replaces it.
 */
class LocalTaskHost : public TaskHost {
public:
  using PowerProbe = std::function<bool()>;

  explicit LocalTaskHost(PowerProbe on_external_power = PowerProbe{},
                         std::chrono::milliseconds power_retry =
                             std::chrono::minutes(5));
  ~LocalTaskHost() override;

  LocalTaskHost(const LocalTaskHost &) = delete;
  LocalTaskHost &operator=(const LocalTaskHost &) = delete;

  void register_handler(Handler handler) override;

  /// @throws SchedulingError Unsupported without a handler, denied once
  ///         stopped.
  void submit(const ScheduleRequest &request) override;

  void start();

  /// Expire any running task and stop the timer thread.
  void stop();

  std::optional<ScheduleRequest> pending(TaskKind kind) const;

  /// Whether any `Mains` supply below @p root reports being online. Systems
  /// without a battery count as powered.
  static bool on_external_power(
      const std::string &root = "/sys/class/power_supply");

private:
  void loop();
  void run_task(const ScheduleRequest &request,
                std::unique_lock<std::mutex> &lock);

  PowerProbe power_probe_;
  std::chrono::milliseconds power_retry_;
  Handler handler_;
  std::map<TaskKind, ScheduleRequest> pending_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
  bool running_{false};
  bool stopping_{false};
  std::shared_ptr<CancellationSource> current_;
};

} // namespace arsync

#endif // ARTICLESYNC_LOCAL_TASK_HOST_HPP

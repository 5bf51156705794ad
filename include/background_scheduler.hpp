/**
 * @file background_scheduler.hpp
 * @brief Translates host background task windows into sync runs.
 *
 * Two task kinds are scheduled: a short fetch task that runs a sync with a
 * bounded ingestion window, and a longer processing task. After every run
 * the next request is recomputed from the activity state: recent foreground
 * use pushes the fetch task further out, a large backlog brings the
 * processing task forward, and a processing task that has not run for a day
 * drops its power requirement.
 */

#ifndef ARTICLESYNC_BACKGROUND_SCHEDULER_HPP
#define ARTICLESYNC_BACKGROUND_SCHEDULER_HPP

#include "activity_state.hpp"
#include "cancellation.hpp"
#include "sync_coordinator.hpp"
#include "util/clock.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace arsync {

enum class TaskKind { Fetch, Processing };
enum class TaskState { Unscheduled, Scheduled, Running, Completed, Expired };

const char *to_string(TaskKind kind);
const char *to_string(TaskState state);

/// Parameters for the next host wake-up.
struct ScheduleRequest {
  TaskKind kind = TaskKind::Fetch;
  TimePoint earliest_begin{};
  bool requires_network = true;
  bool requires_external_power = false;
  bool allow_cellular = false;
  /// Time budget the host grants once the task starts.
  std::chrono::milliseconds time_limit{std::chrono::seconds(25)};
};

struct SchedulePolicy {
  std::chrono::minutes recent_use{30};
  std::chrono::minutes fetch_delay_after_use{15};
  std::chrono::minutes fetch_delay_idle{5};
  int pending_threshold = 10;
  std::chrono::hours pending_metric_ttl{6};
  std::chrono::hours maintenance_fallback{24};
  std::chrono::minutes processing_delay_backlog{15};
  std::chrono::minutes processing_delay_idle{30};
  std::chrono::seconds fetch_time_limit{25};
  std::chrono::seconds processing_time_limit{60};
  /// Ingestion window inside a fetch task.
  std::chrono::seconds fetch_batch_window{10};
};

/// Next fetch task request for @p state at @p now.
ScheduleRequest compute_fetch_request(const ActivityState &state,
                                      TimePoint now,
                                      const SchedulePolicy &policy,
                                      bool allow_cellular);

/// Next processing task request for @p state at @p now.
ScheduleRequest compute_processing_request(const ActivityState &state,
                                           TimePoint now,
                                           const SchedulePolicy &policy,
                                           bool allow_cellular);

/**
 * Host background task system. The registered handler is invoked when a
 * submitted task starts; its token is cancelled when the host expires the
 * task, and returning from the handler reports completion.
 */
class TaskHost {
public:
  using Handler =
      std::function<void(TaskKind kind, const CancellationToken &expiration)>;

  virtual ~TaskHost() = default;

  virtual void register_handler(Handler handler) = 0;

  /**
   * Submit or replace the pending request for `request.kind`.
   *
   * @throws SchedulingError When the host refuses the request.
   */
  virtual void submit(const ScheduleRequest &request) = 0;
};

class BackgroundScheduler {
public:
  /**
   * @param state_file Optional persistence for the activity state.
   */
  BackgroundScheduler(std::shared_ptr<TaskHost> host,
                      std::shared_ptr<SyncCoordinator> coordinator,
                      std::shared_ptr<ActivityStateFile> state_file = nullptr,
                      SchedulePolicy policy = {},
                      ClockFn clock = system_clock_fn());

  /// Register the task handler with the host and hook into the coordinator
  /// so every sync run recomputes the schedule.
  void attach();

  /// Submit the next fetch request. Returns `false` if the host refused.
  bool schedule_fetch();

  /// Submit the next processing request. Returns `false` if the host refused.
  bool schedule_processing();

  /// Run the task the host started and reschedule it afterwards.
  void handle_task(TaskKind kind, const CancellationToken &expiration);

  /// Record that the user is actively using the application now.
  void record_foreground_use();

  /// Update the pending work metric.
  void update_pending_work(int count);

  TaskState state(TaskKind kind) const;
  ActivityState activity() const;
  std::optional<ScheduleRequest> last_request(TaskKind kind) const;

private:
  bool submit(const ScheduleRequest &request);
  void on_sync_finished(const SyncReport &report);
  void persist_locked();

  std::shared_ptr<TaskHost> host_;
  std::shared_ptr<SyncCoordinator> coordinator_;
  std::shared_ptr<ActivityStateFile> state_file_;
  SchedulePolicy policy_;
  ClockFn clock_;

  mutable std::mutex mutex_;
  ActivityState activity_;
  std::map<TaskKind, TaskState> states_;
  std::map<TaskKind, ScheduleRequest> requests_;
};

} // namespace arsync

#endif // ARTICLESYNC_BACKGROUND_SCHEDULER_HPP

#include "background_scheduler.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> scheduler_log() {
  static auto logger = category_logger("scheduler");
  return logger;
}

const char *failure_name(SchedulingFailure reason) {
  switch (reason) {
  case SchedulingFailure::Unsupported:
    return "unsupported";
  case SchedulingFailure::Denied:
    return "denied";
  case SchedulingFailure::OverQuota:
    return "over quota";
  }
  return "refused";
}

} // namespace

const char *to_string(TaskKind kind) {
  return kind == TaskKind::Fetch ? "fetch" : "processing";
}

const char *to_string(TaskState state) {
  switch (state) {
  case TaskState::Unscheduled:
    return "unscheduled";
  case TaskState::Scheduled:
    return "scheduled";
  case TaskState::Running:
    return "running";
  case TaskState::Completed:
    return "completed";
  case TaskState::Expired:
    return "expired";
  }
  return "unscheduled";
}

ScheduleRequest compute_fetch_request(const ActivityState &state,
                                      TimePoint now,
                                      const SchedulePolicy &policy,
                                      bool allow_cellular) {
  // Stay out of the way of an active user; catch up sooner when idle.
  bool recently_used =
      state.last_foreground && now - *state.last_foreground < policy.recent_use;
  ScheduleRequest request;
  request.kind = TaskKind::Fetch;
  request.earliest_begin = now + (recently_used ? policy.fetch_delay_after_use
                                                : policy.fetch_delay_idle);
  request.requires_network = true;
  request.requires_external_power = false;
  request.allow_cellular = allow_cellular;
  request.time_limit = policy.fetch_time_limit;
  return request;
}

ScheduleRequest compute_processing_request(const ActivityState &state,
                                           TimePoint now,
                                           const SchedulePolicy &policy,
                                           bool allow_cellular) {
  const bool backlog = state.pending_work > policy.pending_threshold;
  const bool metric_fresh =
      state.pending_updated &&
      now - *state.pending_updated < policy.pending_metric_ttl;
  const bool maintenance_overdue =
      !state.last_maintenance ||
      now - *state.last_maintenance > policy.maintenance_fallback;

  ScheduleRequest request;
  request.kind = TaskKind::Processing;
  request.requires_network = true;
  request.requires_external_power =
      metric_fresh && backlog && !maintenance_overdue;
  request.earliest_begin = now + (backlog ? policy.processing_delay_backlog
                                          : policy.processing_delay_idle);
  request.allow_cellular = allow_cellular;
  request.time_limit = policy.processing_time_limit;
  return request;
}

BackgroundScheduler::BackgroundScheduler(
    std::shared_ptr<TaskHost> host,
    std::shared_ptr<SyncCoordinator> coordinator,
    std::shared_ptr<ActivityStateFile> state_file, SchedulePolicy policy,
    ClockFn clock)
    : host_(std::move(host)), coordinator_(std::move(coordinator)),
      state_file_(std::move(state_file)), policy_(policy),
      clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = system_clock_fn();
  }
  if (state_file_) {
    activity_ = state_file_->load();
  }
  states_[TaskKind::Fetch] = TaskState::Unscheduled;
  states_[TaskKind::Processing] = TaskState::Unscheduled;
}

void BackgroundScheduler::attach() {
  host_->register_handler(
      [this](TaskKind kind, const CancellationToken &expiration) {
        handle_task(kind, expiration);
      });
  coordinator_->set_after_run(
      [this](const SyncReport &report) { on_sync_finished(report); });
}

bool BackgroundScheduler::submit(const ScheduleRequest &request) {
  try {
    host_->submit(request);
  } catch (const SchedulingError &e) {
    scheduler_log()->warn("Could not schedule {} task ({}): {}",
                          to_string(request.kind), failure_name(e.reason()),
                          e.what());
    return false;
  } catch (const std::exception &e) {
    scheduler_log()->error("Could not schedule {} task: {}",
                           to_string(request.kind), e.what());
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  states_[request.kind] = TaskState::Scheduled;
  requests_[request.kind] = request;
  auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(
      request.earliest_begin - clock_());
  scheduler_log()->debug(
      "Scheduled {} task in ~{} (power required: {})", to_string(request.kind),
      format_duration(delay), request.requires_external_power);
  return true;
}

bool BackgroundScheduler::schedule_fetch() {
  ScheduleRequest request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    request = compute_fetch_request(activity_, clock_(), policy_,
                                    coordinator_->preferences()
                                        .allow_cellular_sync);
  }
  return submit(request);
}

bool BackgroundScheduler::schedule_processing() {
  ScheduleRequest request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    request = compute_processing_request(activity_, clock_(), policy_,
                                         coordinator_->preferences()
                                             .allow_cellular_sync);
  }
  return submit(request);
}

void BackgroundScheduler::handle_task(TaskKind kind,
                                      const CancellationToken &expiration) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[kind] = TaskState::Running;
  }
  scheduler_log()->info("Background {} task started", to_string(kind));

  std::optional<std::chrono::milliseconds> window;
  if (kind == TaskKind::Fetch) {
    window = policy_.fetch_batch_window;
  }
  SyncReport report = coordinator_->background_sync(expiration, window);
  const bool expired = expiration.is_cancelled();

  {
    std::lock_guard<std::mutex> lock(mutex_);
    states_[kind] = expired ? TaskState::Expired : TaskState::Completed;
    if (kind == TaskKind::Processing &&
        report.outcome == SyncOutcome::Success) {
      activity_.last_maintenance = clock_();
      persist_locked();
    }
  }
  scheduler_log()->info("Background {} task {} ({})", to_string(kind),
                        expired ? "expired" : "completed",
                        to_string(report.outcome));

  if (kind == TaskKind::Fetch) {
    schedule_fetch();
  } else {
    schedule_processing();
  }
}

void BackgroundScheduler::on_sync_finished(const SyncReport &report) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (report.outcome == SyncOutcome::Success ||
        report.outcome == SyncOutcome::Cancelled) {
      activity_.pending_work =
          report.ingestion.failure + report.ingestion.deferred;
      activity_.pending_updated = clock_();
      persist_locked();
    }
  }
  schedule_fetch();
  schedule_processing();
}

void BackgroundScheduler::record_foreground_use() {
  std::lock_guard<std::mutex> lock(mutex_);
  activity_.last_foreground = clock_();
  persist_locked();
}

void BackgroundScheduler::update_pending_work(int count) {
  std::lock_guard<std::mutex> lock(mutex_);
  activity_.pending_work = count;
  activity_.pending_updated = clock_();
  persist_locked();
}

TaskState BackgroundScheduler::state(TaskKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return states_.at(kind);
}

ActivityState BackgroundScheduler::activity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return activity_;
}

std::optional<ScheduleRequest>
BackgroundScheduler::last_request(TaskKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = requests_.find(kind);
  if (it == requests_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void BackgroundScheduler::persist_locked() {
  if (!state_file_) {
    return;
  }
  try {
    state_file_->save(activity_);
  } catch (const std::exception &e) {
    scheduler_log()->warn("Could not persist activity state: {}", e.what());
  }
}

} // namespace arsync

#include "sync_coordinator.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> sync_log() {
  static auto logger = category_logger("sync");
  return logger;
}

nlohmann::json counts_json(const IngestionResult &result) {
  return {{"success", result.success},     {"failure", result.failure},
          {"skipped", result.skipped},     {"deferred", result.deferred},
          {"timed_out", result.timed_out}, {"cancelled", result.cancelled}};
}

} // namespace

const char *to_string(SyncState state) {
  switch (state) {
  case SyncState::Idle:
    return "idle";
  case SyncState::Acquiring:
    return "acquiring";
  case SyncState::Exchanging:
    return "exchanging";
  case SyncState::Ingesting:
    return "ingesting";
  case SyncState::Skipped:
    return "skipped";
  }
  return "idle";
}

const char *to_string(SyncOutcome outcome) {
  switch (outcome) {
  case SyncOutcome::Success:
    return "success";
  case SyncOutcome::Skipped:
    return "skipped";
  case SyncOutcome::TimedOut:
    return "timed-out";
  case SyncOutcome::Failed:
    return "failed";
  case SyncOutcome::Cancelled:
    return "cancelled";
  }
  return "failed";
}

const char *to_string(SkipReason reason) {
  switch (reason) {
  case SkipReason::None:
    return "none";
  case SkipReason::Throttled:
    return "throttled";
  case SkipReason::InFlight:
    return "in-flight";
  case SkipReason::NetworkDenied:
    return "network-denied";
  }
  return "none";
}

const char *to_string(SyncTrigger trigger) {
  return trigger == SyncTrigger::Manual ? "manual" : "background";
}

nlohmann::json to_json(const SyncReport &report) {
  nlohmann::json out{{"trigger", to_string(report.trigger)},
                     {"outcome", to_string(report.outcome)},
                     {"started_at", format_iso8601(report.started_at)},
                     {"finished_at", format_iso8601(report.finished_at)},
                     {"seen_sent", report.seen_sent},
                     {"unseen_received", report.unseen_received},
                     {"ingestion", counts_json(report.ingestion)}};
  if (report.skip_reason != SkipReason::None) {
    out["skip_reason"] = to_string(report.skip_reason);
  }
  if (report.network) {
    out["network"] = to_string(*report.network);
  }
  if (!report.error.empty()) {
    out["error"] = report.error;
  }
  return out;
}

SyncCoordinator::SyncCoordinator(std::shared_ptr<NetworkGate> gate,
                                 std::shared_ptr<ArticleStore> store,
                                 std::shared_ptr<SyncClient> client,
                                 std::shared_ptr<IngestionPipeline> pipeline,
                                 CoordinatorOptions options, ClockFn clock,
                                 std::shared_ptr<EventDispatcher> events)
    : gate_(std::move(gate)), store_(std::move(store)),
      client_(std::move(client)), pipeline_(std::move(pipeline)),
      options_(options), clock_(std::move(clock)), events_(std::move(events)) {
  if (!clock_) {
    clock_ = system_clock_fn();
  }
}

void SyncCoordinator::set_preferences(const SyncPreferences &prefs) {
  std::lock_guard<std::mutex> lock(mutex_);
  prefs_ = prefs;
}

SyncPreferences SyncCoordinator::preferences() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return prefs_;
}

void SyncCoordinator::set_after_run(AfterRunHook hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  after_run_ = std::move(hook);
}

void SyncCoordinator::set_state_observer(StateObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

std::optional<SyncReport> SyncCoordinator::last_report() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_report_;
}

bool SyncCoordinator::manual_sync(const CancellationToken &token) {
  const auto now = clock_();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_manual_ && now - *last_manual_ < options_.manual_throttle) {
      auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
          options_.manual_throttle - (now - *last_manual_));
      sync_log()->info("Manual sync throttled; next allowed in {}",
                       format_duration(wait));
      return false;
    }
    last_manual_ = now;
  }
  auto report = run(SyncTrigger::Manual, token, std::nullopt);
  return report.outcome != SyncOutcome::Skipped;
}

SyncReport SyncCoordinator::background_sync(
    const CancellationToken &token,
    std::optional<std::chrono::milliseconds> batch_window) {
  return run(SyncTrigger::Background, token, batch_window);
}

void SyncCoordinator::transition(SyncState next) {
  state_.store(next);
  StateObserver observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = observer_;
  }
  if (observer) {
    observer(next);
  }
}

void SyncCoordinator::publish(const char *name, nlohmann::json data) {
  if (events_) {
    events_->publish(SyncEvent{name, std::move(data)});
  }
}

SyncReport
SyncCoordinator::run(SyncTrigger trigger, const CancellationToken &token,
                     std::optional<std::chrono::milliseconds> batch_window) {
  SyncReport report;
  report.trigger = trigger;
  report.started_at = clock_();

  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true)) {
    report.outcome = SyncOutcome::Skipped;
    report.skip_reason = SkipReason::InFlight;
    report.finished_at = clock_();
    sync_log()->info("{} sync skipped: another sync is in progress",
                     to_string(trigger));
    return report;
  }

  try {
    execute(report, token, batch_window);
  } catch (const std::exception &e) {
    report.outcome = SyncOutcome::Failed;
    report.error = e.what();
    sync_log()->error("{} sync failed: {}", to_string(trigger), e.what());
  }
  finish(report);
  return report;
}

void SyncCoordinator::execute(
    SyncReport &report, const CancellationToken &token,
    std::optional<std::chrono::milliseconds> batch_window) {
  auto kind = gate_->classify(token);
  report.network = kind;
  if (!NetworkGate::should_sync(kind, preferences())) {
    transition(SyncState::Skipped);
    report.outcome = SyncOutcome::Skipped;
    report.skip_reason = SkipReason::NetworkDenied;
    sync_log()->info("{} sync skipped: not allowed on {} network",
                     to_string(report.trigger), to_string(kind));
    return;
  }

  publish(events::kSyncStarted, {{"trigger", to_string(report.trigger)},
                                 {"network", to_string(kind)}});
  transition(SyncState::Acquiring);
  std::vector<ArticleId> seen;
  try {
    auto since = clock_() - options_.seen_window;
    seen = store_->fetch_seen_identifiers(since);
  } catch (const StorageFailureError &e) {
    report.outcome = SyncOutcome::Failed;
    report.error = e.what();
    sync_log()->error("Could not read seen articles: {}", e.what());
    return;
  }
  report.seen_sent = seen.size();

  transition(SyncState::Exchanging);
  std::vector<ArticleId> unseen;
  CancellationSource exchange(token);
  exchange.cancel_after(options_.exchange_timeout);
  try {
    unseen = client_->exchange(seen, exchange.token());
  } catch (const NetworkTimeoutError &e) {
    report.outcome = SyncOutcome::TimedOut;
    report.error = e.what();
    sync_log()->warn("Sync exchange timed out after {}: {}",
                     format_duration(options_.exchange_timeout), e.what());
    return;
  } catch (const OperationCancelledError &e) {
    report.outcome = SyncOutcome::Cancelled;
    report.error = e.what();
    sync_log()->info("Sync exchange cancelled");
    return;
  } catch (const SyncError &e) {
    report.outcome = SyncOutcome::Failed;
    report.error = e.what();
    sync_log()->warn("Sync exchange failed: {}", e.what());
    return;
  }
  report.unseen_received = unseen.size();

  transition(SyncState::Ingesting);
  std::optional<IngestionPipeline::SteadyTime> deadline;
  if (batch_window) {
    deadline = std::chrono::steady_clock::now() + *batch_window;
  }
  if (!unseen.empty()) {
    report.ingestion = pipeline_->process(unseen, token, deadline);
    publish(events::kBatchProcessed, counts_json(report.ingestion));
  }
  report.outcome = token.reason() == CancelReason::Cancelled
                       ? SyncOutcome::Cancelled
                       : SyncOutcome::Success;
}

void SyncCoordinator::finish(SyncReport &report) {
  report.finished_at = clock_();
  sync_log()->info("{} sync finished: {} (sent {}, unseen {}, inserted {})",
                   to_string(report.trigger), to_string(report.outcome),
                   report.seen_sent, report.unseen_received,
                   report.ingestion.success);
  if (report.skip_reason != SkipReason::NetworkDenied) {
    publish(events::kSyncStopped, to_json(report));
  }

  AfterRunHook hook;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_report_ = report;
    hook = after_run_;
  }
  if (hook) {
    try {
      hook(report);
    } catch (const std::exception &e) {
      sync_log()->error("After-run hook failed: {}", e.what());
    }
  }
  transition(SyncState::Idle);
  in_flight_.store(false);
}

} // namespace arsync

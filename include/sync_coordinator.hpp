/**
 * @file sync_coordinator.hpp
 * @brief Single-flight orchestration of one sync run.
 */

#ifndef ARTICLESYNC_SYNC_COORDINATOR_HPP
#define ARTICLESYNC_SYNC_COORDINATOR_HPP

#include "article_store.hpp"
#include "cancellation.hpp"
#include "event_dispatcher.hpp"
#include "ingestion_pipeline.hpp"
#include "network_gate.hpp"
#include "sync_client.hpp"
#include "util/clock.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace arsync {

enum class SyncState { Idle, Acquiring, Exchanging, Ingesting, Skipped };
enum class SyncOutcome { Success, Skipped, TimedOut, Failed, Cancelled };
enum class SkipReason { None, Throttled, InFlight, NetworkDenied };
enum class SyncTrigger { Manual, Background };

const char *to_string(SyncState state);
const char *to_string(SyncOutcome outcome);
const char *to_string(SkipReason reason);
const char *to_string(SyncTrigger trigger);

/// Record of one sync run.
struct SyncReport {
  SyncTrigger trigger = SyncTrigger::Background;
  TimePoint started_at{};
  TimePoint finished_at{};
  std::optional<NetworkKind> network;
  SyncOutcome outcome = SyncOutcome::Skipped;
  SkipReason skip_reason = SkipReason::None;
  std::size_t seen_sent = 0;
  std::size_t unseen_received = 0;
  IngestionResult ingestion;
  std::string error;
};

nlohmann::json to_json(const SyncReport &report);

struct CoordinatorOptions {
  /// Ceiling for the seen/unseen exchange with the server.
  std::chrono::milliseconds exchange_timeout{std::chrono::seconds(60)};
  /// Minimum spacing between accepted manual syncs.
  std::chrono::milliseconds manual_throttle{std::chrono::seconds(30)};
  /// How far back locally seen identifiers are reported.
  std::chrono::milliseconds seen_window{std::chrono::hours(24)};
};

/**
 * Runs the sync algorithm under a process-wide single-flight lock.
 *
 * Only one run at a time can be past the network check; concurrent triggers
 * return immediately with SyncOutcome::Skipped. The lock holder always calls
 * the after-run hook, used to submit the next schedule, before it releases
 * the lock, whatever the run's outcome.
 */
class SyncCoordinator {
public:
  using StateObserver = std::function<void(SyncState)>;
  using AfterRunHook = std::function<void(const SyncReport &)>;

  SyncCoordinator(std::shared_ptr<NetworkGate> gate,
                  std::shared_ptr<ArticleStore> store,
                  std::shared_ptr<SyncClient> client,
                  std::shared_ptr<IngestionPipeline> pipeline,
                  CoordinatorOptions options = {},
                  ClockFn clock = system_clock_fn(),
                  std::shared_ptr<EventDispatcher> events = nullptr);

  /**
   * User-initiated sync, throttled against the previous accepted manual
   * request. Runs on the calling thread.
   *
   * @return `false` without touching the network when throttled, when
   *         another run holds the lock or when the network gate denies sync;
   *         `true` once a run has started.
   */
  bool manual_sync(const CancellationToken &token = {});

  /**
   * Sync started by the background scheduler. Not throttled.
   *
   * @param token Cancelled when the host revokes the task's time budget.
   * @param batch_window When set, ingestion stops starting new articles
   *        after this long.
   */
  SyncReport background_sync(const CancellationToken &token = {},
                             std::optional<std::chrono::milliseconds>
                                 batch_window = std::nullopt);

  void set_preferences(const SyncPreferences &prefs);
  SyncPreferences preferences() const;

  /// Called by the lock holder after every run, before the lock is released.
  void set_after_run(AfterRunHook hook);

  /// Observe state transitions of the lock holder.
  void set_state_observer(StateObserver observer);

  SyncState state() const { return state_.load(); }
  bool in_flight() const { return in_flight_.load(); }
  std::optional<SyncReport> last_report() const;

private:
  SyncReport run(SyncTrigger trigger, const CancellationToken &token,
                 std::optional<std::chrono::milliseconds> batch_window);
  void execute(SyncReport &report, const CancellationToken &token,
               std::optional<std::chrono::milliseconds> batch_window);
  void finish(SyncReport &report);
  void transition(SyncState next);
  void publish(const char *name, nlohmann::json data);

  std::shared_ptr<NetworkGate> gate_;
  std::shared_ptr<ArticleStore> store_;
  std::shared_ptr<SyncClient> client_;
  std::shared_ptr<IngestionPipeline> pipeline_;
  CoordinatorOptions options_;
  ClockFn clock_;
  std::shared_ptr<EventDispatcher> events_;

  std::atomic<bool> in_flight_{false};
  std::atomic<SyncState> state_{SyncState::Idle};

  mutable std::mutex mutex_;
  SyncPreferences prefs_;
  std::optional<TimePoint> last_manual_;
  std::optional<SyncReport> last_report_;
  AfterRunHook after_run_;
  StateObserver observer_;
};

} // namespace arsync

#endif // ARTICLESYNC_SYNC_COORDINATOR_HPP

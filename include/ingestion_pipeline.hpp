/**
 * @file ingestion_pipeline.hpp
 * @brief Fetch, parse and store unseen articles with at-most-once semantics.
 */

#ifndef ARTICLESYNC_INGESTION_PIPELINE_HPP
#define ARTICLESYNC_INGESTION_PIPELINE_HPP

#include "article_store.hpp"
#include "cancellation.hpp"
#include "dedup_registry.hpp"
#include "sync_client.hpp"
#include "util/clock.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arsync {

/// What happened to one identifier during a pipeline run.
enum class ItemOutcome {
  Inserted,
  /// Recently completed or already in the store.
  AlreadyProcessed,
  /// Another worker holds the claim.
  Contended,
  Failed,
  TimedOut,
  Cancelled,
  /// Not started because the batch ceiling passed or the run was cancelled.
  Deferred
};

const char *to_string(ItemOutcome outcome);

/**
 * Counters for a pipeline run. `failure` includes `timed_out` and
 * `cancelled`; deferred identifiers were never claimed.
 */
struct IngestionResult {
  int success = 0;
  int failure = 0;
  int skipped = 0;
  int deferred = 0;
  int timed_out = 0;
  int cancelled = 0;
  std::vector<std::pair<ArticleId, ItemOutcome>> outcomes;

  void record(const ArticleId &id, ItemOutcome outcome);
  void merge(const IngestionResult &other);
};

struct IngestionOptions {
  /// Parallel article fetches.
  int concurrency = 5;
  /// Identifiers handed to the workers at a time.
  std::size_t batch_size = 10;
  /// Pause between chunks.
  std::chrono::milliseconds batch_pause{100};
  /// Ceiling for fetching one article.
  std::chrono::milliseconds item_timeout{std::chrono::seconds(30)};
  /// Article fetch starts per minute, zero for unlimited.
  int max_fetches_per_minute = 0;
};

class IngestionPipeline {
public:
  using SteadyTime = std::chrono::steady_clock::time_point;

  IngestionPipeline(std::shared_ptr<DedupRegistry> registry,
                    std::shared_ptr<ArticleStore> store,
                    std::shared_ptr<SyncClient> client,
                    IngestionOptions options = {},
                    ClockFn clock = system_clock_fn());
  ~IngestionPipeline();

  IngestionPipeline(const IngestionPipeline &) = delete;
  IngestionPipeline &operator=(const IngestionPipeline &) = delete;

  /**
   * Ingest @p ids with bounded concurrency.
   *
   * Duplicate identifiers in the input are processed once. Cancelling
   * @p token aborts in-flight fetches and stops new items from starting.
   * When @p batch_deadline passes, no further items are started; the ones
   * not started are reported as deferred and stay unclaimed.
   */
  IngestionResult process(const std::vector<ArticleId> &ids,
                          const CancellationToken &token = {},
                          std::optional<SteadyTime> batch_deadline =
                              std::nullopt);

  /// Process one identifier on the calling thread.
  ItemOutcome process_one(const ArticleId &id, const CancellationToken &token);

  const IngestionOptions &options() const { return options_; }

private:
  ItemOutcome process_item(const ArticleId &id, const CancellationToken &token,
                           const std::unordered_set<ArticleId> &known);
  IngestionResult run_chunk(const std::vector<ArticleId> &chunk,
                            const CancellationToken &token,
                            std::optional<SteadyTime> batch_deadline);

  std::shared_ptr<DedupRegistry> registry_;
  std::shared_ptr<ArticleStore> store_;
  std::shared_ptr<SyncClient> client_;
  IngestionOptions options_;
  ClockFn clock_;
  WorkerPool pool_;
};

} // namespace arsync

#endif // ARTICLESYNC_INGESTION_PIPELINE_HPP

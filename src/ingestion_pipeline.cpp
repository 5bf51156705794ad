#include "ingestion_pipeline.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <future>
#include <unordered_set>

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> ingest_log() {
  static auto logger = category_logger("ingest");
  return logger;
}

bool ceiling_reached(const CancellationToken &token,
                     const std::optional<IngestionPipeline::SteadyTime> &end) {
  return token.is_cancelled() ||
         (end && std::chrono::steady_clock::now() >= *end);
}

} // namespace

const char *to_string(ItemOutcome outcome) {
  switch (outcome) {
  case ItemOutcome::Inserted:
    return "inserted";
  case ItemOutcome::AlreadyProcessed:
    return "already-processed";
  case ItemOutcome::Contended:
    return "contended";
  case ItemOutcome::Failed:
    return "failed";
  case ItemOutcome::TimedOut:
    return "timed-out";
  case ItemOutcome::Cancelled:
    return "cancelled";
  case ItemOutcome::Deferred:
    return "deferred";
  }
  return "failed";
}

void IngestionResult::record(const ArticleId &id, ItemOutcome outcome) {
  switch (outcome) {
  case ItemOutcome::Inserted:
    ++success;
    break;
  case ItemOutcome::AlreadyProcessed:
  case ItemOutcome::Contended:
    ++skipped;
    break;
  case ItemOutcome::TimedOut:
    ++timed_out;
    ++failure;
    break;
  case ItemOutcome::Cancelled:
    ++cancelled;
    ++failure;
    break;
  case ItemOutcome::Failed:
    ++failure;
    break;
  case ItemOutcome::Deferred:
    ++deferred;
    break;
  }
  outcomes.emplace_back(id, outcome);
}

void IngestionResult::merge(const IngestionResult &other) {
  for (const auto &[id, outcome] : other.outcomes) {
    record(id, outcome);
  }
}

IngestionPipeline::IngestionPipeline(std::shared_ptr<DedupRegistry> registry,
                                     std::shared_ptr<ArticleStore> store,
                                     std::shared_ptr<SyncClient> client,
                                     IngestionOptions options, ClockFn clock)
    : registry_(std::move(registry)), store_(std::move(store)),
      client_(std::move(client)), options_(options), clock_(std::move(clock)),
      pool_(options.concurrency, options.max_fetches_per_minute) {
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
  if (!clock_) {
    clock_ = system_clock_fn();
  }
  pool_.start();
}

IngestionPipeline::~IngestionPipeline() { pool_.stop(); }

ItemOutcome IngestionPipeline::process_one(const ArticleId &id,
                                           const CancellationToken &token) {
  return process_item(id, token, {});
}

ItemOutcome
IngestionPipeline::process_item(const ArticleId &id,
                                const CancellationToken &token,
                                const std::unordered_set<ArticleId> &known) {
  ClaimGuard claim(*registry_, id);
  if (!claim) {
    return ItemOutcome::Contended;
  }
  if (registry_->was_recently_completed(id)) {
    ingest_log()->debug("Skipping {}: completed recently", id);
    return ItemOutcome::AlreadyProcessed;
  }

  const std::string key = derive_storage_key(id);
  try {
    if (known.count(id) != 0 || store_->exists(id, key)) {
      registry_->check_and_mark_completed(id);
      ingest_log()->debug("Skipping {}: already stored as {}", id, key);
      return ItemOutcome::AlreadyProcessed;
    }
  } catch (const StorageFailureError &e) {
    ingest_log()->warn("Existence check for {} failed: {}", id, e.what());
    return ItemOutcome::Failed;
  }

  CancellationSource item(token);
  item.cancel_after(options_.item_timeout);
  try {
    auto payload = client_->fetch_article(id, item.token());
    auto record = parse_article(payload, id, clock_());
    store_->insert_atomic(record, key);
  } catch (const NetworkTimeoutError &e) {
    ingest_log()->warn("Fetching {} timed out: {}", id, e.what());
    return ItemOutcome::TimedOut;
  } catch (const OperationCancelledError &) {
    ingest_log()->info("Fetching {} cancelled", id);
    return ItemOutcome::Cancelled;
  } catch (const ParseFailureError &e) {
    ingest_log()->warn("Payload for {} rejected: {}", id, e.what());
    return ItemOutcome::Failed;
  } catch (const StorageFailureError &e) {
    ingest_log()->error("Storing {} failed: {}", id, e.what());
    return ItemOutcome::Failed;
  } catch (const SyncError &e) {
    ingest_log()->warn("Fetching {} failed: {}", id, e.what());
    return ItemOutcome::Failed;
  }

  registry_->mark_completed(id);
  ingest_log()->debug("Ingested {}", id);
  return ItemOutcome::Inserted;
}

IngestionResult
IngestionPipeline::run_chunk(const std::vector<ArticleId> &chunk,
                             const CancellationToken &token,
                             std::optional<SteadyTime> batch_deadline) {
  std::unordered_set<ArticleId> known;
  try {
    known = store_->exists_any_of(chunk);
  } catch (const StorageFailureError &e) {
    ingest_log()->warn("Batch existence check failed, checking per item: {}",
                       e.what());
  }

  std::vector<ItemOutcome> outcomes(chunk.size(), ItemOutcome::Deferred);
  std::vector<std::future<void>> pending;
  pending.reserve(chunk.size());
  for (std::size_t i = 0; i < chunk.size(); ++i) {
    pending.push_back(pool_.submit([this, &chunk, &outcomes, &known, &token,
                                    batch_deadline, i] {
      // Items only start while the run is live; started items finish.
      if (ceiling_reached(token, batch_deadline)) {
        return;
      }
      outcomes[i] = process_item(chunk[i], token, known);
    }));
  }

  IngestionResult result;
  for (std::size_t i = 0; i < chunk.size(); ++i) {
    try {
      pending[i].get();
    } catch (const std::future_error &) {
      // Dropped by a stopping pool before it started.
      outcomes[i] = ItemOutcome::Deferred;
    } catch (const std::exception &e) {
      ingest_log()->error("Unexpected error while ingesting {}: {}", chunk[i],
                          e.what());
      outcomes[i] = ItemOutcome::Failed;
    }
    result.record(chunk[i], outcomes[i]);
  }
  return result;
}

IngestionResult
IngestionPipeline::process(const std::vector<ArticleId> &ids,
                           const CancellationToken &token,
                           std::optional<SteadyTime> batch_deadline) {
  std::vector<ArticleId> unique;
  unique.reserve(ids.size());
  std::unordered_set<ArticleId> seen;
  for (const auto &id : ids) {
    if (seen.insert(id).second) {
      unique.push_back(id);
    }
  }

  IngestionResult result;
  std::size_t next = 0;
  while (next < unique.size()) {
    if (next > 0 && options_.batch_pause.count() > 0) {
      token.wait_for(options_.batch_pause);
    }
    if (ceiling_reached(token, batch_deadline)) {
      break;
    }
    std::size_t end = std::min(unique.size(), next + options_.batch_size);
    std::vector<ArticleId> chunk(unique.begin() + next, unique.begin() + end);
    result.merge(run_chunk(chunk, token, batch_deadline));
    next = end;
  }
  for (; next < unique.size(); ++next) {
    result.record(unique[next], ItemOutcome::Deferred);
  }

  ingest_log()->info("Ingestion finished: {} inserted, {} failed, {} skipped, "
                     "{} deferred",
                     result.success, result.failure, result.skipped,
                     result.deferred);
  return result;
}

} // namespace arsync

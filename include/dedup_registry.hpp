/**
 * @file dedup_registry.hpp
 * @brief Live claims and recent completions for article identifiers.
 *
 * The registry is the only place that decides whether a worker may process
 * an identifier. It holds two tiers of state: live claims, which exist while
 * a worker owns an identifier, and a completion cache whose entries expire
 * after a fixed window. Expired entries of a shard are swept while its lock
 * is held for a lookup or mark, at most once per window, and each shard has a
 * hard size cap that evicts its oldest entry. State is process local and
 * never persisted.
 */

#ifndef ARTICLESYNC_DEDUP_REGISTRY_HPP
#define ARTICLESYNC_DEDUP_REGISTRY_HPP

#include "util/clock.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace arsync {

class DedupRegistry {
public:
  static constexpr std::chrono::minutes kDefaultCompletionTtl{10};
  static constexpr std::size_t kDefaultCompletionCapacity = 1000;

  /**
   * @param completion_ttl How long a completed identifier counts as a
   *        duplicate.
   * @param clock Time source for completion timestamps.
   * @param shard_count Number of independently locked shards.
   * @param completion_capacity Upper bound on cached completions, split
   *        evenly across shards.
   */
  explicit DedupRegistry(
      std::chrono::milliseconds completion_ttl = kDefaultCompletionTtl,
      ClockFn clock = system_clock_fn(), std::size_t shard_count = 16,
      std::size_t completion_capacity = kDefaultCompletionCapacity);

  /**
   * Claim @p id for the calling worker.
   *
   * @return `true` when the claim was created, `false` when another worker
   *         already holds it.
   */
  bool try_claim(const std::string &id);

  /// Drop the claim on @p id. Releasing an unclaimed id does nothing.
  void release(const std::string &id);

  /// Whether @p id completed within the completion window.
  bool was_recently_completed(const std::string &id);

  /// Record @p id as completed now.
  void mark_completed(const std::string &id);

  /**
   * Atomically test and record completion.
   *
   * @return `true` if @p id was already recently completed (nothing is
   *         changed); `false` if it was not, in which case it is now marked.
   */
  bool check_and_mark_completed(const std::string &id);

  /**
   * Claim every identifier that is free. Each id is claimed independently,
   * so a busy id never blocks the others.
   *
   * @return The claimed subset, in input order.
   */
  std::vector<std::string> try_claim_batch(const std::vector<std::string> &ids);

  bool is_claimed(const std::string &id) const;

  /// Number of live claims across all shards.
  std::size_t live_claim_count() const;

  /// Number of cached completions, including expired ones not yet swept.
  std::size_t completed_count() const;

  std::chrono::milliseconds completion_ttl() const { return ttl_; }

private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_set<std::string> claims;
    std::unordered_map<std::string, TimePoint> completed;
    TimePoint next_sweep{};
  };

  Shard &shard_for(const std::string &id) const;
  bool fresh_locked(Shard &shard, const std::string &id, TimePoint now);
  void sweep_locked(Shard &shard, TimePoint now, bool force);
  void record_locked(Shard &shard, const std::string &id, TimePoint now);

  std::chrono::milliseconds ttl_;
  ClockFn clock_;
  std::size_t shard_capacity_;
  std::vector<std::unique_ptr<Shard>> shards_;
};

/**
 * Scoped claim on one identifier. The claim is released when the guard is
 * destroyed, on every exit path.
 */
class ClaimGuard {
public:
  ClaimGuard(DedupRegistry &registry, std::string id);
  ~ClaimGuard();

  ClaimGuard(const ClaimGuard &) = delete;
  ClaimGuard &operator=(const ClaimGuard &) = delete;
  ClaimGuard(ClaimGuard &&other) noexcept;
  ClaimGuard &operator=(ClaimGuard &&) = delete;

  /// Whether the claim was obtained.
  bool owns() const noexcept { return owned_; }
  explicit operator bool() const noexcept { return owned_; }

  /// Release early. Safe to call more than once.
  void release();

private:
  DedupRegistry *registry_;
  std::string id_;
  bool owned_;
};

} // namespace arsync

#endif // ARTICLESYNC_DEDUP_REGISTRY_HPP

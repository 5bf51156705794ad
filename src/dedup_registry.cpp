#include "dedup_registry.hpp"
#include "log.hpp"

#include <functional>

namespace arsync {

namespace {
std::shared_ptr<spdlog::logger> dedup_log() {
  static auto log = category_logger("dedup");
  return log;
}
} // namespace

DedupRegistry::DedupRegistry(std::chrono::milliseconds completion_ttl,
                             ClockFn clock, std::size_t shard_count,
                             std::size_t completion_capacity)
    : ttl_(completion_ttl), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = system_clock_fn();
  }
  if (shard_count == 0) {
    shard_count = 1;
  }
  shard_capacity_ = (completion_capacity + shard_count - 1) / shard_count;
  if (shard_capacity_ == 0) {
    shard_capacity_ = 1;
  }
  shards_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

DedupRegistry::Shard &DedupRegistry::shard_for(const std::string &id) const {
  auto index = std::hash<std::string>{}(id) % shards_.size();
  return *shards_[index];
}

bool DedupRegistry::try_claim(const std::string &id) {
  auto &shard = shard_for(id);
  bool inserted = false;
  {
    std::lock_guard<std::mutex> lock(shard.mutex);
    inserted = shard.claims.insert(id).second;
  }
  if (!inserted) {
    dedup_log()->debug("Duplicate prevented: '{}' is already being processed",
                       id);
  }
  return inserted;
}

void DedupRegistry::release(const std::string &id) {
  auto &shard = shard_for(id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.claims.erase(id);
}

void DedupRegistry::sweep_locked(Shard &shard, TimePoint now, bool force) {
  if (!force && now < shard.next_sweep) {
    return;
  }
  for (auto it = shard.completed.begin(); it != shard.completed.end();) {
    if (now - it->second >= ttl_) {
      it = shard.completed.erase(it);
    } else {
      ++it;
    }
  }
  shard.next_sweep = now + ttl_;
}

void DedupRegistry::record_locked(Shard &shard, const std::string &id,
                                  TimePoint now) {
  auto existing = shard.completed.find(id);
  if (existing != shard.completed.end()) {
    existing->second = now;
    return;
  }
  if (shard.completed.size() >= shard_capacity_) {
    sweep_locked(shard, now, true);
  }
  if (shard.completed.size() >= shard_capacity_) {
    auto oldest = shard.completed.begin();
    for (auto it = shard.completed.begin(); it != shard.completed.end(); ++it) {
      if (it->second < oldest->second) {
        oldest = it;
      }
    }
    dedup_log()->debug("Completion cache full; forgetting '{}'", oldest->first);
    shard.completed.erase(oldest);
  }
  shard.completed.emplace(id, now);
}

bool DedupRegistry::fresh_locked(Shard &shard, const std::string &id,
                                 TimePoint now) {
  sweep_locked(shard, now, false);
  auto it = shard.completed.find(id);
  if (it == shard.completed.end()) {
    return false;
  }
  if (now - it->second < ttl_) {
    return true;
  }
  shard.completed.erase(it);
  return false;
}

bool DedupRegistry::was_recently_completed(const std::string &id) {
  auto now = clock_();
  auto &shard = shard_for(id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  return fresh_locked(shard, id, now);
}

void DedupRegistry::mark_completed(const std::string &id) {
  auto now = clock_();
  auto &shard = shard_for(id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  sweep_locked(shard, now, false);
  record_locked(shard, id, now);
}

bool DedupRegistry::check_and_mark_completed(const std::string &id) {
  auto now = clock_();
  auto &shard = shard_for(id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  if (fresh_locked(shard, id, now)) {
    return true;
  }
  record_locked(shard, id, now);
  return false;
}

std::vector<std::string>
DedupRegistry::try_claim_batch(const std::vector<std::string> &ids) {
  std::vector<std::string> claimed;
  claimed.reserve(ids.size());
  for (const auto &id : ids) {
    if (try_claim(id)) {
      claimed.push_back(id);
    }
  }
  if (claimed.size() != ids.size()) {
    dedup_log()->debug("Batch claim obtained {} of {} identifier(s)",
                       claimed.size(), ids.size());
  }
  return claimed;
}

bool DedupRegistry::is_claimed(const std::string &id) const {
  auto &shard = shard_for(id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  return shard.claims.count(id) != 0;
}

std::size_t DedupRegistry::live_claim_count() const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    total += shard->claims.size();
  }
  return total;
}

std::size_t DedupRegistry::completed_count() const {
  std::size_t total = 0;
  for (const auto &shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    total += shard->completed.size();
  }
  return total;
}

ClaimGuard::ClaimGuard(DedupRegistry &registry, std::string id)
    : registry_(&registry), id_(std::move(id)),
      owned_(registry.try_claim(id_)) {}

ClaimGuard::ClaimGuard(ClaimGuard &&other) noexcept
    : registry_(other.registry_), id_(std::move(other.id_)),
      owned_(other.owned_) {
  other.owned_ = false;
}

ClaimGuard::~ClaimGuard() { release(); }

void ClaimGuard::release() {
  if (owned_) {
    owned_ = false;
    registry_->release(id_);
  }
}

} // namespace arsync

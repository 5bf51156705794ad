#include "dedup_registry.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace arsync;
using namespace std::chrono_literals;

namespace {
struct ManualClock {
  TimePoint now = WallClock::now();
  ClockFn fn() {
    return [this] { return now; };
  }
};
} // namespace

TEST_CASE("claims are exclusive until released") {
  DedupRegistry registry;
  CHECK(registry.try_claim("a"));
  CHECK_FALSE(registry.try_claim("a"));
  CHECK(registry.is_claimed("a"));
  CHECK(registry.live_claim_count() == 1);

  registry.release("a");
  CHECK_FALSE(registry.is_claimed("a"));
  CHECK(registry.try_claim("a"));
  registry.release("a");
  registry.release("a");
  CHECK(registry.live_claim_count() == 0);
}

TEST_CASE("only one of many concurrent claimers wins") {
  DedupRegistry registry;
  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      if (registry.try_claim("contended")) {
        ++winners;
      }
    });
  }
  for (auto &t : threads) {
    t.join();
  }
  CHECK(winners.load() == 1);
}

TEST_CASE("completion expires after the ttl") {
  ManualClock clock;
  DedupRegistry registry(10min, clock.fn());
  CHECK_FALSE(registry.was_recently_completed("x"));
  registry.mark_completed("x");
  CHECK(registry.was_recently_completed("x"));

  clock.now += 9min;
  CHECK(registry.was_recently_completed("x"));
  clock.now += 1min;
  CHECK_FALSE(registry.was_recently_completed("x"));
}

TEST_CASE("check_and_mark_completed reports prior completion") {
  ManualClock clock;
  DedupRegistry registry(1min, clock.fn());
  CHECK_FALSE(registry.check_and_mark_completed("y"));
  CHECK(registry.check_and_mark_completed("y"));
  clock.now += 2min;
  CHECK_FALSE(registry.check_and_mark_completed("y"));
}

TEST_CASE("expired completions are swept without being looked up again") {
  ManualClock clock;
  DedupRegistry registry(10min, clock.fn(), 1, 100000);
  for (int i = 0; i < 5000; ++i) {
    registry.mark_completed("article-" + std::to_string(i));
  }
  CHECK(registry.completed_count() == 5000);

  clock.now += 24h;
  CHECK_FALSE(registry.was_recently_completed("unrelated"));
  CHECK(registry.completed_count() == 0);
}

TEST_CASE("sweeping keeps completions that are still fresh") {
  ManualClock clock;
  DedupRegistry registry(10min, clock.fn(), 1, 100);
  registry.mark_completed("old");
  clock.now += 6min;
  registry.mark_completed("new");
  clock.now += 5min;
  registry.mark_completed("newest");
  CHECK(registry.completed_count() == 2);
  CHECK(registry.was_recently_completed("new"));
  CHECK_FALSE(registry.was_recently_completed("old"));
}

TEST_CASE("completion cache never exceeds its capacity") {
  ManualClock clock;
  DedupRegistry registry(10min, clock.fn(), 4, 40);
  for (int i = 0; i < 1000; ++i) {
    registry.mark_completed("id-" + std::to_string(i));
    clock.now += 1ms;
  }
  CHECK(registry.completed_count() <= 40);
  CHECK(registry.was_recently_completed("id-999"));
  CHECK_FALSE(registry.was_recently_completed("id-0"));
}

TEST_CASE("a full shard forgets its oldest completion first") {
  ManualClock clock;
  DedupRegistry registry(10min, clock.fn(), 1, 3);
  for (const char *id : {"a", "b", "c"}) {
    CHECK_FALSE(registry.check_and_mark_completed(id));
    clock.now += 1s;
  }
  registry.mark_completed("a");
  clock.now += 1s;
  CHECK_FALSE(registry.check_and_mark_completed("d"));
  CHECK(registry.completed_count() == 3);
  CHECK(registry.was_recently_completed("a"));
  CHECK_FALSE(registry.was_recently_completed("b"));
  CHECK(registry.was_recently_completed("c"));
  CHECK(registry.was_recently_completed("d"));
}

TEST_CASE("batch claim skips busy identifiers and keeps order") {
  DedupRegistry registry;
  REQUIRE(registry.try_claim("b"));
  auto claimed = registry.try_claim_batch({"a", "b", "c"});
  CHECK(claimed == std::vector<std::string>{"a", "c"});
  CHECK(registry.live_claim_count() == 3);
}

TEST_CASE("claim guard releases on scope exit") {
  DedupRegistry registry;
  {
    ClaimGuard guard(registry, "g");
    CHECK(guard.owns());
    ClaimGuard second(registry, "g");
    CHECK_FALSE(second);
  }
  CHECK_FALSE(registry.is_claimed("g"));

  {
    ClaimGuard guard(registry, "h");
    ClaimGuard moved(std::move(guard));
    CHECK(moved.owns());
    CHECK_FALSE(guard.owns());
    moved.release();
    CHECK_FALSE(registry.is_claimed("h"));
    moved.release();
  }
  CHECK(registry.live_claim_count() == 0);
}

TEST_CASE("claim guard releases when an exception unwinds") {
  DedupRegistry registry;
  try {
    ClaimGuard guard(registry, "boom");
    throw std::runtime_error("failure while processing");
  } catch (const std::runtime_error &) {
  }
  CHECK_FALSE(registry.is_claimed("boom"));
}

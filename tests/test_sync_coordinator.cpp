#include "dedup_registry.hpp"
#include "fakes.hpp"
#include "sync_coordinator.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace arsync;
using namespace arsync::testing;
using namespace std::chrono_literals;

namespace {
const std::string kSyncUrl = "https://api.test/articles/sync";

std::string url(const std::string &name) {
  return "https://cdn.test/" + name + ".json";
}

HttpResponse article_response(const std::string &requested) {
  return json_response(200, nlohmann::json{{"title", requested},
                                           {"body", "Body text"}}
                                .dump());
}

/// Coordinator over in-memory collaborators. The server answers the sync
/// exchange with `unseen` and serves every article URL.
struct CoordinatorFixture {
  explicit CoordinatorFixture(NetworkKind network = NetworkKind::Wifi,
                              CoordinatorOptions options = {})
      : network_kind(network),
        store(std::make_shared<MemoryArticleStore>()),
        registry(std::make_shared<DedupRegistry>(10min, clock.fn())) {
    http = std::make_shared<ScriptedHttpClient>(
        [this](const RecordedRequest &req, const CancellationToken &token) {
          if (req.url == kSyncUrl) {
            if (on_exchange) {
              on_exchange(req, token);
            }
            std::lock_guard<std::mutex> lock(mutex);
            last_exchange_body = nlohmann::json::parse(req.body);
            return json_response(
                200, nlohmann::json{{"unseen_articles", unseen}}.dump());
          }
          return article_response(req.url);
        });
    client = std::make_shared<SyncClient>(http, "https://api.test");
    IngestionOptions ingest;
    ingest.batch_pause = 1ms;
    pipeline = std::make_shared<IngestionPipeline>(registry, store, client,
                                                   ingest, clock.fn());
    gate = std::make_shared<NetworkGate>(
        [this] { return std::make_unique<FixedNetworkMonitor>(network_kind); });
    coordinator = std::make_shared<SyncCoordinator>(
        gate, store, client, pipeline, options, clock.fn());
    coordinator->set_state_observer([this](SyncState state) {
      std::lock_guard<std::mutex> lock(mutex);
      states.push_back(state);
    });
  }

  std::vector<SyncState> observed_states() {
    std::lock_guard<std::mutex> lock(mutex);
    return states;
  }

  ManualClock clock;
  NetworkKind network_kind;
  std::vector<ArticleId> unseen;
  std::function<void(const RecordedRequest &, const CancellationToken &)>
      on_exchange;
  nlohmann::json last_exchange_body;
  std::mutex mutex;
  std::vector<SyncState> states;

  std::shared_ptr<MemoryArticleStore> store;
  std::shared_ptr<DedupRegistry> registry;
  std::shared_ptr<ScriptedHttpClient> http;
  std::shared_ptr<SyncClient> client;
  std::shared_ptr<IngestionPipeline> pipeline;
  std::shared_ptr<NetworkGate> gate;
  std::shared_ptr<SyncCoordinator> coordinator;
};
} // namespace

TEST_CASE("sync sends recent seen ids and stores the unseen article") {
  CoordinatorFixture f;
  f.store->preload(url("a"), f.clock.now() - 1h);
  f.store->preload(url("b"), f.clock.now() - 2h);
  f.store->preload(url("stale"), f.clock.now() - 30h);
  f.unseen = {url("c")};

  auto report = f.coordinator->background_sync();
  CHECK(report.outcome == SyncOutcome::Success);
  CHECK(report.seen_sent == 2);
  CHECK(report.unseen_received == 1);
  CHECK(report.ingestion.success == 1);
  CHECK(report.ingestion.failure == 0);
  CHECK(report.ingestion.skipped == 0);
  CHECK(f.store->has(url("c")));
  CHECK(f.store->size() == 4);

  auto sent = f.last_exchange_body["seen_articles"];
  CHECK(sent.size() == 2);
  CHECK(f.observed_states() ==
        std::vector<SyncState>{SyncState::Acquiring, SyncState::Exchanging,
                               SyncState::Ingesting, SyncState::Idle});
  CHECK_FALSE(f.coordinator->in_flight());
}

TEST_CASE("unseen article already stored is skipped without a write") {
  CoordinatorFixture f;
  f.store->preload(url("c"), f.clock.now() - 1h);
  f.unseen = {url("c")};
  auto report = f.coordinator->background_sync();
  CHECK(report.outcome == SyncOutcome::Success);
  CHECK(report.ingestion.success == 0);
  CHECK(report.ingestion.failure == 0);
  CHECK(report.ingestion.skipped == 1);
  CHECK(f.store->insert_calls.load() == 0);
  CHECK(f.http->count(url("c")) == 0);
}

TEST_CASE("cellular without permission skips without network access") {
  CoordinatorFixture f(NetworkKind::Cellular);
  f.coordinator->set_preferences(SyncPreferences{false});
  auto report = f.coordinator->background_sync();
  CHECK(report.outcome == SyncOutcome::Skipped);
  CHECK(report.skip_reason == SkipReason::NetworkDenied);
  CHECK(f.http->requests().empty());
  CHECK(f.observed_states() ==
        std::vector<SyncState>{SyncState::Skipped, SyncState::Idle});
  CHECK(f.coordinator->state() == SyncState::Idle);
  CHECK_FALSE(f.coordinator->in_flight());
}

TEST_CASE("cellular with permission syncs") {
  CoordinatorFixture f(NetworkKind::Cellular);
  f.coordinator->set_preferences(SyncPreferences{true});
  CHECK(f.coordinator->background_sync().outcome == SyncOutcome::Success);
  CHECK(f.http->count(kSyncUrl) == 1);
}

TEST_CASE("no network never syncs") {
  CoordinatorFixture f(NetworkKind::None);
  f.coordinator->set_preferences(SyncPreferences{true});
  CHECK_FALSE(f.coordinator->manual_sync());
  CHECK(f.http->requests().empty());
}

TEST_CASE("manual sync is throttled from the previous manual call") {
  CoordinatorFixture f;
  CHECK(f.coordinator->manual_sync());
  CHECK(f.http->count(kSyncUrl) == 1);

  f.clock.advance(10s);
  CHECK_FALSE(f.coordinator->manual_sync());
  CHECK(f.http->count(kSyncUrl) == 1);

  // Background runs do not reset the manual window.
  f.coordinator->background_sync();
  CHECK(f.http->count(kSyncUrl) == 2);

  f.clock.advance(20s);
  CHECK(f.coordinator->manual_sync());
  CHECK(f.http->count(kSyncUrl) == 3);
}

TEST_CASE("background sync is never throttled") {
  CoordinatorFixture f;
  CHECK(f.coordinator->manual_sync());
  CHECK(f.coordinator->background_sync().outcome == SyncOutcome::Success);
  CHECK(f.coordinator->background_sync().outcome == SyncOutcome::Success);
  CHECK(f.http->count(kSyncUrl) == 3);
}

TEST_CASE("concurrent triggers run one sync and skip the other") {
  CoordinatorFixture f;
  std::promise<void> entered;
  std::promise<void> release;
  auto release_future = release.get_future().share();
  std::atomic<bool> first{true};
  f.on_exchange = [&](const RecordedRequest &, const CancellationToken &) {
    if (first.exchange(false)) {
      entered.set_value();
      release_future.wait_for(5s);
    }
  };
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  f.coordinator->set_state_observer([&](SyncState state) {
    if (state == SyncState::Exchanging) {
      int now = ++active;
      if (now > peak.load()) {
        peak.store(now);
      }
    } else if (state == SyncState::Idle) {
      --active;
    }
  });

  auto background = std::async(std::launch::async,
                               [&] { return f.coordinator->background_sync(); });
  REQUIRE(entered.get_future().wait_for(5s) == std::future_status::ready);
  CHECK(f.coordinator->in_flight());
  CHECK_FALSE(f.coordinator->manual_sync());
  auto skipped = f.coordinator->background_sync();
  CHECK(skipped.outcome == SyncOutcome::Skipped);
  CHECK(skipped.skip_reason == SkipReason::InFlight);
  release.set_value();

  CHECK(background.get().outcome == SyncOutcome::Success);
  CHECK(peak.load() == 1);
  CHECK(f.http->count(kSyncUrl) == 1);
  CHECK_FALSE(f.coordinator->in_flight());
}

TEST_CASE("exchange timeout fails the run but frees the lock") {
  CoordinatorOptions options;
  options.exchange_timeout = 50ms;
  CoordinatorFixture f(NetworkKind::Wifi, options);
  std::atomic<bool> hang{true};
  f.on_exchange = [&](const RecordedRequest &, const CancellationToken &token) {
    if (hang.load()) {
      token.wait_for(30s);
      token.throw_if_cancelled("POST articles/sync");
    }
  };
  int hook_calls = 0;
  f.coordinator->set_after_run([&](const SyncReport &report) {
    ++hook_calls;
    CHECK(f.coordinator->in_flight());
    CHECK(report.outcome == SyncOutcome::TimedOut);
  });

  auto start = std::chrono::steady_clock::now();
  auto report = f.coordinator->background_sync();
  CHECK(std::chrono::steady_clock::now() - start < 5s);
  CHECK(report.outcome == SyncOutcome::TimedOut);
  CHECK(hook_calls == 1);
  CHECK_FALSE(f.coordinator->in_flight());

  hang.store(false);
  f.coordinator->set_after_run(nullptr);
  CHECK(f.coordinator->background_sync().outcome == SyncOutcome::Success);
}

TEST_CASE("server and storage errors fail the run") {
  CoordinatorFixture f;
  f.store->fail_reads.store(true);
  auto report = f.coordinator->background_sync();
  CHECK(report.outcome == SyncOutcome::Failed);
  CHECK(f.http->requests().empty());

  f.store->fail_reads.store(false);
  f.on_exchange = [](const RecordedRequest &, const CancellationToken &) {
    throw NetworkFailureError("connection reset");
  };
  report = f.coordinator->background_sync();
  CHECK(report.outcome == SyncOutcome::Failed);
  CHECK(report.error.find("connection reset") != std::string::npos);
  CHECK_FALSE(f.coordinator->in_flight());
}

TEST_CASE("cancelled background run releases every claim") {
  CoordinatorFixture f;
  f.unseen = {url("1"), url("2"), url("3"), url("4"), url("5")};
  CancellationSource task;
  task.cancel();
  auto report = f.coordinator->background_sync(task.token());
  CHECK(report.outcome != SyncOutcome::Success);
  CHECK(f.registry->live_claim_count() == 0);
  CHECK(f.store->size() == 0);
}

TEST_CASE("lifecycle events are published") {
  CoordinatorFixture f;
  auto events = std::make_shared<EventDispatcher>();
  std::mutex mutex;
  std::vector<std::string> names;
  events->subscribe([&](const SyncEvent &event) {
    std::lock_guard<std::mutex> lock(mutex);
    names.push_back(event.name);
  });
  SyncCoordinator coordinator(f.gate, f.store, f.client, f.pipeline, {},
                              f.clock.fn(), events);
  f.unseen = {url("e1")};
  coordinator.background_sync();
  events->flush();
  std::lock_guard<std::mutex> lock(mutex);
  CHECK(names == std::vector<std::string>{events::kSyncStarted,
                                          events::kBatchProcessed,
                                          events::kSyncStopped});
}

TEST_CASE("sync report serializes to json") {
  CoordinatorFixture f;
  f.unseen = {url("j")};
  f.coordinator->background_sync();
  auto report = f.coordinator->last_report();
  REQUIRE(report.has_value());
  auto j = to_json(*report);
  CHECK(j["trigger"] == "background");
  CHECK(j["outcome"] == "success");
  CHECK(j["network"] == "wifi");
  CHECK(j["ingestion"]["success"] == 1);
  CHECK_FALSE(j.contains("skip_reason"));
}

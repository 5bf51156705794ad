#include "errors.hpp"
#include "local_task_host.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace arsync;
using namespace std::chrono_literals;

namespace {

namespace fs = std::filesystem;

template <typename Pred> bool wait_until(Pred pred, std::chrono::seconds limit = 5s) {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

ScheduleRequest due_now(TaskKind kind) {
  ScheduleRequest request;
  request.kind = kind;
  request.earliest_begin = WallClock::now();
  request.time_limit = 5s;
  return request;
}

void write_supply(const fs::path &root, const std::string &name,
                  const std::string &type, const std::string &online) {
  fs::create_directories(root / name);
  std::ofstream(root / name / "type") << type << "\n";
  if (!online.empty()) {
    std::ofstream(root / name / "online") << online << "\n";
  }
}

} // namespace

TEST_CASE("submitting without a handler is unsupported") {
  LocalTaskHost host([] { return true; });
  try {
    host.submit(due_now(TaskKind::Fetch));
    FAIL("expected SchedulingError");
  } catch (const SchedulingError &e) {
    CHECK(e.reason() == SchedulingFailure::Unsupported);
  }
}

TEST_CASE("a due task runs on the host thread") {
  LocalTaskHost host([] { return true; });
  std::atomic<int> runs{0};
  std::atomic<bool> saw_fetch{false};
  host.register_handler([&](TaskKind kind, const CancellationToken &) {
    saw_fetch = kind == TaskKind::Fetch;
    ++runs;
  });
  host.start();
  host.submit(due_now(TaskKind::Fetch));
  REQUIRE(wait_until([&] { return runs.load() == 1; }));
  CHECK(saw_fetch);
  CHECK_FALSE(host.pending(TaskKind::Fetch).has_value());
  host.stop();
}

TEST_CASE("resubmitting a kind replaces the pending request") {
  LocalTaskHost host([] { return true; });
  host.register_handler([](TaskKind, const CancellationToken &) {});
  auto first = due_now(TaskKind::Processing);
  first.earliest_begin = WallClock::now() + 1h;
  host.submit(first);
  auto second = first;
  second.earliest_begin = WallClock::now() + 2h;
  host.submit(second);
  auto pending = host.pending(TaskKind::Processing);
  REQUIRE(pending);
  CHECK(pending->earliest_begin == second.earliest_begin);
}

TEST_CASE("a task outliving its time limit is expired") {
  LocalTaskHost host([] { return true; });
  std::atomic<bool> expired{false};
  host.register_handler([&](TaskKind, const CancellationToken &token) {
    token.wait_for(5s);
    expired = token.is_cancelled();
  });
  host.start();
  auto request = due_now(TaskKind::Fetch);
  request.time_limit = 50ms;
  host.submit(request);
  REQUIRE(wait_until([&] { return expired.load(); }));
  host.stop();
}

TEST_CASE("power-hungry tasks wait for external power") {
  std::atomic<bool> powered{false};
  std::atomic<int> power_checks{0};
  std::atomic<int> runs{0};
  LocalTaskHost host(
      [&] {
        ++power_checks;
        return powered.load();
      },
      20ms);
  host.register_handler([&](TaskKind, const CancellationToken &) { ++runs; });
  host.start();
  auto request = due_now(TaskKind::Processing);
  request.requires_external_power = true;
  host.submit(request);

  REQUIRE(wait_until([&] { return power_checks.load() >= 2; }));
  CHECK(runs.load() == 0);
  powered = true;
  REQUIRE(wait_until([&] { return runs.load() == 1; }));
  host.stop();
}

TEST_CASE("stopping expires the running task and refuses new ones") {
  LocalTaskHost host([] { return true; });
  std::atomic<bool> started{false};
  std::atomic<bool> cancelled{false};
  host.register_handler([&](TaskKind, const CancellationToken &token) {
    started = true;
    token.wait_for(10s);
    cancelled = token.is_cancelled();
  });
  host.start();
  auto request = due_now(TaskKind::Processing);
  request.time_limit = 30s;
  host.submit(request);
  REQUIRE(wait_until([&] { return started.load(); }));
  host.stop();
  CHECK(cancelled);
  try {
    host.submit(due_now(TaskKind::Fetch));
    FAIL("expected SchedulingError");
  } catch (const SchedulingError &e) {
    CHECK(e.reason() == SchedulingFailure::Denied);
  }
}

TEST_CASE("external power is read from the power supply class") {
  auto root = fs::temp_directory_path() / "articlesync_power_test";
  fs::remove_all(root);

  SECTION("no supplies counts as powered") {
    fs::create_directories(root);
    CHECK(LocalTaskHost::on_external_power(root.string()));
  }
  SECTION("battery only") {
    write_supply(root, "BAT0", "Battery", "");
    CHECK_FALSE(LocalTaskHost::on_external_power(root.string()));
  }
  SECTION("battery with mains offline") {
    write_supply(root, "BAT0", "Battery", "");
    write_supply(root, "AC", "Mains", "0");
    CHECK_FALSE(LocalTaskHost::on_external_power(root.string()));
  }
  SECTION("mains online") {
    write_supply(root, "BAT0", "Battery", "");
    write_supply(root, "AC", "Mains", "1");
    CHECK(LocalTaskHost::on_external_power(root.string()));
  }
  fs::remove_all(root);
}

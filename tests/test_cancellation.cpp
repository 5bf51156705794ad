#include "cancellation.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

using namespace arsync;
using namespace std::chrono_literals;

TEST_CASE("default token is never cancelled") {
  CancellationToken token;
  CHECK_FALSE(token.is_cancelled());
  CHECK(token.reason() == CancelReason::None);
  CHECK_FALSE(token.deadline().has_value());
  CHECK_FALSE(token.remaining().has_value());
  CHECK_NOTHROW(token.throw_if_cancelled("idle"));
  CHECK_FALSE(token.wait_for(1ms));
}

TEST_CASE("explicit cancel propagates to linked children") {
  CancellationSource parent;
  CancellationSource child(parent.token());
  CancellationSource grandchild(child.token());
  CHECK_FALSE(grandchild.token().is_cancelled());

  parent.cancel();
  CHECK(child.token().is_cancelled());
  CHECK(grandchild.token().reason() == CancelReason::Cancelled);
  CHECK_THROWS_AS(grandchild.token().throw_if_cancelled("fetch"),
                  OperationCancelledError);
}

TEST_CASE("cancelling a child leaves the parent running") {
  CancellationSource parent;
  CancellationSource child(parent.token());
  child.cancel();
  CHECK(child.token().is_cancelled());
  CHECK_FALSE(parent.token().is_cancelled());
}

TEST_CASE("child linked to a cancelled parent starts cancelled") {
  CancellationSource parent;
  parent.cancel();
  CancellationSource child(parent.token());
  CHECK(child.token().is_cancelled());
}

TEST_CASE("deadline expiry reports a timeout") {
  CancellationSource source;
  source.cancel_after(20ms);
  auto token = source.token();
  CHECK_FALSE(token.is_cancelled());
  REQUIRE(token.remaining().has_value());
  CHECK(*token.remaining() <= 20ms);

  CHECK(token.wait_for(2s));
  CHECK(token.reason() == CancelReason::DeadlineExceeded);
  CHECK_THROWS_AS(token.throw_if_cancelled("exchange"), NetworkTimeoutError);
  CHECK(*token.remaining() == 0ms);
}

TEST_CASE("child inherits the earlier parent deadline") {
  CancellationSource parent;
  parent.cancel_after(50ms);
  CancellationSource child(parent.token());
  child.cancel_after(10s);
  auto parent_deadline = parent.token().deadline();
  REQUIRE(parent_deadline.has_value());
  CHECK(child.token().deadline() == parent_deadline);
}

TEST_CASE("wait_for wakes when cancelled from another thread") {
  CancellationSource source;
  auto token = source.token();
  auto start = std::chrono::steady_clock::now();
  std::thread canceller([&] {
    std::this_thread::sleep_for(20ms);
    source.cancel();
  });
  CHECK(token.wait_for(5s));
  canceller.join();
  CHECK(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("wait_for returns false after an uncancelled pause") {
  CancellationSource source;
  CHECK_FALSE(source.token().wait_for(5ms));
}

TEST_CASE("cancel callbacks run once when cancelled") {
  CancellationSource source;
  int calls = 0;
  auto registration = source.token().on_cancel([&] { ++calls; });
  CHECK(calls == 0);
  source.cancel();
  source.cancel();
  CHECK(calls == 1);
}

TEST_CASE("cancel callbacks see a parent's cancellation") {
  CancellationSource parent;
  CancellationSource child(parent.token());
  int calls = 0;
  auto registration = child.token().on_cancel([&] { ++calls; });
  parent.cancel();
  CHECK(calls == 1);
}

TEST_CASE("cancel callbacks on a cancelled token run immediately") {
  CancellationSource source;
  source.cancel();
  int calls = 0;
  auto registration = source.token().on_cancel([&] { ++calls; });
  CHECK(calls == 1);

  CancellationToken never;
  auto idle = never.on_cancel([&] { ++calls; });
  CHECK(calls == 1);
}

TEST_CASE("a reset registration is not called") {
  CancellationSource source;
  int calls = 0;
  auto registration = source.token().on_cancel([&] { ++calls; });
  registration.reset();
  {
    auto scoped = source.token().on_cancel([&] { ++calls; });
  }
  source.cancel();
  CHECK(calls == 0);
}

TEST_CASE("deadlines do not trigger cancel callbacks") {
  CancellationSource source;
  int calls = 0;
  auto registration = source.token().on_cancel([&] { ++calls; });
  source.cancel_after(1ms);
  std::this_thread::sleep_for(20ms);
  CHECK(source.token().reason() == CancelReason::DeadlineExceeded);
  CHECK(calls == 0);
}

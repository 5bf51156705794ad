#include "errors.hpp"
#include "log.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace arsync;

TEST_CASE("log levels parse case-insensitively") {
  CHECK(parse_log_level("debug") == spdlog::level::debug);
  CHECK(parse_log_level("INFO") == spdlog::level::info);
  CHECK(parse_log_level("warning") == spdlog::level::warn);
  CHECK(parse_log_level("warn") == spdlog::level::warn);
  CHECK(parse_log_level("off") == spdlog::level::off);
  CHECK_THROWS_AS(parse_log_level("loud"), ConfigError);
  CHECK_THROWS_AS(parse_log_level(""), ConfigError);
}

TEST_CASE("category loggers are shared and named after the root") {
  init_logger(spdlog::level::info);
  auto first = category_logger("dedup");
  auto second = category_logger("dedup");
  CHECK(first.get() == second.get());
  CHECK(first->name() == "arsync.dedup");
  CHECK(spdlog::default_logger()->name() == "arsync");
  CHECK(first->sinks().size() == spdlog::default_logger()->sinks().size());
}

TEST_CASE("new category loggers inherit the root level") {
  init_logger(spdlog::level::err);
  auto logger = category_logger("levels-inherit");
  CHECK(logger->level() == spdlog::level::err);
  init_logger(spdlog::level::info);
}

TEST_CASE("category overrides adjust only the named loggers") {
  init_logger(spdlog::level::info);
  auto sync = category_logger("sync");
  auto store = category_logger("store");
  configure_log_categories({{"sync", spdlog::level::trace}});
  CHECK(sync->level() == spdlog::level::trace);
  CHECK(store->level() == spdlog::level::info);
  configure_log_categories({{"sync", spdlog::level::info}});
}

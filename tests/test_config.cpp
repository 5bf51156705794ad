#include "config.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace arsync;
using namespace std::chrono_literals;

namespace {
std::filesystem::path write_temp(const std::string &name,
                                 const std::string &content) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream f(path.string());
  f << content;
  return path;
}
} // namespace

TEST_CASE("defaults describe the standard sync cadence") {
  Config cfg;
  CHECK(cfg.exchange_timeout() == 60s);
  CHECK(cfg.manual_throttle() == 30s);
  CHECK(cfg.completion_ttl() == 10min);
  CHECK(cfg.completion_capacity() == 1000);
  CHECK(cfg.batch_window() == 10s);
  CHECK(cfg.ingest_concurrency() == 5);
  CHECK_FALSE(cfg.allow_cellular_sync());
  CHECK(cfg.log_options().level == spdlog::level::info);
}

TEST_CASE("yaml config with sections") {
  auto path = write_temp("articlesync_cfg.yaml",
                         "sync:\n"
                         "  api_base: https://news.test/api\n"
                         "  device_id: dev-1\n"
                         "  exchange_timeout: 45\n"
                         "  manual_throttle: 1m\n"
                         "network:\n"
                         "  allow_cellular_sync: true\n"
                         "  http_proxy: http://proxy\n"
                         "ingest:\n"
                         "  ingest_concurrency: 3\n"
                         "  batch_pause: 250ms\n"
                         "  article_timeout: 1.5\n"
                         "logging:\n"
                         "  log_level: debug\n"
                         "  log_categories:\n"
                         "    sync: trace\n"
                         "hooks:\n"
                         "  hook_command: ./notify.sh\n"
                         "  hook_events: [sync.started, sync.stopped]\n");
  Config cfg = Config::from_file(path.string());
  CHECK(cfg.api_base() == "https://news.test/api");
  CHECK(cfg.device_id() == "dev-1");
  CHECK(cfg.exchange_timeout() == 45s);
  CHECK(cfg.manual_throttle() == 1min);
  CHECK(cfg.allow_cellular_sync());
  CHECK(cfg.http_proxy() == "http://proxy");
  CHECK(cfg.ingest_concurrency() == 3);
  CHECK(cfg.batch_pause() == 250ms);
  CHECK(cfg.article_timeout() == 1500ms);
  CHECK(cfg.log_level() == "debug");
  CHECK(cfg.log_category_levels().at("sync") == spdlog::level::trace);
  auto hooks = cfg.hook_settings();
  CHECK(hooks.command == "./notify.sh");
  REQUIRE(hooks.events.size() == 2);
  CHECK(hooks.events[1] == "sync.stopped");
  std::filesystem::remove(path);
}

TEST_CASE("json config with flat keys") {
  nlohmann::json doc = {{"api_base", "https://json.test"},
                        {"seen_window", "12h"},
                        {"ingest_batch_size", 4},
                        {"max_fetch_rate", 30},
                        {"database", "/tmp/articles.db"}};
  auto path = write_temp("articlesync_cfg.json", doc.dump());
  Config cfg = Config::from_file(path.string());
  CHECK(cfg.api_base() == "https://json.test");
  CHECK(cfg.seen_window() == 12h);
  CHECK(cfg.database() == "/tmp/articles.db");

  auto ingest = cfg.ingestion_options();
  CHECK(ingest.batch_size == 4);
  CHECK(ingest.max_fetches_per_minute == 30);
  auto coordinator = cfg.coordinator_options();
  CHECK(coordinator.seen_window == 12h);
  CHECK(coordinator.exchange_timeout == 60s);
  std::filesystem::remove(path);
}

TEST_CASE("toml config") {
  auto path = write_temp("articlesync_cfg.toml",
                         "[sync]\n"
                         "api_base = \"https://toml.test\"\n"
                         "completion_ttl = \"5m\"\n"
                         "completion_capacity = 250\n"
                         "[storage]\n"
                         "state_file = \"/tmp/state.json\"\n"
                         "[logging]\n"
                         "log_rotate = 0\n"
                         "log_compress = true\n");
  Config cfg = Config::from_file(path.string());
  CHECK(cfg.api_base() == "https://toml.test");
  CHECK(cfg.completion_ttl() == 5min);
  CHECK(cfg.completion_capacity() == 250);
  CHECK(cfg.state_file() == "/tmp/state.json");
  auto log = cfg.log_options();
  CHECK(log.rotate_files == 0);
  CHECK(log.compress_rotations);
  std::filesystem::remove(path);
}

TEST_CASE("invalid values raise ConfigError") {
  CHECK_THROWS_AS(Config::from_json(nlohmann::json::array()), ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"api_base", 5}}), ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"allow_cellular_sync", "maybe"}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"ingest_concurrency", 0}}), ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"completion_capacity", 0}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"exchange_timeout", -1}}), ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"exchange_timeout", "soon"}}),
                  ConfigError);
  CHECK_THROWS_AS(
      Config::from_json({{"exchange_timeout", 9223372036854775807LL}}),
      ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"exchange_timeout", 1e300}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"hook_events", "sync.started"}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"log_categories", {{"sync", 3}}}}),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_json({{"log_level", "chatty"}}).log_options(),
                  ConfigError);
}

TEST_CASE("unreadable files raise ConfigError") {
  CHECK_THROWS_AS(Config::from_file("/nonexistent/articlesync.yaml"),
                  ConfigError);
  CHECK_THROWS_AS(Config::from_file("articlesync.ini"), ConfigError);
  auto path = write_temp("articlesync_broken.json", "{ nope");
  CHECK_THROWS_AS(Config::from_file(path.string()), ConfigError);
  std::filesystem::remove(path);
}

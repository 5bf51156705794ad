#include "errors.hpp"
#include "sqlite_article_store.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace arsync;
using namespace std::chrono_literals;

namespace {
ArticleRecord make_record(const std::string &id, TimePoint at) {
  ArticleRecord record;
  record.identifier = id;
  record.json_url = id;
  record.title = "Title " + id;
  record.body = "Body " + id;
  record.topic = "science";
  record.quality = 6;
  record.received_at = at;
  return record;
}
} // namespace

TEST_CASE("inserted articles are visible by identifier and key") {
  SqliteArticleStore store(":memory:");
  auto now = WallClock::now();
  auto record = make_record("https://api.test/a.json", now);
  auto key = derive_storage_key(record.identifier);
  CHECK_FALSE(store.exists(record.identifier, key));

  store.insert_atomic(record, key);
  CHECK(store.exists(record.identifier, key));
  CHECK(store.exists("other-id", key));
  CHECK(store.exists(record.identifier, "other-key"));
  CHECK(store.article_count() == 1);

  auto seen = store.fetch_seen_identifiers(now - 1h);
  REQUIRE(seen.size() == 1);
  CHECK(seen.front() == record.identifier);
}

TEST_CASE("duplicate insert fails and leaves one row") {
  SqliteArticleStore store(":memory:");
  auto record = make_record("dup", WallClock::now());
  auto key = derive_storage_key("dup");
  store.insert_atomic(record, key);
  CHECK_THROWS_AS(store.insert_atomic(record, key), StorageFailureError);
  CHECK(store.article_count() == 1);

  // The failed transaction must not hold the database.
  store.insert_atomic(make_record("next", WallClock::now()),
                      derive_storage_key("next"));
  CHECK(store.article_count() == 2);
}

TEST_CASE("seen identifiers respect the window") {
  SqliteArticleStore store(":memory:");
  auto now = WallClock::now();
  store.mark_seen("old", now - 48h);
  store.mark_seen("recent", now - 2h);
  store.insert_atomic(make_record("stored", now), derive_storage_key("stored"));

  auto seen = store.fetch_seen_identifiers(now - 24h);
  CHECK(seen == std::vector<ArticleId>{"recent", "stored"});
  CHECK_FALSE(store.exists("recent", derive_storage_key("recent")));
}

TEST_CASE("exists_any_of returns the stored subset") {
  SqliteArticleStore store(":memory:");
  auto now = WallClock::now();
  store.insert_atomic(make_record("a", now), derive_storage_key("a"));
  store.insert_atomic(make_record("c", now), derive_storage_key("c"));
  auto found = store.exists_any_of({"a", "b", "c", "d"});
  CHECK(found.size() == 2);
  CHECK(found.count("a") == 1);
  CHECK(found.count("c") == 1);
  CHECK(store.exists_any_of({}).empty());
}

TEST_CASE("export writes stored articles as json") {
  const char *path = "test_articles_export.json";
  std::remove(path);
  SqliteArticleStore store(":memory:");
  auto now = WallClock::now();
  store.insert_atomic(make_record("first", now - 1min),
                      derive_storage_key("first"));
  store.insert_atomic(make_record("second", now), derive_storage_key("second"));
  store.export_json(path);

  std::ifstream in(path);
  REQUIRE(in.good());
  auto j = nlohmann::json::parse(in);
  REQUIRE(j.size() == 2);
  CHECK(j[0]["identifier"] == "first");
  CHECK(j[0]["storage_key"] == derive_storage_key("first"));
  CHECK(j[1]["topic"] == "science");
  CHECK(j[1]["quality"] == 6);
  in.close();
  std::remove(path);
}

TEST_CASE("opening an unreachable database path fails") {
  CHECK_THROWS_AS(SqliteArticleStore("/nonexistent-dir/sub/articles.db"),
                  StorageFailureError);
}

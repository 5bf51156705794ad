#include "article.hpp"
#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <regex>

using namespace arsync;

TEST_CASE("parse_article prefers short title and summary") {
  nlohmann::json payload = {
      {"tiny_title", "Short title"},
      {"title", "A much longer article title"},
      {"tiny_summary", "Short body"},
      {"url", "https://www.Example.com:8443/news/1?ref=x"},
      {"pub_date", "2024-05-01T12:30:00Z"},
      {"quality", 7.6},
      {"sources_quality", 4},
      {"model", "m1"},
      {"elapsed_time", 1.5},
      {"similar_articles", {{{"title", "other"}}}}};
  auto record = parse_article(payload, "https://api.test/a/1.json");
  CHECK(record.identifier == "https://api.test/a/1.json");
  CHECK(record.json_url == "https://api.test/a/1.json");
  CHECK(record.title == "Short title");
  CHECK(record.article_title == "A much longer article title");
  CHECK(record.body == "Short body");
  CHECK(record.domain == "example.com");
  REQUIRE(record.quality.has_value());
  CHECK(*record.quality == 8);
  CHECK(record.sources_quality == 4);
  CHECK_FALSE(record.argument_quality.has_value());
  REQUIRE(record.published_at.has_value());
  CHECK(format_iso8601(*record.published_at) == "2024-05-01T12:30:00Z");
  auto stats = nlohmann::json::parse(record.engine_stats);
  CHECK(stats["model"] == "m1");
  CHECK(nlohmann::json::parse(record.similar_articles).size() == 1);
}

TEST_CASE("parse_article falls back to title and body") {
  nlohmann::json payload = {{"title", "Plain"}, {"body", "Text"}};
  auto record = parse_article(payload, "id-1");
  CHECK(record.title == "Plain");
  CHECK(record.body == "Text");
  CHECK(record.engine_stats.empty());
  CHECK(record.similar_articles.empty());
}

TEST_CASE("parse_article rejects incomplete payloads") {
  CHECK_THROWS_AS(parse_article(nlohmann::json::array(), "x"),
                  ParseFailureError);
  CHECK_THROWS_AS(parse_article({{"title", "only title"}}, "x"),
                  ParseFailureError);
  CHECK_THROWS_AS(parse_article({{"body", "only body"}}, "x"),
                  ParseFailureError);
  CHECK_THROWS_AS(parse_article({{"title", ""}, {"body", "b"}}, "x"),
                  ParseFailureError);
}

TEST_CASE("iso8601 timestamps with offsets and fractions") {
  auto base = parse_iso8601("2024-01-02T03:04:05Z");
  REQUIRE(base.has_value());
  CHECK(parse_iso8601("2024-01-02T03:04:05.123Z") == base);
  CHECK(parse_iso8601("2024-01-02T05:04:05+02:00") == base);
  CHECK(parse_iso8601("2024-01-01T22:04:05-0500") == base);
  CHECK(parse_iso8601("2024-01-02T03:04:05") == base);
  CHECK_FALSE(parse_iso8601("yesterday").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-02T03:04:05Q").has_value());
  CHECK_FALSE(parse_iso8601("").has_value());
}

TEST_CASE("iso8601 offsets must end the timestamp") {
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00+05:30garbage").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00-0500x").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00+5:30").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00+05:").has_value());
  CHECK_FALSE(parse_iso8601("2024-01-01T00:00:00Zextra").has_value());
  CHECK(parse_iso8601("2024-01-01T05:30:00+05:30") ==
        parse_iso8601("2024-01-01T00:00:00Z"));
}

TEST_CASE("out of range scores are treated as missing") {
  nlohmann::json payload = {{"title", "T"},
                            {"body", "B"},
                            {"quality", 4294967301LL},
                            {"sources_quality", -4294967301LL},
                            {"argument_quality", 1e300}};
  auto record = parse_article(payload, "id-scores");
  CHECK_FALSE(record.quality.has_value());
  CHECK_FALSE(record.sources_quality.has_value());
  CHECK_FALSE(record.argument_quality.has_value());

  payload["quality"] = 18446744073709551615ULL;
  payload["sources_quality"] = -3;
  payload["argument_quality"] = 2.4;
  record = parse_article(payload, "id-scores");
  CHECK_FALSE(record.quality.has_value());
  CHECK(record.sources_quality == -3);
  CHECK(record.argument_quality == 2);
}

TEST_CASE("extract_domain strips scheme, credentials and www") {
  CHECK(extract_domain("https://www.news.example.org/a/b") ==
        "news.example.org");
  CHECK(extract_domain("http://user:pw@Host.test:80") == "host.test");
  CHECK(extract_domain("") == "");
}

TEST_CASE("storage key keeps an embedded uuid") {
  const std::string id =
      "https://api.test/articles/3F2504E0-4F89-11D3-9A0C-0305E82C3301.json";
  REQUIRE(embedded_uuid(id).has_value());
  CHECK(derive_storage_key(id) == "3f2504e0-4f89-11d3-9a0c-0305e82c3301");
  CHECK_FALSE(
      embedded_uuid("https://api.test/3f2504e0-4f89-11d3-9a0c-0305e82c3301/x")
          .has_value());
}

TEST_CASE("storage key hashes other identifiers deterministically") {
  const std::regex uuid_shape(
      "[0-9a-f]{8}-[0-9a-f]{4}-5[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}");
  auto a = derive_storage_key("https://api.test/articles/1.json");
  auto b = derive_storage_key("https://api.test/articles/2.json");
  CHECK(std::regex_match(a, uuid_shape));
  CHECK(std::regex_match(b, uuid_shape));
  CHECK(a != b);
  CHECK(a == derive_storage_key("https://api.test/articles/1.json"));
  // Offset basis of FNV-1a 128 with version and variant bits applied.
  CHECK(derive_storage_key("") == "6c62272e-07bb-5142-a2b8-21756295c58d");
}

TEST_CASE("article json omits empty optional fields") {
  ArticleRecord record;
  record.identifier = "id";
  record.json_url = "id";
  record.title = "t";
  record.body = "b";
  record.quality = 3;
  auto j = to_json(record);
  CHECK(j["title"] == "t");
  CHECK(j["quality"] == 3);
  CHECK_FALSE(j.contains("topic"));
  CHECK_FALSE(j.contains("pub_date"));
  CHECK(j.contains("received_at"));
}

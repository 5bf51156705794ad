/**
 * @file article.hpp
 * @brief Normalized article records and their derivation from payloads.
 */

#ifndef ARTICLESYNC_ARTICLE_HPP
#define ARTICLESYNC_ARTICLE_HPP

#include "util/clock.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace arsync {

/// Remote article key, normally the URL of its JSON payload.
using ArticleId = std::string;

/**
 * Article as stored locally. Built once per identifier and never modified by
 * the sync core afterwards.
 */
struct ArticleRecord {
  ArticleId identifier;
  /// Payload `json_url`, falling back to the identifier.
  std::string json_url;
  std::string title;
  std::string body;
  std::string article_title;
  std::string topic;
  std::string source_url;
  std::string domain;
  std::string affected;
  std::optional<TimePoint> published_at;
  std::optional<int> quality;
  std::optional<int> sources_quality;
  std::optional<int> argument_quality;
  std::string source_type;
  std::string source_analysis;
  std::string summary;
  std::string critical_analysis;
  std::string logical_fallacies;
  std::string relation_to_topic;
  std::string additional_insights;
  /// Serialized JSON object with model, elapsed_time, stats and system_info.
  std::string engine_stats;
  /// Serialized JSON array of related articles.
  std::string similar_articles;
  TimePoint received_at{};
};

/**
 * Build a record from an article payload.
 *
 * @param payload Decoded JSON body returned for @p identifier.
 * @param identifier Identifier the payload was fetched from.
 * @param received_at Timestamp stored as the local arrival time.
 * @throws ParseFailureError When the payload is not an object or lacks a
 *         title or body.
 */
ArticleRecord parse_article(const nlohmann::json &payload,
                            const ArticleId &identifier,
                            TimePoint received_at = WallClock::now());

/// Host of @p url without scheme, port and leading `www.`. Empty if none.
std::string extract_domain(const std::string &url);

/**
 * Parse an ISO 8601 timestamp such as `2024-05-01T12:30:00Z`, with optional
 * fractional seconds and numeric offset.
 */
std::optional<TimePoint> parse_iso8601(const std::string &text);

/// Format @p tp as `YYYY-MM-DDTHH:MM:SSZ`.
std::string format_iso8601(TimePoint tp);

/// UUID found in the final path segment of @p identifier, lowercased.
std::optional<std::string> embedded_uuid(const ArticleId &identifier);

/**
 * Stable local key for @p identifier. Legacy identifiers that carry a UUID
 * in their last path segment keep it; others get a FNV-1a 128-bit hash of
 * the identifier formatted as a UUID. Pure and thread safe.
 */
std::string derive_storage_key(const ArticleId &identifier);

nlohmann::json to_json(const ArticleRecord &record);

} // namespace arsync

#endif // ARTICLESYNC_ARTICLE_HPP

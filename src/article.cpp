#include "article.hpp"
#include "errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <limits>
#include <regex>

namespace arsync {

namespace {

std::string text_field(const nlohmann::json &payload, const char *key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

/// First non-empty string among @p keys.
std::string first_text(const nlohmann::json &payload,
                       std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto value = text_field(payload, key);
    if (!value.empty()) {
      return value;
    }
  }
  return {};
}

std::optional<int> score_field(const nlohmann::json &payload, const char *key) {
  auto it = payload.find(key);
  if (it == payload.end()) {
    return std::nullopt;
  }
  // Scores outside the int range are treated as missing.
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  }
  if (it->is_number_integer()) {
    auto value = it->get<std::int64_t>();
    if (value < std::numeric_limits<int>::min() ||
        value > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  }
  if (it->is_number_float()) {
    double value = std::round(it->get<double>());
    if (!std::isfinite(value) ||
        value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
      return std::nullopt;
    }
    return static_cast<int>(value);
  }
  return std::nullopt;
}

std::string engine_stats_blob(const nlohmann::json &payload) {
  nlohmann::json stats = nlohmann::json::object();
  for (const char *key : {"model", "elapsed_time", "stats", "system_info"}) {
    auto it = payload.find(key);
    if (it != payload.end() && !it->is_null()) {
      stats[key] = *it;
    }
  }
  return stats.empty() ? std::string() : stats.dump();
}

std::string similar_articles_blob(const nlohmann::json &payload) {
  auto it = payload.find("similar_articles");
  if (it == payload.end() || !it->is_array() || it->empty()) {
    return {};
  }
  return it->dump();
}

/// FNV-1a over 128 bits, kept as two 64-bit halves.
std::array<std::uint64_t, 2> fnv1a_128(const std::string &data) {
  std::uint64_t hi = 0x6c62272e07bb0142ULL;
  std::uint64_t lo = 0x62b821756295c58dULL;
  constexpr std::uint64_t kPrimeLow = 0x13B; // prime = 2^88 + 0x13B
  for (unsigned char byte : data) {
    lo ^= byte;
    // (hi:lo) * kPrimeLow, carrying the top of the low product into hi.
    std::uint64_t p0 = (lo & 0xffffffffULL) * kPrimeLow;
    std::uint64_t p1 = (lo >> 32) * kPrimeLow + (p0 >> 32);
    std::uint64_t new_lo = (p0 & 0xffffffffULL) | (p1 << 32);
    std::uint64_t new_hi = hi * kPrimeLow + (p1 >> 32) + (lo << 24);
    hi = new_hi;
    lo = new_lo;
  }
  return {hi, lo};
}

std::string format_uuid(const std::array<std::uint8_t, 16> &bytes) {
  static const char *digits = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(digits[bytes[i] >> 4]);
    out.push_back(digits[bytes[i] & 0x0f]);
  }
  return out;
}

std::string last_path_segment(const std::string &identifier) {
  auto end = identifier.find_first_of("?#");
  std::string path = identifier.substr(0, end);
  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

ArticleRecord parse_article(const nlohmann::json &payload,
                            const ArticleId &identifier,
                            TimePoint received_at) {
  if (!payload.is_object()) {
    throw ParseFailureError("Article payload for " + identifier +
                            " is not a JSON object");
  }
  ArticleRecord record;
  record.identifier = identifier;
  record.title = first_text(payload, {"tiny_title", "title"});
  record.body = first_text(payload, {"tiny_summary", "body"});
  if (record.title.empty() || record.body.empty()) {
    throw ParseFailureError("Article payload for " + identifier +
                            " is missing its title or body");
  }
  record.json_url = text_field(payload, "json_url");
  if (record.json_url.empty()) {
    record.json_url = identifier;
  }
  record.article_title = first_text(payload, {"title", "article_title"});
  record.topic = text_field(payload, "topic");
  record.source_url = first_text(payload, {"url", "article_url"});
  record.domain = extract_domain(record.source_url);
  record.affected = text_field(payload, "affected");
  record.published_at = parse_iso8601(text_field(payload, "pub_date"));
  record.quality = score_field(payload, "quality");
  record.sources_quality = score_field(payload, "sources_quality");
  record.argument_quality = score_field(payload, "argument_quality");
  record.source_type = text_field(payload, "source_type");
  record.source_analysis = text_field(payload, "source_analysis");
  record.summary = text_field(payload, "summary");
  record.critical_analysis = text_field(payload, "critical_analysis");
  record.logical_fallacies = text_field(payload, "logical_fallacies");
  record.relation_to_topic = text_field(payload, "relation_to_topic");
  record.additional_insights = text_field(payload, "additional_insights");
  record.engine_stats = engine_stats_blob(payload);
  record.similar_articles = similar_articles_blob(payload);
  record.received_at = received_at;
  return record;
}

std::string extract_domain(const std::string &url) {
  std::string host = url;
  auto scheme = host.find("://");
  if (scheme != std::string::npos) {
    host.erase(0, scheme + 3);
  }
  auto end = host.find_first_of("/?#");
  if (end != std::string::npos) {
    host.erase(end);
  }
  auto at = host.find('@');
  if (at != std::string::npos) {
    host.erase(0, at + 1);
  }
  auto colon = host.find(':');
  if (colon != std::string::npos) {
    host.erase(colon);
  }
  std::transform(host.begin(), host.end(), host.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (host.rfind("www.", 0) == 0) {
    host.erase(0, 4);
  }
  return host;
}

std::optional<TimePoint> parse_iso8601(const std::string &text) {
  if (text.size() < 19) {
    return std::nullopt;
  }
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min,
                  &tm.tm_sec, &consumed) != 6 ||
      consumed != 19) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;
  std::size_t pos = 19;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      ++pos;
    }
  }
  long offset_seconds = 0;
  if (pos < text.size()) {
    char sign = text[pos];
    if (sign == 'Z' || sign == 'z') {
      ++pos;
    } else if (sign == '+' || sign == '-') {
      // Accepts +hh:mm and +hhmm.
      auto two_digits = [&text](std::size_t at, int &out) {
        if (at + 2 > text.size() ||
            !std::isdigit(static_cast<unsigned char>(text[at])) ||
            !std::isdigit(static_cast<unsigned char>(text[at + 1]))) {
          return false;
        }
        out = (text[at] - '0') * 10 + (text[at + 1] - '0');
        return true;
      };
      int oh = 0;
      int om = 0;
      ++pos;
      if (!two_digits(pos, oh)) {
        return std::nullopt;
      }
      pos += 2;
      if (pos < text.size() && text[pos] == ':') {
        ++pos;
      }
      if (!two_digits(pos, om)) {
        return std::nullopt;
      }
      pos += 2;
      offset_seconds = (oh * 3600L + om * 60L) * (sign == '-' ? -1 : 1);
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }
  std::time_t utc = timegm(&tm);
  if (utc == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return WallClock::from_time_t(utc - offset_seconds);
}

std::string format_iso8601(TimePoint tp) {
  std::time_t t = WallClock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::optional<std::string> embedded_uuid(const ArticleId &identifier) {
  static const std::regex uuid_re(
      "[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-"
      "[0-9a-fA-F]{12}");
  const std::string segment = last_path_segment(identifier);
  std::smatch match;
  if (!std::regex_search(segment, match, uuid_re)) {
    return std::nullopt;
  }
  std::string uuid = match.str();
  std::transform(uuid.begin(), uuid.end(), uuid.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return uuid;
}

std::string derive_storage_key(const ArticleId &identifier) {
  if (auto legacy = embedded_uuid(identifier)) {
    return *legacy;
  }
  auto hash = fnv1a_128(identifier);
  std::array<std::uint8_t, 16> bytes{};
  for (int i = 0; i < 8; ++i) {
    bytes[i] = static_cast<std::uint8_t>(hash[0] >> (56 - 8 * i));
    bytes[8 + i] = static_cast<std::uint8_t>(hash[1] >> (56 - 8 * i));
  }
  bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0f) | 0x50);
  bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3f) | 0x80);
  return format_uuid(bytes);
}

nlohmann::json to_json(const ArticleRecord &record) {
  nlohmann::json out{{"identifier", record.identifier},
                     {"json_url", record.json_url},
                     {"title", record.title},
                     {"body", record.body},
                     {"received_at", format_iso8601(record.received_at)}};
  auto put_text = [&out](const char *key, const std::string &value) {
    if (!value.empty()) {
      out[key] = value;
    }
  };
  auto put_score = [&out](const char *key, const std::optional<int> &value) {
    if (value) {
      out[key] = *value;
    }
  };
  put_text("article_title", record.article_title);
  put_text("topic", record.topic);
  put_text("url", record.source_url);
  put_text("domain", record.domain);
  put_text("affected", record.affected);
  if (record.published_at) {
    out["pub_date"] = format_iso8601(*record.published_at);
  }
  put_score("quality", record.quality);
  put_score("sources_quality", record.sources_quality);
  put_score("argument_quality", record.argument_quality);
  put_text("source_type", record.source_type);
  put_text("source_analysis", record.source_analysis);
  put_text("summary", record.summary);
  put_text("critical_analysis", record.critical_analysis);
  put_text("logical_fallacies", record.logical_fallacies);
  put_text("relation_to_topic", record.relation_to_topic);
  put_text("additional_insights", record.additional_insights);
  if (!record.engine_stats.empty()) {
    out["engine_stats"] = nlohmann::json::parse(record.engine_stats, nullptr,
                                                false);
  }
  if (!record.similar_articles.empty()) {
    out["similar_articles"] =
        nlohmann::json::parse(record.similar_articles, nullptr, false);
  }
  return out;
}

} // namespace arsync

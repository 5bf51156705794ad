#include "util/duration.hpp"
#include "errors.hpp"

#include <cctype>
#include <limits>

namespace arsync {

namespace {

constexpr long long kMaxMillis = std::numeric_limits<long long>::max();

/// Add @p value units of @p unit_ms to @p total, rejecting overflow.
void add_scaled(long long &total, long long value, long long unit_ms,
                const std::string &text) {
  if (value > (kMaxMillis - total) / unit_ms) {
    throw ConfigError("Duration '" + text + "' is too large");
  }
  total += value * unit_ms;
}

} // namespace

std::chrono::milliseconds parse_duration(const std::string &text) {
  long long total_ms = 0;
  std::size_t i = 0;
  bool saw_unit = false;

  while (i < text.size()) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      throw ConfigError("Invalid duration '" + text + "'");
    }
    long long value = 0;
    while (i < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[i]))) {
      int digit = text[i] - '0';
      if (value > (kMaxMillis - digit) / 10) {
        throw ConfigError("Duration '" + text + "' is too large");
      }
      value = value * 10 + digit;
      ++i;
    }
    if (i == text.size()) {
      if (saw_unit) {
        throw ConfigError("Missing unit in duration '" + text + "'");
      }
      add_scaled(total_ms, value, 1000, text);
      break;
    }

    char unit = static_cast<char>(
        std::tolower(static_cast<unsigned char>(text[i++])));
    if (unit == 'm' && i < text.size() &&
        std::tolower(static_cast<unsigned char>(text[i])) == 's') {
      ++i;
      add_scaled(total_ms, value, 1, text);
      saw_unit = true;
      continue;
    }
    switch (unit) {
    case 's':
      add_scaled(total_ms, value, 1000, text);
      break;
    case 'm':
      add_scaled(total_ms, value, 60 * 1000, text);
      break;
    case 'h':
      add_scaled(total_ms, value, 3600 * 1000, text);
      break;
    case 'd':
      add_scaled(total_ms, value, 86400 * 1000, text);
      break;
    case 'w':
      add_scaled(total_ms, value, 604800LL * 1000, text);
      break;
    default:
      throw ConfigError("Invalid duration unit in '" + text + "'");
    }
    saw_unit = true;
  }
  return std::chrono::milliseconds{total_ms};
}

std::string format_duration(std::chrono::milliseconds value) {
  long long ms = value.count();
  if (ms < 1000) {
    return std::to_string(ms) + "ms";
  }
  std::string out;
  long long secs = ms / 1000;
  if (secs >= 3600) {
    out += std::to_string(secs / 3600) + "h";
    secs %= 3600;
  }
  if (secs >= 60) {
    out += std::to_string(secs / 60) + "m";
    secs %= 60;
  }
  if (secs > 0 || out.empty()) {
    out += std::to_string(secs) + "s";
  }
  return out;
}

} // namespace arsync

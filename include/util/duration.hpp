/**
 * @file duration.hpp
 * @brief Parsing of human-readable durations used in configuration.
 */
#ifndef ARTICLESYNC_UTIL_DURATION_HPP
#define ARTICLESYNC_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace arsync {

/**
 * Parse a duration such as "250ms", "30s", "15m", "1h30m" or "2d". Units may
 * be combined; a bare number means seconds.
 *
 * @param text Duration string; empty yields zero.
 * @return Parsed duration in milliseconds.
 * @throws ConfigError On an unknown unit or malformed input.
 */
std::chrono::milliseconds parse_duration(const std::string &text);

/// Render a duration compactly for log output, e.g. "1m30s" or "250ms".
std::string format_duration(std::chrono::milliseconds value);

} // namespace arsync

#endif // ARTICLESYNC_UTIL_DURATION_HPP

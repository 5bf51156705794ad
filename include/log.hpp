/**
 * @file log.hpp
 * @brief Logging setup for articlesync.
 *
 * Declares the default logger bootstrap, per-component category loggers and
 * level parsing helpers shared by the library and the daemon.
 */

#ifndef ARTICLESYNC_LOG_HPP
#define ARTICLESYNC_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace arsync {

/// Settings used when building the default logger.
struct LogOptions {
  spdlog::level::level_enum level = spdlog::level::info;
  /// spdlog pattern; empty keeps the spdlog default.
  std::string pattern;
  /// Optional log file. Empty disables file output.
  std::string file;
  /// Maximum size of the active log file before it is rotated.
  std::size_t max_file_size = 10 * 1024 * 1024;
  /// Number of rotated files to keep. Zero writes a single growing file.
  std::size_t rotate_files = 3;
  /// Gzip rotated files with zlib.
  bool compress_rotations = false;
};

/**
 * Initialize the default `arsync` logger with a colour console sink and an
 * optional rotating file sink. Calling it again only adjusts the level and
 * pattern of the existing logger.
 */
void init_logger(const LogOptions &options);

/// Convenience overload mirroring the most common call site.
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a component category.
 *
 * Category loggers are named `arsync.<category>`, share the sinks of the
 * default logger and start at its level.
 *
 * @param category Component name such as `sync` or `dedup`.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply per-category log level overrides.
 *
 * @param overrides Mapping of category name to level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Parse a textual log level (`trace`, `debug`, `info`, `warn`, `error`,
 * `critical`, `off`).
 *
 * @throws ConfigError When the name is not recognised.
 */
spdlog::level::level_enum parse_log_level(const std::string &name);

/// Create the default logger with info level when none has been set up yet.
void ensure_default_logger();

} // namespace arsync

#endif // ARTICLESYNC_LOG_HPP

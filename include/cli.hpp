/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for articlesync.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef ARTICLESYNC_CLI_HPP
#define ARTICLESYNC_CLI_HPP

#include <exception>
#include <string>
#include <unordered_map>

namespace arsync {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Exit code that triggered the exception.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options supplied via the CLI.
 *
 * Fields left at their empty values, or whose `_explicit` companion is false,
 * defer to the configuration file.
 */
struct CliOptions {
  bool verbose = false;      ///< Enables verbose output
  std::string config_file;   ///< Optional path to configuration file
  std::string api_base;      ///< Article server base URL
  std::string device_id;     ///< Device identifier for authentication
  std::string database;      ///< SQLite article database path
  std::string state_file;    ///< Activity state file path
  bool allow_cellular{false}; ///< Permit sync over cellular links
  bool allow_cellular_explicit{false};
  bool sync_now{false};    ///< Run one manual sync and exit
  bool daemon{false};      ///< Keep running and sync on the background schedule
  std::string export_json; ///< Write stored articles to this JSON file
  std::string log_level;   ///< Logging verbosity level
  std::string log_file;    ///< Optional path to rotating log file
  int log_rotate{3};       ///< Number of rotated log files to keep
  bool log_rotate_explicit{false};
  bool log_compress{false}; ///< Compress rotated log files
  bool log_compress_explicit{false};
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
};

/**
 * Parse command line arguments and return the normalized options structure.
 *
 * @param argc Number of elements supplied in @p argv.
 * @param argv Null-terminated array of raw CLI argument strings.
 * @return Populated options structure describing the requested behaviour.
 * @throws CliParseExit When parsing encounters conditions such as `--help`,
 *         `--version` or invalid arguments that require an early exit.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace arsync

#endif // ARTICLESYNC_CLI_HPP

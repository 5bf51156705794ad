#include "cli.hpp"
#include "log.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <array>
#include <cstdint>
#include <iostream>
#include <memory>
#include <sstream>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace arsync {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 12> categories = {
      "app",    "cli",     "config",    "dedup", "events", "http",
      "ingest", "main",    "network",   "scheduler", "store", "sync"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., ingest=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}
} // namespace

/**
 * Parse the articlesync command line.
 *
 * Toggle flags are recorded together with an `_explicit` marker so the
 * application can tell an unset flag from one that matches the config file.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"articlesync command line"};
  app.footer(log_category_help_text());
  CliOptions options;

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "articlesync " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");

  app.add_option("-a,--api-base", options.api_base,
                 "Base URL of the article server")
      ->type_name("URL")
      ->group("Sync");
  app.add_option("-d,--device-id", options.device_id,
                 "Device identifier used to authenticate")
      ->type_name("ID")
      ->group("Sync");
  app.add_flag_function(
         "--allow-cellular",
         [&options](std::int64_t) {
           options.allow_cellular = true;
           options.allow_cellular_explicit = true;
         },
         "Allow synchronisation over cellular connections")
      ->group("Sync");
  auto *sync_now = app.add_flag("-s,--sync-now", options.sync_now,
                                "Run one manual sync and exit")
                       ->group("Sync");
  auto *daemon = app.add_flag("-D,--daemon", options.daemon,
                              "Keep running and sync on the background "
                              "schedule")
                     ->group("Sync");
  sync_now->excludes(daemon);

  app.add_option("--database", options.database, "SQLite article database")
      ->type_name("FILE")
      ->group("Storage");
  app.add_option("--state-file", options.state_file,
                 "File holding scheduling activity state")
      ->type_name("FILE")
      ->group("Storage");
  app.add_option("-J,--export-json", options.export_json,
                 "Export stored articles to a JSON file")
      ->type_name("FILE")
      ->group("Storage");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_function(
         "--log-compress",
         [&options](std::int64_t) {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
         },
         "Enable a logging category (NAME or NAME=LEVEL)")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (!options.log_categories.empty()) {
    cli_log()->debug("{} log category override(s) requested",
                     options.log_categories.size());
  }
  return options;
}

} // namespace arsync

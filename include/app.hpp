/**
 * @file app.hpp
 * @brief Application entry point and orchestrator for articlesync.
 *
 * Declares the App class, which merges command line options into the loaded
 * configuration, initializes logging and runs the requested mode.
 */

#ifndef ARTICLESYNC_APP_HPP
#define ARTICLESYNC_APP_HPP

#include "cli.hpp"
#include "config.hpp"

namespace arsync {

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Parse the command line, load the configuration and set up logging.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  /**
   * Build the sync components from the resolved configuration and run the
   * requested mode (`--export-json`, `--sync-now` or `--daemon`).
   *
   * @return Process exit code.
   */
  int execute();

  const CliOptions &options() const { return options_; }
  const Config &config() const { return config_; }

  /// `true` when run() already produced the final exit code.
  bool should_exit() const { return should_exit_; }

private:
  void apply_cli_overrides();
  int run_daemon();

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace arsync

#endif // ARTICLESYNC_APP_HPP

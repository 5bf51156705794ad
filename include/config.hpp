/**
 * @file config.hpp
 * @brief Configuration loading for articlesync.
 *
 * Settings are read from YAML, TOML or JSON files. Keys may be written flat
 * or grouped under the `sync`, `ingest`, `network`, `schedule`, `storage`,
 * `logging` and `hooks` sections.
 */

#ifndef ARTICLESYNC_CONFIG_HPP
#define ARTICLESYNC_CONFIG_HPP

#include "event_dispatcher.hpp"
#include "ingestion_pipeline.hpp"
#include "log.hpp"
#include "sync_coordinator.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace arsync {

class Config {
public:
  /// Base URL of the article server, e.g. `https://news.example.com/api`.
  const std::string &api_base() const { return api_base_; }
  void set_api_base(const std::string &v) { api_base_ = v; }

  /// Device identifier used to obtain a bearer token. Empty disables auth.
  const std::string &device_id() const { return device_id_; }
  void set_device_id(const std::string &v) { device_id_ = v; }

  bool allow_cellular_sync() const { return allow_cellular_sync_; }
  void set_allow_cellular_sync(bool v) { allow_cellular_sync_ = v; }

  std::chrono::milliseconds exchange_timeout() const {
    return exchange_timeout_;
  }
  void set_exchange_timeout(std::chrono::milliseconds v) {
    exchange_timeout_ = v;
  }

  std::chrono::milliseconds article_timeout() const { return article_timeout_; }
  void set_article_timeout(std::chrono::milliseconds v) {
    article_timeout_ = v;
  }

  /// Ingestion window of a background fetch task.
  std::chrono::milliseconds batch_window() const { return batch_window_; }
  void set_batch_window(std::chrono::milliseconds v) { batch_window_ = v; }

  std::chrono::milliseconds batch_pause() const { return batch_pause_; }
  void set_batch_pause(std::chrono::milliseconds v) { batch_pause_ = v; }

  std::chrono::milliseconds manual_throttle() const { return manual_throttle_; }
  void set_manual_throttle(std::chrono::milliseconds v) {
    manual_throttle_ = v;
  }

  std::chrono::milliseconds seen_window() const { return seen_window_; }
  void set_seen_window(std::chrono::milliseconds v) { seen_window_ = v; }

  std::chrono::milliseconds completion_ttl() const { return completion_ttl_; }
  void set_completion_ttl(std::chrono::milliseconds v) { completion_ttl_ = v; }

  /// Most completions remembered at once.
  int completion_capacity() const { return completion_capacity_; }
  void set_completion_capacity(int v) { completion_capacity_ = v; }

  std::chrono::milliseconds network_probe_timeout() const {
    return network_probe_timeout_;
  }
  void set_network_probe_timeout(std::chrono::milliseconds v) {
    network_probe_timeout_ = v;
  }

  std::chrono::milliseconds http_timeout() const { return http_timeout_; }
  void set_http_timeout(std::chrono::milliseconds v) { http_timeout_ = v; }

  const std::string &http_proxy() const { return http_proxy_; }
  void set_http_proxy(const std::string &v) { http_proxy_ = v; }

  int ingest_concurrency() const { return ingest_concurrency_; }
  void set_ingest_concurrency(int v) { ingest_concurrency_ = v; }

  int ingest_batch_size() const { return ingest_batch_size_; }
  void set_ingest_batch_size(int v) { ingest_batch_size_ = v; }

  /// Article fetch starts per minute, zero for unlimited.
  int max_fetch_rate() const { return max_fetch_rate_; }
  void set_max_fetch_rate(int v) { max_fetch_rate_ = v; }

  const std::string &database() const { return database_; }
  void set_database(const std::string &v) { database_ = v; }

  const std::string &state_file() const { return state_file_; }
  void set_state_file(const std::string &v) { state_file_ = v; }

  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &v) { log_level_ = v; }

  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &v) { log_pattern_ = v; }

  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &v) { log_file_ = v; }

  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int v) { log_rotate_ = v; }

  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool v) { log_compress_ = v; }

  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(std::unordered_map<std::string, std::string> v) {
    log_categories_ = std::move(v);
  }

  const std::string &hook_command() const { return hook_command_; }
  void set_hook_command(const std::string &v) { hook_command_ = v; }

  const std::vector<std::string> &hook_events() const { return hook_events_; }
  void set_hook_events(std::vector<std::string> v) {
    hook_events_ = std::move(v);
  }

  CoordinatorOptions coordinator_options() const;
  IngestionOptions ingestion_options() const;
  /// @throws ConfigError When a level name is invalid.
  LogOptions log_options() const;
  /// @throws ConfigError When a category level name is invalid.
  std::unordered_map<std::string, spdlog::level::level_enum>
  log_category_levels() const;
  EventHookSettings hook_settings() const;

  /**
   * Apply values from a parsed configuration document.
   *
   * @throws ConfigError On values of the wrong type or out of range.
   */
  void load_json(const nlohmann::json &j);

  static Config from_json(const nlohmann::json &j);

  /**
   * Load a configuration file, picking the parser from its extension
   * (`.yaml`/`.yml`, `.toml`, `.json`).
   *
   * @throws ConfigError When the file is unreadable or invalid.
   */
  static Config from_file(const std::string &path);

private:
  std::string api_base_;
  std::string device_id_;
  bool allow_cellular_sync_ = false;
  std::chrono::milliseconds exchange_timeout_{std::chrono::seconds(60)};
  std::chrono::milliseconds article_timeout_{std::chrono::seconds(30)};
  std::chrono::milliseconds batch_window_{std::chrono::seconds(10)};
  std::chrono::milliseconds batch_pause_{100};
  std::chrono::milliseconds manual_throttle_{std::chrono::seconds(30)};
  std::chrono::milliseconds seen_window_{std::chrono::hours(24)};
  std::chrono::milliseconds completion_ttl_{std::chrono::minutes(10)};
  int completion_capacity_ = 1000;
  std::chrono::milliseconds network_probe_timeout_{std::chrono::seconds(3)};
  std::chrono::milliseconds http_timeout_{std::chrono::seconds(30)};
  std::string http_proxy_;
  int ingest_concurrency_ = 5;
  int ingest_batch_size_ = 10;
  int max_fetch_rate_ = 0;
  std::string database_ = "articles.db";
  std::string state_file_ = "articlesync-state.json";
  std::string log_level_ = "info";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  bool log_compress_ = false;
  std::unordered_map<std::string, std::string> log_categories_;
  std::string hook_command_;
  std::vector<std::string> hook_events_;
};

} // namespace arsync

#endif // ARTICLESYNC_CONFIG_HPP

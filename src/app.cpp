#include "app.hpp"
#include "activity_state.hpp"
#include "background_scheduler.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "dedup_registry.hpp"
#include "errors.hpp"
#include "event_dispatcher.hpp"
#include "http_client.hpp"
#include "ingestion_pipeline.hpp"
#include "local_task_host.hpp"
#include "log.hpp"
#include "network_gate.hpp"
#include "sqlite_article_store.hpp"
#include "sync_client.hpp"
#include "sync_coordinator.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace arsync {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) { g_stop_requested.store(true); }
} // namespace

/**
 * Execute the start-up flow.
 *
 * Parses the command line, loads the configuration file when one is given,
 * lets explicit CLI values override it and initializes logging.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    apply_cli_overrides();
    init_logger(config_.log_options());
    configure_log_categories(config_.log_category_levels());
  } catch (const ConfigError &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }
  if (!options_.export_json.empty() && !options_.sync_now &&
      !options_.daemon) {
    return 0;
  }
  if (!options_.sync_now && !options_.daemon) {
    app_log()->error("Nothing to do: pass --sync-now, --daemon or "
                     "--export-json");
    should_exit_ = true;
    return 2;
  }
  if (config_.api_base().empty()) {
    app_log()->error("No article server configured; set api_base or pass "
                     "--api-base");
    should_exit_ = true;
    return 1;
  }
  return 0;
}

void App::apply_cli_overrides() {
  if (!options_.api_base.empty()) {
    config_.set_api_base(options_.api_base);
  }
  if (!options_.device_id.empty()) {
    config_.set_device_id(options_.device_id);
  }
  if (!options_.database.empty()) {
    config_.set_database(options_.database);
  }
  if (!options_.state_file.empty()) {
    config_.set_state_file(options_.state_file);
  }
  if (options_.allow_cellular_explicit) {
    config_.set_allow_cellular_sync(options_.allow_cellular);
  }
  if (!options_.log_level.empty()) {
    config_.set_log_level(options_.log_level);
  } else if (options_.verbose && config_.log_level() == "info") {
    config_.set_log_level("debug");
  }
  if (!options_.log_file.empty()) {
    config_.set_log_file(options_.log_file);
  }
  if (options_.log_rotate_explicit) {
    config_.set_log_rotate(options_.log_rotate);
  }
  if (options_.log_compress_explicit) {
    config_.set_log_compress(options_.log_compress);
  }
  if (!options_.log_categories.empty()) {
    auto categories = config_.log_categories();
    for (const auto &[name, level] : options_.log_categories) {
      categories[name] = level;
    }
    config_.set_log_categories(std::move(categories));
  }
}

namespace {
/// Sync stack assembled from the resolved configuration.
struct SyncStack {
  std::shared_ptr<SqliteArticleStore> store;
  std::shared_ptr<EventDispatcher> events;
  std::shared_ptr<SyncCoordinator> coordinator;
};

SyncStack build_sync_stack(const Config &cfg) {
  SyncStack stack;
  stack.store = std::make_shared<SqliteArticleStore>(cfg.database());
  auto http = std::make_shared<CurlHttpClient>(
      static_cast<long>(cfg.http_timeout().count()), cfg.http_proxy());
  auto client =
      std::make_shared<SyncClient>(http, cfg.api_base(), cfg.device_id());
  auto registry = std::make_shared<DedupRegistry>(
      cfg.completion_ttl(), system_clock_fn(), 16,
      static_cast<std::size_t>(cfg.completion_capacity()));
  auto pipeline = std::make_shared<IngestionPipeline>(
      registry, stack.store, client, cfg.ingestion_options());
  auto gate = std::make_shared<NetworkGate>(
      [] { return std::make_unique<SysfsNetworkMonitor>(); },
      cfg.network_probe_timeout());
  if (!cfg.hook_command().empty()) {
    stack.events = std::make_shared<EventDispatcher>(cfg.hook_settings());
  }
  stack.coordinator = std::make_shared<SyncCoordinator>(
      gate, stack.store, client, pipeline, cfg.coordinator_options(),
      system_clock_fn(), stack.events);
  stack.coordinator->set_preferences(
      SyncPreferences{cfg.allow_cellular_sync()});
  return stack;
}
} // namespace

int App::execute() {
  if (options_.daemon) {
    return run_daemon();
  }
  try {
    if (!options_.sync_now) {
      SqliteArticleStore store(config_.database());
      store.export_json(options_.export_json);
      app_log()->info("Exported {} article(s) to {}", store.article_count(),
                      options_.export_json);
      return 0;
    }
    auto stack = build_sync_stack(config_);
    bool started = stack.coordinator->manual_sync();
    auto report = stack.coordinator->last_report();
    if (report) {
      app_log()->info("Sync finished: {}", to_json(*report).dump());
    }
    if (stack.events) {
      stack.events->flush();
    }
    if (!options_.export_json.empty()) {
      stack.store->export_json(options_.export_json);
      app_log()->info("Exported {} article(s) to {}",
                      stack.store->article_count(), options_.export_json);
    }
    return started && report && report->outcome == SyncOutcome::Success ? 0
                                                                        : 1;
  } catch (const SyncError &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
}

int App::run_daemon() {
  try {
    auto stack = build_sync_stack(config_);
    auto host = std::make_shared<LocalTaskHost>();
    auto state_file =
        std::make_shared<ActivityStateFile>(config_.state_file());
    SchedulePolicy policy;
    policy.fetch_batch_window =
        std::chrono::duration_cast<std::chrono::seconds>(
            config_.batch_window());
    BackgroundScheduler scheduler(host, stack.coordinator, state_file, policy);
    scheduler.attach();
    scheduler.record_foreground_use();
    host->start();
    scheduler.schedule_fetch();
    scheduler.schedule_processing();

    g_stop_requested.store(false);
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
    app_log()->info("articlesync daemon running against {}",
                    config_.api_base());
    while (!g_stop_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    app_log()->info("Stop requested, shutting down");
    host->stop();
    if (stack.events) {
      stack.events->flush();
    }
    if (!options_.export_json.empty()) {
      stack.store->export_json(options_.export_json);
    }
  } catch (const SyncError &e) {
    app_log()->error("{}", e.what());
    return 1;
  }
  return 0;
}

} // namespace arsync

#include "log.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

constexpr const char *kRootLogger = "arsync";

std::weak_ptr<spdlog::logger> g_root;
std::mutex g_log_mutex;
std::once_flag g_pool_once;

namespace fs = std::filesystem;

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_pool_once, [] { spdlog::init_thread_pool(8192, 1); });
  return spdlog::thread_pool();
}

/**
 * Path of the rotated file with the given index, following the naming used by
 * spdlog's rotating sink (`sync.log` -> `sync.1.log`).
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  std::string stem = base_path.filename().string();
  std::string ext;
  auto dot = stem.find_last_of('.');
  if (dot != std::string::npos && dot != 0) {
    ext = stem.substr(dot);
    stem.erase(dot);
  }
  return base_path.parent_path() /
         (stem + "." + std::to_string(index) + ext);
}

/// Shift existing `.gz` archives one slot up, dropping the oldest.
void shift_archives(const std::string &base, std::size_t keep) {
  std::error_code ec;
  fs::remove(rotated_path(base, keep).string() + ".gz", ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = rotated_path(base, i - 1).string() + ".gz";
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = rotated_path(base, i).string() + ".gz";
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

bool gzip_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  const std::string target = path.string() + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  char chunk[16 * 1024];
  bool ok = true;
  while (ok && in) {
    in.read(chunk, sizeof(chunk));
    auto got = in.gcount();
    if (got > 0 &&
        gzwrite(gz, chunk, static_cast<unsigned>(got)) != static_cast<int>(got)) {
      ok = false;
    }
  }
  gzclose(gz);
  in.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  return true;
}

spdlog::sink_ptr make_file_sink(const arsync::LogOptions &options) {
  if (options.rotate_files == 0) {
    return std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file,
                                                                false);
  }
  spdlog::file_event_handlers handlers;
  if (options.compress_rotations) {
    const std::size_t keep = options.rotate_files;
    handlers.before_open = [keep](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_archives(base, keep);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec) && !gzip_file(newest)) {
        // The console sink is still available when archiving fails.
        spdlog::default_logger_raw()->warn("Failed to compress rotated log {}",
                                           newest.string());
      }
    };
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      options.file, options.max_file_size, options.rotate_files, false,
      handlers);
}

} // namespace

namespace arsync {

void init_logger(const LogOptions &options) {
  auto pool = shared_pool();
  std::unique_lock<std::mutex> lock(g_log_mutex);
  auto root = spdlog::get(kRootLogger);
  if (!root) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!options.file.empty()) {
      sinks.push_back(make_file_sink(options));
    }
    root = std::make_shared<spdlog::async_logger>(
        kRootLogger, sinks.begin(), sinks.end(), pool,
        spdlog::async_overflow_policy::block);
    spdlog::register_logger(root);
    spdlog::set_default_logger(root);
    g_root = root;
  }
  lock.unlock();
  root->set_level(options.level);
  if (!options.pattern.empty()) {
    spdlog::set_pattern(options.pattern);
  }
  root->debug("Logger ready (level={}, file='{}', rotate={}, compress={})",
              spdlog::level::to_string_view(options.level), options.file,
              options.rotate_files, options.compress_rotations);
}

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  LogOptions options;
  options.level = level;
  options.pattern = pattern;
  options.file = file;
  options.rotate_files = rotate_files;
  options.compress_rotations = compress_rotations;
  init_logger(options);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto root = g_root.lock();
  if (!root || current.get() != root.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLogger) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  ensure_default_logger();
  auto pool = shared_pool();
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = spdlog::default_logger();
  auto sinks = root->sinks();
  auto logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), pool,
      spdlog::async_overflow_policy::block);
  logger->set_level(root->level());
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("app")->debug("Applied {} category level override(s)",
                                  overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name) {
  std::string lowered = name;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lowered == "warning") {
    lowered = "warn";
  }
  auto level = spdlog::level::from_str(lowered);
  // from_str maps unknown names to off, so only accept off when asked for.
  if (level == spdlog::level::off && lowered != "off") {
    throw ConfigError("Unknown log level '" + name + "'");
  }
  return level;
}

} // namespace arsync

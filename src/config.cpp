#include "config.hpp"
#include "errors.hpp"
#include "util/duration.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string_view>

#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = category_logger("config");
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::optional<long long> scalar_as_integer(const std::string &s) {
  if (s.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    long long value = std::stoll(s, &idx, 10);
    if (idx == s.size()) {
      return value;
    }
  } catch (const std::logic_error &) {
    // Not an integer; fall through.
  }
  return std::nullopt;
}

std::optional<double> scalar_as_double(const std::string &s) {
  if (s.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    double value = std::stod(s, &idx);
    if (idx == s.size()) {
      return value;
    }
  } catch (const std::logic_error &) {
    // Not a number; fall through.
  }
  return std::nullopt;
}

/// Convert a YAML document into JSON, typing scalars where possible.
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    const std::string lowered = to_lower_copy(s);
    if (lowered == "true") {
      return true;
    }
    if (lowered == "false") {
      return false;
    }
    if (auto i = scalar_as_integer(s)) {
      return *i;
    }
    if (auto d = scalar_as_double(s)) {
      return *d;
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    auto &array = arr.get_ref<json::array_t &>();
    array.reserve(node.size());
    std::transform(node.begin(), node.end(), std::back_inserter(array),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/// Lift keys out of the known sections so grouped and flat files load alike.
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  for (std::string_view name : {"sync", "ingest", "network", "schedule",
                                "storage", "logging", "hooks"}) {
    auto it = source.find(std::string{name});
    if (it == source.end() || !it->is_object()) {
      continue;
    }
    for (const auto &[key, value] : it->items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

std::string read_string(const nlohmann::json &j, const char *key,
                        const std::string &fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_string()) {
    throw ConfigError(std::string("'") + key + "' must be a string");
  }
  return it->get<std::string>();
}

bool read_bool(const nlohmann::json &j, const char *key, bool fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_boolean()) {
    throw ConfigError(std::string("'") + key + "' must be true or false");
  }
  return it->get<bool>();
}

int read_int(const nlohmann::json &j, const char *key, int fallback,
             int minimum) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer()) {
    throw ConfigError(std::string("'") + key + "' must be an integer");
  }
  int value = it->get<int>();
  if (value < minimum) {
    throw ConfigError(std::string("'") + key + "' must be at least " +
                      std::to_string(minimum));
  }
  return value;
}

/// Integers are seconds; strings use parse_duration units.
std::chrono::milliseconds read_duration(const nlohmann::json &j,
                                        const char *key,
                                        std::chrono::milliseconds fallback) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return fallback;
  }
  if (it->is_number_integer()) {
    auto secs = it->get<long long>();
    if (secs < 0) {
      throw ConfigError(std::string("'") + key + "' must not be negative");
    }
    if (secs > std::numeric_limits<long long>::max() / 1000) {
      throw ConfigError(std::string("'") + key + "' is too large");
    }
    return std::chrono::seconds(secs);
  }
  if (it->is_number_float()) {
    auto secs = it->get<double>();
    if (secs < 0) {
      throw ConfigError(std::string("'") + key + "' must not be negative");
    }
    if (!(secs * 1000 < 9.2e18)) {
      throw ConfigError(std::string("'") + key + "' is too large");
    }
    return std::chrono::milliseconds(static_cast<long long>(secs * 1000));
  }
  if (it->is_string()) {
    return parse_duration(it->get<std::string>());
  }
  throw ConfigError(std::string("'") + key + "' must be a duration");
}

} // namespace

void Config::load_json(const nlohmann::json &raw) {
  if (!raw.is_object()) {
    throw ConfigError("Configuration root must be a mapping");
  }
  const nlohmann::json j = normalize_config_sections(raw);

  api_base_ = read_string(j, "api_base", api_base_);
  device_id_ = read_string(j, "device_id", device_id_);
  allow_cellular_sync_ =
      read_bool(j, "allow_cellular_sync", allow_cellular_sync_);

  exchange_timeout_ = read_duration(j, "exchange_timeout", exchange_timeout_);
  article_timeout_ = read_duration(j, "article_timeout", article_timeout_);
  batch_window_ = read_duration(j, "batch_window", batch_window_);
  batch_pause_ = read_duration(j, "batch_pause", batch_pause_);
  manual_throttle_ = read_duration(j, "manual_throttle", manual_throttle_);
  seen_window_ = read_duration(j, "seen_window", seen_window_);
  completion_ttl_ = read_duration(j, "completion_ttl", completion_ttl_);
  completion_capacity_ =
      read_int(j, "completion_capacity", completion_capacity_, 1);
  network_probe_timeout_ =
      read_duration(j, "network_probe_timeout", network_probe_timeout_);
  http_timeout_ = read_duration(j, "http_timeout", http_timeout_);
  http_proxy_ = read_string(j, "http_proxy", http_proxy_);

  ingest_concurrency_ =
      read_int(j, "ingest_concurrency", ingest_concurrency_, 1);
  ingest_batch_size_ = read_int(j, "ingest_batch_size", ingest_batch_size_, 1);
  max_fetch_rate_ = read_int(j, "max_fetch_rate", max_fetch_rate_, 0);

  database_ = read_string(j, "database", database_);
  state_file_ = read_string(j, "state_file", state_file_);

  log_level_ = read_string(j, "log_level", log_level_);
  log_pattern_ = read_string(j, "log_pattern", log_pattern_);
  log_file_ = read_string(j, "log_file", log_file_);
  log_rotate_ = read_int(j, "log_rotate", log_rotate_, 0);
  log_compress_ = read_bool(j, "log_compress", log_compress_);
  if (auto it = j.find("log_categories"); it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      throw ConfigError("'log_categories' must map categories to levels");
    }
    for (const auto &[category, level] : it->items()) {
      if (!level.is_string()) {
        throw ConfigError("Level for log category '" + category +
                          "' must be a string");
      }
      log_categories_[category] = level.get<std::string>();
    }
  }

  hook_command_ = read_string(j, "hook_command", hook_command_);
  if (auto it = j.find("hook_events"); it != j.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw ConfigError("'hook_events' must be a list");
    }
    hook_events_.clear();
    for (const auto &name : *it) {
      if (!name.is_string()) {
        throw ConfigError("'hook_events' entries must be strings");
      }
      hook_events_.push_back(name.get<std::string>());
    }
  }
}

CoordinatorOptions Config::coordinator_options() const {
  CoordinatorOptions options;
  options.exchange_timeout = exchange_timeout_;
  options.manual_throttle = manual_throttle_;
  options.seen_window = seen_window_;
  return options;
}

IngestionOptions Config::ingestion_options() const {
  IngestionOptions options;
  options.concurrency = ingest_concurrency_;
  options.batch_size = static_cast<std::size_t>(ingest_batch_size_);
  options.batch_pause = batch_pause_;
  options.item_timeout = article_timeout_;
  options.max_fetches_per_minute = max_fetch_rate_;
  return options;
}

LogOptions Config::log_options() const {
  LogOptions options;
  options.level = parse_log_level(log_level_);
  options.pattern = log_pattern_;
  options.file = log_file_;
  options.rotate_files = static_cast<std::size_t>(log_rotate_);
  options.compress_rotations = log_compress_;
  return options;
}

std::unordered_map<std::string, spdlog::level::level_enum>
Config::log_category_levels() const {
  std::unordered_map<std::string, spdlog::level::level_enum> levels;
  for (const auto &[category, name] : log_categories_) {
    levels[category] = parse_log_level(name);
  }
  return levels;
}

EventHookSettings Config::hook_settings() const {
  return EventHookSettings{hook_command_, hook_events_};
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    throw ConfigError("Unknown config file extension for " + path);
  }
  const std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigError("Failed to open config file " + path);
      }
      j = nlohmann::json::parse(f);
    } else if (ext == "toml" || ext == "tml") {
      j = toml_to_json(toml::parse_file(path));
    } else {
      throw ConfigError("Unsupported config format: " + ext);
    }
  } catch (const ConfigError &) {
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigError("Failed to load config " + path + ": " + e.what());
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace arsync

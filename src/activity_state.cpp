#include "activity_state.hpp"
#include "log.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace arsync {

namespace {

void put_time(nlohmann::json &out, const char *key,
              const std::optional<TimePoint> &tp) {
  if (tp) {
    out[key] = std::chrono::duration_cast<std::chrono::seconds>(
                   tp->time_since_epoch())
                   .count();
  }
}

std::optional<TimePoint> get_time(const nlohmann::json &in, const char *key) {
  auto it = in.find(key);
  if (it == in.end() || !it->is_number()) {
    return std::nullopt;
  }
  return TimePoint(std::chrono::seconds(it->get<std::int64_t>()));
}

} // namespace

nlohmann::json to_json(const ActivityState &state) {
  nlohmann::json out{{"pending_work", state.pending_work}};
  put_time(out, "last_foreground", state.last_foreground);
  put_time(out, "pending_updated", state.pending_updated);
  put_time(out, "last_maintenance", state.last_maintenance);
  return out;
}

ActivityState activity_from_json(const nlohmann::json &json) {
  ActivityState state;
  if (!json.is_object()) {
    return state;
  }
  auto pending = json.find("pending_work");
  if (pending != json.end() && pending->is_number_integer()) {
    state.pending_work = pending->get<int>();
  }
  state.last_foreground = get_time(json, "last_foreground");
  state.pending_updated = get_time(json, "pending_updated");
  state.last_maintenance = get_time(json, "last_maintenance");
  return state;
}

ActivityStateFile::ActivityStateFile(std::string path)
    : path_(std::move(path)) {}

ActivityState ActivityStateFile::load() const {
  std::ifstream in(path_);
  if (!in) {
    return {};
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded()) {
    category_logger("scheduler")
        ->warn("Ignoring unreadable activity state in {}", path_);
    return {};
  }
  return activity_from_json(parsed);
}

void ActivityStateFile::save(const ActivityState &state) const {
  namespace fs = std::filesystem;
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to write activity state to " + tmp);
    }
    out << to_json(state).dump(2);
  }
  std::error_code ec;
  fs::rename(tmp, path_, ec);
  if (ec) {
    throw std::runtime_error("Failed to replace " + path_ + ": " +
                             ec.message());
  }
}

} // namespace arsync

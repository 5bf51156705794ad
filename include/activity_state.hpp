/**
 * @file activity_state.hpp
 * @brief Usage and workload timestamps that drive background scheduling.
 */

#ifndef ARTICLESYNC_ACTIVITY_STATE_HPP
#define ARTICLESYNC_ACTIVITY_STATE_HPP

#include "util/clock.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace arsync {

struct ActivityState {
  /// Last time the user actively used the application.
  std::optional<TimePoint> last_foreground;
  /// Articles known to still need processing.
  int pending_work = 0;
  /// When pending_work was last refreshed.
  std::optional<TimePoint> pending_updated;
  /// Last successful background processing run.
  std::optional<TimePoint> last_maintenance;
};

nlohmann::json to_json(const ActivityState &state);
ActivityState activity_from_json(const nlohmann::json &json);

/**
 * JSON file holding an ActivityState between daemon runs. A missing or
 * unreadable file yields a default state.
 */
class ActivityStateFile {
public:
  explicit ActivityStateFile(std::string path);

  ActivityState load() const;

  /// Write atomically through a temporary file.
  /// @throws std::runtime_error When the file cannot be written.
  void save(const ActivityState &state) const;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace arsync

#endif // ARTICLESYNC_ACTIVITY_STATE_HPP

/**
 * @file network_gate.hpp
 * @brief One-shot connectivity classification and the sync policy built on it.
 */

#ifndef ARTICLESYNC_NETWORK_GATE_HPP
#define ARTICLESYNC_NETWORK_GATE_HPP

#include "cancellation.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace arsync {

enum class NetworkKind { Wifi, Cellular, Other, None };

const char *to_string(NetworkKind kind);

/// User preferences that influence whether a sync may start.
struct SyncPreferences {
  bool allow_cellular_sync = false;
};

/**
 * Source of connectivity readings. `start` begins observing and reports
 * readings through the callback until `cancel` is called.
 */
class NetworkMonitor {
public:
  using Callback = std::function<void(NetworkKind)>;
  virtual ~NetworkMonitor() = default;
  virtual void start(Callback on_reading) = 0;
  /// Stop observing. No callback runs after this returns.
  virtual void cancel() = 0;
};

/**
 * Monitor backed by `/sys/class/net`. A reading is taken on a detached helper
 * thread once per start, so `cancel` never waits on a slow read; a reading
 * that arrives after `cancel` is dropped.
 */
class SysfsNetworkMonitor : public NetworkMonitor {
public:
  using Reader = std::function<NetworkKind(const std::string &sysfs_root)>;

  explicit SysfsNetworkMonitor(std::string sysfs_root = "/sys/class/net",
                               Reader reader = Reader{});
  ~SysfsNetworkMonitor() override;

  void start(Callback on_reading) override;
  void cancel() override;

  /// Classify the interfaces currently present below @p sysfs_root.
  static NetworkKind read_interfaces(const std::string &sysfs_root);

private:
  struct Attempt {
    std::mutex mutex;
    bool cancelled = false;
  };

  std::string root_;
  Reader reader_;
  std::mutex mutex_;
  std::shared_ptr<Attempt> attempt_;
};

class NetworkGate {
public:
  using MonitorFactory = std::function<std::unique_ptr<NetworkMonitor>()>;

  /**
   * @param factory Creates a fresh monitor for every classification.
   * @param timeout Upper bound on waiting for the first reading.
   */
  explicit NetworkGate(MonitorFactory factory,
                       std::chrono::milliseconds timeout =
                           std::chrono::seconds(3));

  /**
   * Take exactly one reading and stop the monitor. A timeout or cancelled
   * token yields NetworkKind::None.
   */
  NetworkKind classify(const CancellationToken &token = {});

  /// Wifi always syncs, cellular and other follow the preference, none never.
  static bool should_sync(NetworkKind kind, const SyncPreferences &prefs);

private:
  MonitorFactory factory_;
  std::chrono::milliseconds timeout_;
};

} // namespace arsync

#endif // ARTICLESYNC_NETWORK_GATE_HPP

#include "network_gate.hpp"
#include "log.hpp"

#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>
#include <thread>

namespace arsync {

namespace fs = std::filesystem;

namespace {

std::string read_trimmed(const fs::path &path) {
  std::ifstream in(path);
  std::string value;
  std::getline(in, value);
  while (!value.empty() && (value.back() == '\n' || value.back() == ' ')) {
    value.pop_back();
  }
  return value;
}

bool interface_up(const fs::path &dir) {
  auto state = read_trimmed(dir / "operstate");
  if (state == "up") {
    return true;
  }
  // Point-to-point links such as modems often report "unknown".
  return state == "unknown" && read_trimmed(dir / "carrier") == "1";
}

bool is_cellular(const fs::path &dir) {
  auto name = dir.filename().string();
  if (name.rfind("wwan", 0) == 0 || name.rfind("ww", 0) == 0) {
    return true;
  }
  std::ifstream uevent(dir / "uevent");
  std::string line;
  while (std::getline(uevent, line)) {
    if (line == "DEVTYPE=wwan") {
      return true;
    }
  }
  return false;
}

} // namespace

const char *to_string(NetworkKind kind) {
  switch (kind) {
  case NetworkKind::Wifi:
    return "wifi";
  case NetworkKind::Cellular:
    return "cellular";
  case NetworkKind::Other:
    return "other";
  case NetworkKind::None:
    return "none";
  }
  return "none";
}

SysfsNetworkMonitor::SysfsNetworkMonitor(std::string sysfs_root,
                                         Reader reader)
    : root_(std::move(sysfs_root)), reader_(std::move(reader)) {
  if (!reader_) {
    reader_ = &SysfsNetworkMonitor::read_interfaces;
  }
}

SysfsNetworkMonitor::~SysfsNetworkMonitor() { cancel(); }

NetworkKind SysfsNetworkMonitor::read_interfaces(const std::string &sysfs_root) {
  bool wifi = false;
  bool cellular = false;
  bool other = false;
  std::error_code ec;
  for (fs::directory_iterator it(sysfs_root, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto dir = it->path();
    if (dir.filename() == "lo" || !interface_up(dir)) {
      continue;
    }
    if (fs::exists(dir / "wireless", ec) || fs::exists(dir / "phy80211", ec)) {
      wifi = true;
    } else if (is_cellular(dir)) {
      cellular = true;
    } else {
      other = true;
    }
  }
  if (wifi) {
    return NetworkKind::Wifi;
  }
  if (cellular) {
    return NetworkKind::Cellular;
  }
  return other ? NetworkKind::Other : NetworkKind::None;
}

void SysfsNetworkMonitor::start(Callback on_reading) {
  cancel();
  auto attempt = std::make_shared<Attempt>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    attempt_ = attempt;
  }
  std::thread([attempt, root = root_, reader = reader_,
               on_reading = std::move(on_reading)] {
    auto kind = reader(root);
    std::lock_guard<std::mutex> lock(attempt->mutex);
    if (!attempt->cancelled) {
      on_reading(kind);
    }
  }).detach();
}

void SysfsNetworkMonitor::cancel() {
  std::shared_ptr<Attempt> attempt;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    attempt.swap(attempt_);
  }
  if (attempt) {
    std::lock_guard<std::mutex> lock(attempt->mutex);
    attempt->cancelled = true;
  }
}

NetworkGate::NetworkGate(MonitorFactory factory,
                         std::chrono::milliseconds timeout)
    : factory_(std::move(factory)), timeout_(timeout) {}

NetworkKind NetworkGate::classify(const CancellationToken &token) {
  auto log = category_logger("network");
  auto monitor = factory_();
  if (!monitor) {
    log->warn("No network monitor available; treating link as none");
    return NetworkKind::None;
  }

  // Shared with the callback so a late reading cannot touch a dead frame.
  struct Reading {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<NetworkKind> kind;
    bool cancelled = false;
  };
  auto reading = std::make_shared<Reading>();
  monitor->start([reading](NetworkKind kind) {
    {
      std::lock_guard<std::mutex> lock(reading->mutex);
      if (reading->kind) {
        return;
      }
      reading->kind = kind;
    }
    reading->cv.notify_all();
  });

  auto woken_by_token = token.on_cancel([reading] {
    {
      std::lock_guard<std::mutex> lock(reading->mutex);
      reading->cancelled = true;
    }
    reading->cv.notify_all();
  });

  auto until = std::chrono::steady_clock::now() + timeout_;
  if (auto limit = token.deadline(); limit && *limit < until) {
    until = *limit;
  }
  std::optional<NetworkKind> result;
  {
    std::unique_lock<std::mutex> lock(reading->mutex);
    reading->cv.wait_until(lock, until, [&reading] {
      return reading->kind.has_value() || reading->cancelled;
    });
    result = reading->kind;
  }
  woken_by_token.reset();
  monitor->cancel();

  if (!result) {
    log->warn("Connectivity check gave no reading within {} ms",
              timeout_.count());
    return NetworkKind::None;
  }
  log->debug("Connectivity classified as {}", to_string(*result));
  return *result;
}

bool NetworkGate::should_sync(NetworkKind kind, const SyncPreferences &prefs) {
  switch (kind) {
  case NetworkKind::Wifi:
    return true;
  case NetworkKind::Cellular:
  case NetworkKind::Other:
    return prefs.allow_cellular_sync;
  case NetworkKind::None:
    return false;
  }
  return false;
}

} // namespace arsync

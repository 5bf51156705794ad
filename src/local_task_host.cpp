#include "local_task_host.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace arsync {

namespace {

std::shared_ptr<spdlog::logger> host_log() {
  static auto logger = category_logger("scheduler");
  return logger;
}

std::string read_line(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::string value;
  std::getline(in, value);
  return value;
}

} // namespace

LocalTaskHost::LocalTaskHost(PowerProbe on_external_power,
                             std::chrono::milliseconds power_retry)
    : power_probe_(std::move(on_external_power)), power_retry_(power_retry) {
  if (!power_probe_) {
    power_probe_ = [] { return LocalTaskHost::on_external_power(); };
  }
}

LocalTaskHost::~LocalTaskHost() { stop(); }

bool LocalTaskHost::on_external_power(const std::string &root) {
  namespace fs = std::filesystem;
  std::error_code ec;
  bool saw_battery = false;
  for (fs::directory_iterator it(root, ec), end; !ec && it != end;
       it.increment(ec)) {
    auto type = read_line(it->path() / "type");
    if (type == "Mains" && read_line(it->path() / "online") == "1") {
      return true;
    }
    if (type == "Battery") {
      saw_battery = true;
    }
  }
  return !saw_battery;
}

void LocalTaskHost::register_handler(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handler_ = std::move(handler);
}

void LocalTaskHost::submit(const ScheduleRequest &request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handler_) {
      throw SchedulingError(SchedulingFailure::Unsupported,
                            "no task handler registered");
    }
    if (stopping_) {
      throw SchedulingError(SchedulingFailure::Denied,
                            "task host is shutting down");
    }
    pending_[request.kind] = request;
  }
  cv_.notify_all();
}

std::optional<ScheduleRequest> LocalTaskHost::pending(TaskKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(kind);
  if (it == pending_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void LocalTaskHost::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  stopping_ = false;
  thread_ = std::thread([this] { loop(); });
}

void LocalTaskHost::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    stopping_ = true;
    if (current_) {
      current_->cancel();
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  running_ = false;
}

void LocalTaskHost::loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (pending_.empty()) {
      cv_.wait(lock);
      continue;
    }
    auto next = pending_.begin();
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
      if (it->second.earliest_begin < next->second.earliest_begin) {
        next = it;
      }
    }
    auto due = next->second.earliest_begin;
    if (WallClock::now() < due) {
      cv_.wait_until(lock, due);
      continue;
    }
    ScheduleRequest request = next->second;
    pending_.erase(next);
    if (request.requires_external_power) {
      lock.unlock();
      bool powered = power_probe_();
      lock.lock();
      if (!powered) {
        host_log()->debug("Deferring {} task until on external power",
                          to_string(request.kind));
        request.earliest_begin = WallClock::now() + power_retry_;
        pending_.emplace(request.kind, request);
        continue;
      }
    }
    run_task(request, lock);
  }
}

void LocalTaskHost::run_task(const ScheduleRequest &request,
                             std::unique_lock<std::mutex> &lock) {
  auto source = std::make_shared<CancellationSource>();
  current_ = source;
  Handler handler = handler_;
  bool done = false;

  // The handler runs on its own thread so this one can enforce the budget.
  std::thread worker([&, source] {
    try {
      handler(request.kind, source->token());
    } catch (const std::exception &e) {
      host_log()->error("Background {} task failed: {}",
                        to_string(request.kind), e.what());
    }
    std::lock_guard<std::mutex> guard(mutex_);
    done = true;
    cv_.notify_all();
  });

  auto limit = std::chrono::steady_clock::now() + request.time_limit;
  bool expired = false;
  while (!done) {
    if (!expired && (stopping_ || std::chrono::steady_clock::now() >= limit)) {
      host_log()->warn("Background {} task expired", to_string(request.kind));
      source->cancel();
      expired = true;
    }
    if (expired) {
      cv_.wait(lock);
    } else {
      cv_.wait_until(lock, limit);
    }
  }
  lock.unlock();
  worker.join();
  lock.lock();
  current_.reset();
}

} // namespace arsync

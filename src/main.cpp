#include "app.hpp"
#include "log.hpp"

#include <exception>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    arsync::ensure_default_logger();
    return arsync::category_logger("main");
  }();
  return logger;
}
} // namespace

/**
 * Program entry point: configure the application, then run the selected
 * sync mode.
 */
int main(int argc, char **argv) {
  arsync::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    return ret;
  }
  try {
    ret = app.execute();
  } catch (const std::exception &e) {
    main_log()->critical("Unhandled error: {}", e.what());
    ret = 1;
  }
  spdlog::shutdown();
  return ret;
}

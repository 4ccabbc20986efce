#include "gitstage/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace gitstage::log {

namespace {
std::mutex g_mutex;
spdlog::level::level_enum g_level = spdlog::level::warn;
} // namespace

std::shared_ptr<spdlog::logger> category(const std::string &name) {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(name);
  logger->set_level(g_level);
  return logger;
}

void set_level(std::string_view level) {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_level = spdlog::level::from_str(std::string(level));
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &l) { l->set_level(g_level); });
}

} // namespace gitstage::log

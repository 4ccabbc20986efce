#pragma once
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gitstage::log {

// Named logger ("status", "refresh", "git", "config"), created on first use
// and writing to stderr at the current level.
std::shared_ptr<spdlog::logger> category(const std::string &name);

// Set the level of every category logger, existing and future.
// Accepts spdlog level names ("trace", "debug", "info", "warn", "error", "off").
void set_level(std::string_view level);

} // namespace gitstage::log

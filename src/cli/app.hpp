#pragma once
#include "gitstage/registry.hpp"
#include "gitstage/status_buffer.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitstage::cli {

struct Options {
  std::optional<std::filesystem::path> config;
  bool partial{false};
  bool yes{false};
  bool signs{false};
  bool unfold{false};
  std::vector<std::string> args;
};

// Flags may appear anywhere after the subcommand. Throws std::invalid_argument.
Options parse_options(int argc, char **argv);

struct LineRange {
  int first{0};
  int last{0};
};

// "<from>" or "<from>:<to>", 1-based. Throws std::invalid_argument.
LineRange parse_range(std::string_view text);

// Owns the open buffers for one invocation.
class App {
public:
  // Buffer for the repository around the working directory, refreshed once.
  // With --unfold every fold is opened, so line numbers match `status --unfold`.
  StatusBuffer &open(const Options &opts);

private:
  BufferRegistry buffers_;
};

} // namespace gitstage::cli

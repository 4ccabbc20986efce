#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace gitstage {

struct ProcessResult {
  int exit_code{-1};
  std::string out;
  std::string err;
};

// Run argv[0] (looked up in PATH) in `cwd`, feeding `input` to its stdin.
// Throws std::runtime_error if the process cannot be started.
ProcessResult run_process(const std::vector<std::string> &argv, const std::filesystem::path &cwd,
                          const std::string &input = {});

} // namespace gitstage

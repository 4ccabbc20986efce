#include "cli/registry.hpp"

#include "gitstage/consts.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <ostream>
#include <utility>

namespace gitstage::cli {

static std::map<std::string, Command> &commands() {
  static std::map<std::string, Command> t;
  return t;
}

void register_command(const std::string &name, Command cmd) { commands()[name] = std::move(cmd); }

const Command *find_command(const std::string &name) {
  const auto it = commands().find(name);
  return it == commands().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &out) {
  std::size_t width = 0;
  for (const auto &[name, cmd] : commands())
    width = std::max(width, name.size() + 1 + cmd.synopsis.size());

  out << "usage: gitstage <command> [args] [--config <file>] [--unfold]\n\n";
  out << "Line numbers address the buffer `gitstage status` prints with the same\n"
      << "--unfold and --config flags.\n\n";
  out << "commands:\n";
  for (const auto &[name, cmd] : commands()) {
    out << "  " << std::left << std::setw(static_cast<int>(width)) << (name + " " + cmd.synopsis)
        << "  " << cmd.summary << "\n";
  }
  out << "\noptions:\n"
      << "  --config <file>  render options (default .git/" << consts::kConfigFile << ")\n"
      << "  --unfold         open every section, file and hunk first\n";
}

} // namespace gitstage::cli

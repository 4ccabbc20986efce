#pragma once
#include "cli/command.hpp"

#include <iosfwd>
#include <string>

namespace gitstage::cli {

// A subcommand of the gitstage binary.
struct Command {
  command_fn fn{nullptr};
  std::string synopsis; // arguments after the command name
  std::string summary;
};

void register_command(const std::string &name, Command cmd);
const Command *find_command(const std::string &name);
void print_usage(std::ostream &out);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitstage::cli

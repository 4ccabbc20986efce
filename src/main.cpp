#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  gitstage::cli::register_all_commands();

  if (argc < 2) {
    gitstage::cli::print_usage(std::cerr);
    return 2;
  }
  const std::string name = argv[1];
  if (name == "help" || name == "--help" || name == "-h") {
    gitstage::cli::print_usage(std::cout);
    return 0;
  }

  const auto *cmd = gitstage::cli::find_command(name);
  if (!cmd) {
    std::cerr << "gitstage: '" << name << "' is not a command\n";
    gitstage::cli::print_usage(std::cerr);
    return 2;
  }
  // argv[0] of the handler is the command name
  return cmd->fn(argc - 1, argv + 1);
}

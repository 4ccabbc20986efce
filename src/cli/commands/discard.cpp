#include "cli/app.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace {
bool ask(const std::string &prompt) {
  std::cerr << prompt << " [y/N] ";
  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;
  return answer == "y" || answer == "Y" || answer == "yes";
}
} // namespace

int cmd_discard(int argc, char **argv) {
  gitstage::cli::Options opts;
  gitstage::cli::LineRange range;
  try {
    opts = gitstage::cli::parse_options(argc, argv);
    if (opts.args.size() != 1)
      throw std::invalid_argument("expected one line range");
    range = gitstage::cli::parse_range(opts.args[0]);
  } catch (const std::invalid_argument &e) {
    std::cerr << "discard: " << e.what() << "\n";
    std::cerr << "usage: gitstage discard <from>[:<to>] [--partial] [--yes] [--unfold]\n";
    return 2;
  }

  try {
    gitstage::cli::App app;
    auto &buffer = app.open(opts);
    const bool yes = opts.yes;
    const bool done = buffer.discard(range.first, range.last, opts.partial,
                                     [yes](const std::string &prompt) { return yes || ask(prompt); });
    if (!done) {
      std::cerr << "discard: nothing discarded\n";
      return 1;
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "discard: " << e.what() << "\n";
    return 1;
  }
}

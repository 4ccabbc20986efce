#include "cli/app.hpp"

#include <iostream>
#include <stdexcept>

using Kind = gitstage::GotoTarget::Kind;

int cmd_goto(int argc, char **argv) {
  gitstage::cli::Options opts;
  gitstage::cli::LineRange range;
  try {
    opts = gitstage::cli::parse_options(argc, argv);
    if (opts.args.size() != 1)
      throw std::invalid_argument("expected a line number");
    range = gitstage::cli::parse_range(opts.args[0]);
  } catch (const std::invalid_argument &e) {
    std::cerr << "goto: " << e.what() << "\n";
    std::cerr << "usage: gitstage goto <line> [--unfold]\n";
    return 2;
  }

  try {
    gitstage::cli::App app;
    auto &buffer = app.open(opts);
    const auto target = buffer.goto_file(range.first, 0);
    switch (target.kind) {
    case Kind::File:
      std::cout << target.path.string();
      if (target.row)
        std::cout << ":" << *target.row;
      std::cout << "\n";
      return 0;
    case Kind::Submodule:
      std::cout << "submodule " << target.path.string() << "\n";
      return 0;
    case Kind::Revision:
      std::cout << "show " << target.revision << "\n";
      return 0;
    case Kind::None:
      break;
    }
    std::cerr << "goto: nothing to open at line " << range.first << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "goto: " << e.what() << "\n";
    return 1;
  }
}

#include "cli/app.hpp"

#include <iostream>
#include <stdexcept>

int cmd_select(int argc, char **argv) {
  gitstage::cli::Options opts;
  gitstage::cli::LineRange range;
  try {
    opts = gitstage::cli::parse_options(argc, argv);
    if (opts.args.size() != 1)
      throw std::invalid_argument("expected one line range");
    range = gitstage::cli::parse_range(opts.args[0]);
  } catch (const std::invalid_argument &e) {
    std::cerr << "select: " << e.what() << "\n";
    std::cerr << "usage: gitstage select <from>[:<to>] [--unfold]\n";
    return 2;
  }

  try {
    gitstage::cli::App app;
    auto &buffer = app.open(opts);
    std::cout << buffer.describe_selection(range.first, range.last);
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "select: " << e.what() << "\n";
    return 1;
  }
}

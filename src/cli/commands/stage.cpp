#include "cli/app.hpp"

#include <iostream>
#include <stdexcept>

int cmd_stage(int argc, char **argv) {
  gitstage::cli::Options opts;
  gitstage::cli::LineRange range;
  try {
    opts = gitstage::cli::parse_options(argc, argv);
    if (opts.args.size() != 1)
      throw std::invalid_argument("expected one line range");
    range = gitstage::cli::parse_range(opts.args[0]);
  } catch (const std::invalid_argument &e) {
    std::cerr << "stage: " << e.what() << "\n";
    std::cerr << "usage: gitstage stage <from>[:<to>] [--partial] [--unfold]\n";
    return 2;
  }

  try {
    gitstage::cli::App app;
    auto &buffer = app.open(opts);
    if (!buffer.stage(range.first, range.last, opts.partial)) {
      std::cerr << "stage: nothing to stage at lines " << range.first << ":" << range.last << "\n";
      return 1;
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "stage: " << e.what() << "\n";
    return 1;
  }
}

#include "cli/app.hpp"

#include "gitstage/builder.hpp"

#include <iostream>
#include <stdexcept>

namespace {
const char *gutter(gitstage::FoldSign sign) {
  switch (sign) {
  case gitstage::FoldSign::Open:
    return "v ";
  case gitstage::FoldSign::Closed:
    return "> ";
  case gitstage::FoldSign::None:
    break;
  }
  return "  ";
}
} // namespace

int cmd_status(int argc, char **argv) {
  gitstage::cli::Options opts;
  try {
    opts = gitstage::cli::parse_options(argc, argv);
  } catch (const std::invalid_argument &e) {
    std::cerr << "status: " << e.what() << "\n";
    std::cerr << "usage: gitstage status [--signs] [--unfold]\n";
    return 2;
  }

  try {
    gitstage::cli::App app;
    auto &buffer = app.open(opts);

    const auto view = buffer.view();
    const bool signs = opts.signs && !buffer.coordinator().config().disable_signs;
    const auto &buf = view->buffer;
    for (std::size_t i = 0; i < buf.lines.size(); ++i) {
      if (signs)
        std::cout << gutter(buf.info[i].sign);
      std::cout << buf.lines[i] << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "status: " << e.what() << "\n";
    return 1;
  }
}

#include "cli/app.hpp"

#include "gitstage/consts.hpp"
#include "gitstage/log.hpp"

#include <charconv>
#include <stdexcept>

namespace stdfs = std::filesystem;

namespace gitstage::cli {

namespace {
int parse_line(std::string_view s) {
  int v = 0;
  const auto *end = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(s.data(), end, v);
  if (ec != std::errc() || ptr != end || v < 1)
    throw std::invalid_argument("bad line number: " + std::string(s));
  return v;
}
} // namespace

Options parse_options(int argc, char **argv) {
  Options o;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    if (a == "--partial") {
      o.partial = true;
    } else if (a == "--yes" || a == "-y") {
      o.yes = true;
    } else if (a == "--signs") {
      o.signs = true;
    } else if (a == "--unfold") {
      o.unfold = true;
    } else if (a == "--config") {
      if (i + 1 >= argc)
        throw std::invalid_argument("--config needs a file");
      o.config = argv[++i];
    } else if (a.starts_with("--")) {
      throw std::invalid_argument("unknown option: " + std::string(a));
    } else {
      o.args.emplace_back(a);
    }
  }
  return o;
}

LineRange parse_range(std::string_view text) {
  const auto colon = text.find(':');
  if (colon == std::string_view::npos) {
    const int line = parse_line(text);
    return LineRange{.first = line, .last = line};
  }
  return LineRange{.first = parse_line(text.substr(0, colon)),
                   .last = parse_line(text.substr(colon + 1))};
}

StatusBuffer &App::open(const Options &opts) {
  const stdfs::path root = find_repository_root(stdfs::current_path());
  const stdfs::path config_path =
      opts.config ? *opts.config : root / ".git" / std::string(consts::kConfigFile);

  RenderConfig cfg = load_render_config(config_path);
  log::set_level(cfg.log_level);
  StatusBuffer &buffer = buffers_.create(root, std::move(cfg));
  if (opts.unfold)
    buffer.set_folds(4);
  return buffer;
}

} // namespace gitstage::cli

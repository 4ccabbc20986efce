#include "gitstage/config.hpp"

#include "gitstage/consts.hpp"
#include "gitstage/fs.hpp"
#include "gitstage/log.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

bool parse_bool(std::string_view key, std::string_view v) {
  if (v == "true" || v == "yes" || v == "1")
    return true;
  if (v == "false" || v == "no" || v == "0")
    return false;
  throw gitstage::ConfigError("expected a boolean for " + std::string(key) + ", got '" +
                              std::string(v) + "'");
}

int parse_int(std::string_view key, std::string_view v) {
  int out = 0;
  auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
  if (ec != std::errc{} || p != v.data() + v.size())
    throw gitstage::ConfigError("expected an integer for " + std::string(key) + ", got '" +
                                std::string(v) + "'");
  return out;
}

std::vector<std::string> split_words(std::string_view v) {
  std::vector<std::string> out;
  std::istringstream iss{std::string(v)};
  std::string w;
  while (iss >> w)
    out.push_back(w);
  return out;
}

} // namespace

namespace gitstage {

SectionConfig RenderConfig::section(std::string_view key) const {
  const auto it = sections.find(key);
  return it == sections.end() ? SectionConfig{} : it->second;
}

std::vector<std::string> RenderConfig::keys_for(std::string_view action) const {
  const auto it = mappings.find(action);
  return it == mappings.end() ? std::vector<std::string>{} : it->second;
}

RenderConfig default_render_config() {
  RenderConfig cfg;
  cfg.sections[std::string(consts::kRebase)] = SectionConfig{.hidden = false, .folded = true};
  cfg.sections[std::string(consts::kStashes)] = SectionConfig{.hidden = false, .folded = true};
  cfg.sections[std::string(consts::kUnpulledUpstream)] =
      SectionConfig{.hidden = false, .folded = true};
  cfg.sections[std::string(consts::kUnpulledPushRemote)] =
      SectionConfig{.hidden = false, .folded = true};
  cfg.sections[std::string(consts::kRecent)] = SectionConfig{.hidden = false, .folded = true};

  cfg.mappings["Toggle"] = {"<tab>"};
  cfg.mappings["Stage"] = {"s"};
  cfg.mappings["Unstage"] = {"u"};
  cfg.mappings["Discard"] = {"x"};
  cfg.mappings["CommitPopup"] = {"c"};
  cfg.mappings["HelpPopup"] = {"?"};
  return cfg;
}

void apply_config_value(RenderConfig &cfg, std::string_view key, std::string_view value) {
  constexpr std::string_view k_sections = "sections.";
  constexpr std::string_view k_mappings = "mappings.";

  if (key == "disable_hint") {
    cfg.disable_hint = parse_bool(key, value);
  } else if (key == "disable_signs") {
    cfg.disable_signs = parse_bool(key, value);
  } else if (key == "auto_refresh") {
    cfg.auto_refresh = parse_bool(key, value);
  } else if (key == "fold_items") {
    cfg.fold_items = parse_bool(key, value);
  } else if (key == "columns") {
    cfg.columns = parse_int(key, value);
  } else if (key == "log_level") {
    cfg.log_level = std::string(value);
  } else if (key.starts_with(k_sections)) {
    std::string_view rest = key.substr(k_sections.size());
    const auto dot = rest.rfind('.');
    if (dot == std::string_view::npos || dot == 0)
      throw ConfigError("expected sections.<name>.<hidden|folded>, got " + std::string(key));
    auto &sc = cfg.sections[std::string(rest.substr(0, dot))];
    const std::string_view field = rest.substr(dot + 1);
    if (field == "hidden")
      sc.hidden = parse_bool(key, value);
    else if (field == "folded")
      sc.folded = parse_bool(key, value);
    else
      throw ConfigError("unknown section option: " + std::string(key));
  } else if (key.starts_with(k_mappings)) {
    cfg.mappings[std::string(key.substr(k_mappings.size()))] = split_words(value);
  } else {
    log::category("config")->warn("ignoring unknown config key '{}'", key);
  }
}

auto load_render_config(const std::filesystem::path &path) -> RenderConfig {
  RenderConfig out = default_render_config();
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));
  std::string line;
  int lineno = 0;
  while (std::getline(iss, line)) {
    ++lineno;
    std::string_view sv{line};
    if (trim(sv).empty() || trim(sv)[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      throw ConfigError(path.string() + ":" + std::to_string(lineno) + ": expected 'key: value'");
    apply_config_value(out, trim(sv.substr(0, colon)), trim(sv.substr(colon + 1)));
  }
  log::category("config")->debug("loaded {}", path.string());
  return out;
}

} // namespace gitstage

#include "gitstage/config.hpp"
#include "gitstage/fs.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitstage_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const auto defaults = gitstage::load_render_config(root / "missing.conf");
    if (defaults.disable_hint || !defaults.auto_refresh || !defaults.fold_items || defaults.columns != 120) {
      std::cerr << "defaults\n";
      return 1;
    }
    if (!defaults.section("stashes").folded || !defaults.section("recent").folded ||
        defaults.section("unstaged").folded || defaults.section("unstaged").hidden) {
      std::cerr << "default section folds\n";
      return 1;
    }
    if (defaults.keys_for("Stage") != std::vector<std::string>{"s"} || !defaults.keys_for("Nope").empty()) {
      std::cerr << "default mappings\n";
      return 1;
    }

    write_file(root / "gitstage.conf", "# status buffer\n"
                                       "disable_hint: true\n"
                                       "columns: 80\n"
                                       "\n"
                                       "sections.stashes.folded: false\n"
                                       "sections.untracked.hidden: yes\n"
                                       "mappings.Stage: s S\n"
                                       "log_level: debug\n"
                                       "no_such_key: 1\n");
    const auto cfg = gitstage::load_render_config(root / "gitstage.conf");
    if (!cfg.disable_hint || cfg.columns != 80 || cfg.log_level != "debug") { std::cerr << "scalar keys\n"; return 1; }
    if (cfg.section("stashes").folded || !cfg.section("untracked").hidden || !cfg.section("recent").folded) {
      std::cerr << "section keys\n";
      return 1;
    }
    if (cfg.keys_for("Stage") != std::vector<std::string>{"s", "S"}) { std::cerr << "mappings\n"; return 1; }

    write_file(root / "bad.conf", "auto_refresh: maybe\n");
    bool threw = false;
    try {
      gitstage::load_render_config(root / "bad.conf");
    } catch (const gitstage::ConfigError &) {
      threw = true;
    }
    if (!threw) { std::cerr << "bad boolean accepted\n"; return 1; }

    write_file(root / "nocolon.conf", "columns 80\n");
    threw = false;
    try {
      gitstage::load_render_config(root / "nocolon.conf");
    } catch (const gitstage::ConfigError &) {
      threw = true;
    }
    if (!threw) { std::cerr << "line without separator accepted\n"; return 1; }

    // Sequencer state files: trailing newlines trimmed, missing files are empty.
    write_file(root / "ORIG_HEAD", "abc1234\r\n");
    if (gitstage::fs::read_state_file(root / "ORIG_HEAD") != "abc1234") { std::cerr << "read_state_file\n"; return 1; }
    if (gitstage::fs::read_state_file(root / "MISSING")) { std::cerr << "missing state file\n"; return 1; }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }
  fs::remove_all(root);
  return 0;
}

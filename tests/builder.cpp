#include "gitstage/builder.hpp"

#include "gitstage/consts.hpp"
#include "sample_repo.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitstage::FoldSign;
using gitstage::LineTag;

int main() {
  const auto snap = sample_snapshot();
  const auto cfg = sample_config();
  const auto res = gitstage::build_status({}, snap, cfg);
  const auto &buf = res.buffer;

  const std::vector<std::string> expected = {
      "Hint: [<tab>] toggle diff | [s] stage | [u] unstage | [x] discard | [c] commit | [?] help",
      "",
      "Head:     abc1234 main initial",
      "",
      "Untracked files (1)",
      "new.txt",
      "",
      "Unstaged changes (1)",
      "Modified       a.txt",
      "@@ -1,3 +1,3 @@",
      " one",
      "-two",
      "+TWO",
      " three",
      "@@ -10,2 +10,3 @@",
      " ten",
      "+ten and a half",
      " eleven",
      "",
      "Staged changes (1)",
      "Added          b.txt",
      "@@ -0,0 +1,5 @@",
      "+l1",
      "+l2",
      "+l3",
      "+l4",
      "+l5",
      "",
      "Stashes (1)",
      "Recent commits (1)",
  };
  if (buf.lines != expected) {
    std::cerr << "unexpected buffer:\n";
    for (const auto &l : buf.lines)
      std::cerr << "|" << l << "\n";
    return 1;
  }
  if (buf.info.size() != buf.lines.size()) { std::cerr << "info not parallel to lines\n"; return 1; }

  // Tags and fold signs
  if (buf.info[0].tag != LineTag::Hint || buf.info[2].tag != LineTag::HeaderRow) { std::cerr << "header tags\n"; return 1; }
  if (buf.info[2].sign != FoldSign::None) { std::cerr << "header row must not carry a sign\n"; return 1; }
  if (buf.info[7].tag != LineTag::SectionHeader || buf.info[7].sign != FoldSign::Open) { std::cerr << "section tag\n"; return 1; }
  if (buf.info[5].sign != FoldSign::None) { std::cerr << "item without hunks must not carry a sign\n"; return 1; }
  if (buf.info[8].tag != LineTag::Item || buf.info[8].sign != FoldSign::Open) { std::cerr << "item tag\n"; return 1; }
  if (buf.info[9].tag != LineTag::HunkHeader || buf.info[11].tag != LineTag::Delete ||
      buf.info[12].tag != LineTag::Add || buf.info[10].tag != LineTag::Context) {
    std::cerr << "hunk tags\n";
    return 1;
  }
  if (buf.info[28].sign != FoldSign::Closed) { std::cerr << "folded section sign\n"; return 1; }

  // Ranges strictly nest and advance.
  const auto &tree = res.tree;
  const auto *unstaged = tree.find_section(gitstage::consts::kUnstaged);
  if (!unstaged || unstaged->first != 8 || unstaged->last != 18) { std::cerr << "unstaged range\n"; return 1; }
  const auto &a = unstaged->items.at(0);
  if (a.first != 9 || a.last != 18) { std::cerr << "item range\n"; return 1; }
  if (a.hunks.size() != 2 || a.hunks[0].first != 10 || a.hunks[0].last != 14 || a.hunks[1].first != 15 ||
      a.hunks[1].last != 18) {
    std::cerr << "hunk ranges\n";
    return 1;
  }
  int previous_last = 0;
  for (const auto &s : tree.sections) {
    if (s.first <= previous_last || s.last < s.first) { std::cerr << "sections overlap: " << s.name << "\n"; return 1; }
    previous_last = s.last;
    for (const auto &i : s.items) {
      if (i.rendered() && (i.first < s.first || i.last > s.last)) { std::cerr << "item escapes section\n"; return 1; }
      for (const auto &h : i.hunks)
        if (h.rendered() && (h.first < i.first || h.last > i.last)) { std::cerr << "hunk escapes item\n"; return 1; }
    }
  }

  // Folded sections keep their items without line ranges.
  const auto *stashes = tree.find_section(gitstage::consts::kStashes);
  if (!stashes || !stashes->folded || stashes->first != 29 || stashes->last != 29 ||
      stashes->items.size() != 1 || stashes->items[0].rendered()) {
    std::cerr << "folded stashes\n";
    return 1;
  }
  if (tree.find_section(gitstage::consts::kHeadHeader)->kind != gitstage::SectionKind::Header ||
      unstaged->kind != gitstage::SectionKind::DiffBearing ||
      stashes->kind != gitstage::SectionKind::CommitBearing) {
    std::cerr << "section kinds\n";
    return 1;
  }

  // Deterministic
  if (gitstage::build_status({}, snap, cfg).buffer.lines != buf.lines) { std::cerr << "not deterministic\n"; return 1; }

  // Hidden and empty sections disappear.
  {
    auto c = cfg;
    c.disable_hint = true;
    c.sections["untracked"].hidden = true;
    auto s = snap;
    s.stashes.items.clear();
    const auto r = gitstage::build_status({}, s, c);
    if (r.tree.find_section("untracked") || r.tree.find_section("stashes")) { std::cerr << "hidden/empty section rendered\n"; return 1; }
    if (r.buffer.lines[0] != "Head:     abc1234 main initial" || r.buffer.lines[2] != "Unstaged changes (1)") {
      std::cerr << "layout without hint\n";
      return 1;
    }
  }

  // Progress header, narrow columns, renames and submodules.
  {
    auto c = cfg;
    c.columns = 80;
    c.disable_hint = true;
    gitstage::RepositorySnapshot s;
    s.head.branch = "feature";
    s.rebase.head = "feature";
    s.rebase.items.current = 1;
    for (int i = 0; i < 3; ++i)
      s.rebase.items.items.push_back(commit_entry("000000" + std::to_string(i) + "000000000000000000000000000000000", "step"));
    s.unstaged.items.push_back(file_entry("a.txt", "M"));
    auto renamed = file_entry("new.txt", "R");
    renamed.original_name = "old.txt";
    s.staged.items.push_back(renamed);
    auto sub = file_entry("lib", "M");
    sub.submodule = gitstage::SubmoduleState{};
    s.staged.items.push_back(sub);

    const auto r = gitstage::build_status({}, s, c);
    const auto &l = r.buffer.lines;
    if (l[0] != "Head:     feature (no commits)") { std::cerr << "head without commits: " << l[0] << "\n"; return 1; }
    if (l[2] != "Rebasing: feature (1/3)") { std::cerr << "rebase progress: " << l[2] << "\n"; return 1; }
    if (l[3] != "Unstaged changes (1)" || l[4] != "Modified a.txt") { std::cerr << "narrow label: " << l[4] << "\n"; return 1; }
    if (l[7] != "Renamed old.txt -> new.txt") { std::cerr << "rename: " << l[7] << "\n"; return 1; }
    if (l[8] != "Modified lib (malformed submodule)") { std::cerr << "submodule: " << l[8] << "\n"; return 1; }
  }

  if (gitstage::format_mode(std::string("UU")) != "Both Modified" ||
      gitstage::format_mode(std::string("AU")) != "Added by us" ||
      gitstage::format_mode(std::string("XY")) != "XY" || !gitstage::format_mode(std::nullopt).empty()) {
    std::cerr << "format_mode\n";
    return 1;
  }
  if (gitstage::format_submodule_mode({.commit_changed = true, .has_tracked_changes = true,
                                       .has_untracked_changes = false}) != "(new commits, modified content)") {
    std::cerr << "format_submodule_mode\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

#include "gitstage/line_index.hpp"

#include "gitstage/builder.hpp"
#include "gitstage/consts.hpp"
#include "sample_repo.hpp"

#include <iostream>

int main() {
  const auto cfg = sample_config();
  const auto snap = sample_snapshot();
  const auto tree = gitstage::build_status({}, snap, cfg).tree;

  auto hit = gitstage::resolve(tree, 12);
  if (!hit.section || hit.section->name != "unstaged" || !hit.item || hit.item->name != "a.txt" ||
      hit.hunk != &hit.item->hunks[0]) {
    std::cerr << "resolve inside hunk\n";
    return 1;
  }
  hit = gitstage::resolve(tree, 9);
  if (!hit.item || hit.hunk) { std::cerr << "resolve on item line\n"; return 1; }
  hit = gitstage::resolve(tree, 3);
  if (!hit.section || hit.section->name != gitstage::consts::kHeadHeader || hit.item) { std::cerr << "resolve header row\n"; return 1; }
  hit = gitstage::resolve(tree, 7);
  if (hit.section) { std::cerr << "gap line resolved to a section\n"; return 1; }
  hit = gitstage::resolve(tree, 29);
  if (!hit.section || hit.item) { std::cerr << "folded section\n"; return 1; }
  if (gitstage::resolve(tree, 100).section || gitstage::resolve(tree, 0).section) { std::cerr << "out of range\n"; return 1; }

  // Every rendered line inside a hunk maps back to it.
  for (const auto &s : tree.sections)
    for (const auto &i : s.items)
      for (const auto &h : i.hunks)
        for (int line = h.first; h.rendered() && line <= h.last; ++line)
          if (gitstage::resolve(tree, line).hunk != &h) { std::cerr << "line " << line << " lost its hunk\n"; return 1; }

  const auto ctx = gitstage::context_range(tree, 12);
  if (!ctx || ctx->first != 10 || ctx->second != 14) { std::cerr << "context_range\n"; return 1; }
  if (gitstage::context_range(tree, 7)) { std::cerr << "context on gap line\n"; return 1; }

  const auto saved = gitstage::save_cursor_location(tree, 12);
  if (!saved.section || saved.section->key != "unstaged" || !saved.item || saved.item->key != "a.txt" || !saved.hunk ||
      saved.first != 10 || saved.last != 14) {
    std::cerr << "save_cursor_location\n";
    return 1;
  }

  // Same tree: back on the hunk header.
  if (gitstage::restore_cursor_location(tree, saved) != 10) { std::cerr << "restore same tree\n"; return 1; }

  // Hunk gone: fall back to its item.
  {
    auto s = snap;
    s.unstaged.items[0] = file_entry("a.txt", "M",
                                     "--- a/a.txt\n+++ b/a.txt\n@@ -1,3 +1,3 @@\n one\n-two\n+deux\n three\n");
    const auto t = gitstage::build_status(tree, s, cfg).tree;
    if (gitstage::restore_cursor_location(t, saved) != 9) { std::cerr << "missing hunk fallback\n"; return 1; }
  }
  // Item gone: fall back to the section.
  {
    auto s = snap;
    s.unstaged.items[0] = file_entry("c.txt", "M");
    const auto t = gitstage::build_status(tree, s, cfg).tree;
    if (gitstage::restore_cursor_location(t, saved) != 8) { std::cerr << "missing item fallback\n"; return 1; }
  }
  // Section gone: the section now at the same position.
  {
    auto s = snap;
    s.unstaged.items.clear();
    const auto t = gitstage::build_status(tree, s, cfg).tree;
    const int line = gitstage::restore_cursor_location(t, saved);
    if (line != t.find_section(gitstage::consts::kStaged)->first || line != 8) { std::cerr << "missing section fallback\n"; return 1; }
  }

  if (gitstage::restore_cursor_location(gitstage::StatusTree{}, saved) != 1) { std::cerr << "empty tree\n"; return 1; }
  if (gitstage::restore_cursor_location(tree, gitstage::CursorLocation{}) != 5) { std::cerr << "nothing saved\n"; return 1; }

  std::cout << "OK\n";
  return 0;
}

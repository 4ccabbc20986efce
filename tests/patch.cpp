#include "gitstage/patch.hpp"

#include "gitstage/builder.hpp"
#include "gitstage/consts.hpp"
#include "sample_repo.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using Lines = std::vector<std::string>;

// Applies a single-hunk patch the way `git apply` would, without fuzz.
static std::optional<Lines> apply_hunk(const Lines &file, const std::string &patch) {
  const auto lines = gitstage::diff::split_lines(patch);
  std::size_t at = 0;
  while (at < lines.size() && !lines[at].starts_with("@@"))
    ++at;
  if (at == lines.size())
    return std::nullopt;

  gitstage::DiffHunk h;
  gitstage::diff::parse_range_line(lines[at], h);
  std::size_t pos = h.index_len == 0 ? static_cast<std::size_t>(h.index_from)
                                     : static_cast<std::size_t>(h.index_from - 1);
  Lines out(file.begin(), file.begin() + static_cast<long>(std::min(pos, file.size())));
  int old_seen = 0;
  int new_seen = 0;
  for (std::size_t i = at + 1; i < lines.size(); ++i) {
    const std::string &l = lines[i];
    if (l.starts_with("\\"))
      continue;
    const std::string text = l.substr(1);
    if (l[0] == '+') {
      out.push_back(text);
      ++new_seen;
      continue;
    }
    if (pos >= file.size() || file[pos] != text)
      return std::nullopt;
    ++pos;
    ++old_seen;
    if (l[0] == ' ') {
      out.push_back(text);
      ++new_seen;
    }
  }
  if (old_seen != h.index_len || new_seen != h.disk_len)
    return std::nullopt;
  out.insert(out.end(), file.begin() + static_cast<long>(pos), file.end());
  return out;
}

int main() {
  const auto tree = gitstage::build_status({}, sample_snapshot(), sample_config()).tree;
  const auto &a = tree.find_section(gitstage::consts::kUnstaged)->items.at(0);
  const auto &b = tree.find_section(gitstage::consts::kStaged)->items.at(0);
  const auto &h0 = a.hunks[0];

  // Whole lines: every intersecting hunk is taken in full.
  auto hs = gitstage::hunks_in_range(a, 12, 12, false);
  if (hs.size() != 1 || hs[0].from != 1 || hs[0].to != 4 || hs[0].lines.size() != 4) { std::cerr << "whole hunk\n"; return 1; }
  hs = gitstage::hunks_in_range(a, 12, 16, false);
  if (hs.size() != 2) { std::cerr << "range over two hunks\n"; return 1; }
  hs = gitstage::hunks_in_range(a, 12, 13, true);
  if (hs.size() != 1 || hs[0].from != 2 || hs[0].to != 3 || hs[0].lines != Lines{"-two", "+TWO"}) {
    std::cerr << "partial range\n";
    return 1;
  }
  if (!gitstage::hunks_in_range(a, 9, 9, false).empty()) { std::cerr << "item line selects a hunk\n"; return 1; }
  {
    auto folded = a;
    folded.folded = true;
    if (!gitstage::hunks_in_range(folded, 12, 12, false).empty()) { std::cerr << "folded item\n"; return 1; }
    folded.folded = false;
    folded.hunks[0].folded = true;
    folded.hunks[0].last = folded.hunks[0].first;
    hs = gitstage::hunks_in_range(folded, 10, 10, true);
    if (hs.size() != 1 || hs[0].from != 1 || hs[0].to != 4) { std::cerr << "folded hunk in partial mode\n"; return 1; }
  }

  const Lines old_file = {"one", "two", "three"};
  const Lines new_file = {"one", "TWO", "three"};

  // Full hunk, forward.
  std::string p = gitstage::generate_patch(a, h0, 1, 4);
  const std::string full = "diff --git a/a.txt b/a.txt\n"
                           "--- a/a.txt\n"
                           "+++ b/a.txt\n"
                           "@@ -1,3 +1,3 @@\n"
                           " one\n"
                           "-two\n"
                           "+TWO\n"
                           " three\n";
  if (p != full) { std::cerr << "forward patch:\n" << p; return 1; }
  if (apply_hunk(old_file, p) != new_file) { std::cerr << "forward patch does not apply\n"; return 1; }

  // Only the addition: the unselected deletion stays as context.
  p = gitstage::generate_patch(a, h0, 3, 3);
  if (p.find("@@ -1,3 +1,4 @@\n one\n two\n+TWO\n three\n") == std::string::npos) { std::cerr << "partial forward:\n" << p; return 1; }
  const auto staged_once = apply_hunk(old_file, p);
  if (staged_once != Lines{"one", "two", "TWO", "three"}) { std::cerr << "partial forward does not apply\n"; return 1; }

  // Reverse of the whole hunk undoes it against the new side.
  p = gitstage::generate_patch(a, h0, 1, 4, true);
  if (p.find("@@ -1,3 +1,3 @@\n one\n+two\n-TWO\n three\n") == std::string::npos) { std::cerr << "reverse patch:\n" << p; return 1; }
  if (apply_hunk(new_file, p) != old_file) { std::cerr << "reverse patch does not apply\n"; return 1; }

  // Reverse of only the addition: the deletion is left alone.
  p = gitstage::generate_patch(a, h0, 3, 3, true);
  if (p.find("@@ -1,3 +1,2 @@\n one\n-TWO\n three\n") == std::string::npos) { std::cerr << "partial reverse:\n" << p; return 1; }
  if (apply_hunk(new_file, p) != Lines{"one", "three"}) { std::cerr << "partial reverse does not apply\n"; return 1; }

  // Forward then reverse of the same full selection is a no-op.
  const auto there = apply_hunk(old_file, gitstage::generate_patch(a, h0, 1, 4));
  const auto back = there ? apply_hunk(*there, gitstage::generate_patch(a, h0, 1, 4, true)) : std::nullopt;
  if (back != old_file) { std::cerr << "round trip\n"; return 1; }

  // Two lines out of a five-line new file.
  p = gitstage::generate_patch(b, b.hunks[0], 2, 3);
  const std::string two_of_five = "diff --git a/b.txt b/b.txt\n"
                                  "new file mode 100644\n"
                                  "--- /dev/null\n"
                                  "+++ b/b.txt\n"
                                  "@@ -0,0 +1,2 @@\n"
                                  "+l2\n"
                                  "+l3\n";
  if (p != two_of_five) { std::cerr << "new file subset:\n" << p; return 1; }
  if (apply_hunk({}, p) != Lines{"l2", "l3"}) { std::cerr << "new file subset does not apply\n"; return 1; }

  // Undoing all of a created file deletes it.
  p = gitstage::generate_patch(b, b.hunks[0], 1, 5, true);
  if (p.find("deleted file mode 100644\n--- a/b.txt\n+++ /dev/null\n@@ -1,5 +0,0 @@\n-l1\n") == std::string::npos) {
    std::cerr << "undo created file:\n" << p;
    return 1;
  }

  // A newline marker follows the line it belongs to.
  {
    gitstage::Item item;
    item.name = "x";
    item.diff = gitstage::diff::parse_diff(
        "--- a/x\n+++ b/x\n@@ -1 +1 @@\n-a\n\\ No newline at end of file\n+b\n\\ No newline at end of file\n");
    gitstage::Hunk h;
    const auto &dh = item.diff->hunks[0];
    h.diff_from = dh.diff_from;
    h.diff_to = dh.diff_to;
    h.index_from = dh.index_from;
    h.index_len = dh.index_len;
    h.disk_from = dh.disk_from;
    h.disk_len = dh.disk_len;
    p = gitstage::generate_patch(item, h, 3, 3, true);
    if (p.find("@@ -1,1 +0,0 @@\n-b\n\\ No newline at end of file\n") == std::string::npos || p.find("-a") != std::string::npos) {
      std::cerr << "newline marker:\n" << p;
      return 1;
    }
  }

  // Adding after a last line that had no newline gives that line its newline back.
  {
    gitstage::Item item;
    item.name = "x";
    item.diff = gitstage::diff::parse_diff("--- a/x\n+++ b/x\n@@ -1 +1,2 @@\n-a\n\\ No newline at end of file\n"
                                           "+a\n+b\n\\ No newline at end of file\n");
    gitstage::Hunk h;
    const auto &dh = item.diff->hunks[0];
    h.diff_from = dh.diff_from;
    h.diff_to = dh.diff_to;
    h.index_from = dh.index_from;
    h.index_len = dh.index_len;
    h.disk_from = dh.disk_from;
    h.disk_len = dh.disk_len;
    p = gitstage::generate_patch(item, h, 4, 4);
    const std::string expected = "@@ -1,1 +1,2 @@\n-a\n\\ No newline at end of file\n+a\n+b\n"
                                 "\\ No newline at end of file\n";
    if (p.find(expected) == std::string::npos) { std::cerr << "append after missing newline:\n" << p; return 1; }
  }

  bool threw = false;
  try {
    gitstage::Item empty;
    gitstage::generate_patch(empty, h0, 1, 2);
  } catch (const gitstage::PatchError &) {
    threw = true;
  }
  if (!threw) { std::cerr << "patch without a diff\n"; return 1; }

  std::cout << "OK\n";
  return 0;
}

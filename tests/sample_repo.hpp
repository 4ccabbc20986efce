#pragma once
#include "gitstage/config.hpp"
#include "gitstage/diff.hpp"
#include "gitstage/snapshot.hpp"

#include <string>
#include <string_view>

// Modified file with two hunks.
inline constexpr std::string_view kModifiedDiff = "diff --git a/a.txt b/a.txt\n"
                                                  "index 1111111..2222222 100644\n"
                                                  "--- a/a.txt\n"
                                                  "+++ b/a.txt\n"
                                                  "@@ -1,3 +1,3 @@\n"
                                                  " one\n"
                                                  "-two\n"
                                                  "+TWO\n"
                                                  " three\n"
                                                  "@@ -10,2 +10,3 @@\n"
                                                  " ten\n"
                                                  "+ten and a half\n"
                                                  " eleven\n";

// New file of five lines.
inline constexpr std::string_view kNewFileDiff = "diff --git a/b.txt b/b.txt\n"
                                                 "new file mode 100644\n"
                                                 "index 0000000..3333333\n"
                                                 "--- /dev/null\n"
                                                 "+++ b/b.txt\n"
                                                 "@@ -0,0 +1,5 @@\n"
                                                 "+l1\n"
                                                 "+l2\n"
                                                 "+l3\n"
                                                 "+l4\n"
                                                 "+l5\n";

inline gitstage::StatusEntry file_entry(std::string name, std::string mode,
                                        std::string_view diff_text = {}) {
  gitstage::StatusEntry e;
  e.name = std::move(name);
  if (!mode.empty())
    e.mode = std::move(mode);
  e.absolute_path = "/repo/" + e.name;
  if (!diff_text.empty()) {
    e.diff = gitstage::diff::parse_diff(diff_text);
    e.has_diff = true;
  }
  return e;
}

inline gitstage::StatusEntry commit_entry(const std::string &oid, const std::string &subject) {
  gitstage::StatusEntry e;
  const std::string abbrev = oid.substr(0, 7);
  e.name = abbrev + " " + subject;
  e.oid = oid;
  e.commit = gitstage::CommitEntry{.oid = oid, .abbrev = abbrev, .subject = subject};
  return e;
}

/*
 * Rendered with sample_config():
 *
 *   1 Hint: ...            16 " ten"
 *   2                      17 "+ten and a half"
 *   3 Head: ...            18 " eleven"
 *   4                      19
 *   5 Untracked files (1)  20 Staged changes (1)
 *   6 new.txt              21 Added b.txt
 *   7                      22 @@ -0,0 +1,5 @@
 *   8 Unstaged changes (1) 23..27 +l1..+l5
 *   9 Modified a.txt       28
 *  10 @@ -1,3 +1,3 @@      29 Stashes (1)         (folded)
 *  11..14 hunk body        30 Recent commits (1)  (folded)
 *  15 @@ -10,2 +10,3 @@
 */
inline gitstage::RepositorySnapshot sample_snapshot() {
  gitstage::RepositorySnapshot s;
  s.root = "/repo";
  s.head.branch = "main";
  s.head.oid = "abc1234000000000000000000000000000000000";
  s.head.abbrev = "abc1234";
  s.head.commit_message = "initial";

  s.untracked.items.push_back(file_entry("new.txt", ""));
  s.unstaged.items.push_back(file_entry("a.txt", "M", kModifiedDiff));
  s.staged.items.push_back(file_entry("b.txt", "A", kNewFileDiff));

  gitstage::StatusEntry stash;
  stash.name = "stash@{0} WIP on main";
  stash.oid = "5555555000000000000000000000000000000000";
  s.stashes.items.push_back(stash);

  s.recent.items.push_back(commit_entry("abc1234000000000000000000000000000000000", "initial"));
  return s;
}

inline gitstage::RenderConfig sample_config() {
  auto cfg = gitstage::default_render_config();
  cfg.fold_items = false;
  return cfg;
}

#pragma once
#include "gitstage/diff.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gitstage {

struct CommitEntry {
  std::string oid;    // full 40-hex id
  std::string abbrev; // short id as printed by git
  std::string subject;
};

struct SubmoduleState {
  bool commit_changed{false};
  bool has_tracked_changes{false};
  bool has_untracked_changes{false};
};

// One row of a section: a changed file, or a commit/stash for log-like sections.
struct StatusEntry {
  std::string name;                         // repo-relative path, or "<abbrev> <subject>"
  std::optional<std::string> mode;          // porcelain code, e.g. "M", "A", "UU"
  std::optional<std::string> original_name; // rename/copy source
  std::optional<SubmoduleState> submodule;
  bool has_diff{false};
  std::optional<Diff> diff;
  std::optional<std::string> oid;
  std::optional<CommitEntry> commit;
  std::filesystem::path absolute_path;
  bool done{false}; // applied rebase step
};

struct SectionData {
  std::vector<StatusEntry> items;
  std::optional<int> current; // position for progress-like sections ("3/7")
};

struct TagInfo {
  std::optional<std::string> name;
  int distance{0};
};

struct HeadInfo {
  std::string branch;
  std::string oid;
  std::string abbrev;
  std::optional<std::string> commit_message;
  bool detached{false};
  TagInfo tag;
};

struct UpstreamInfo {
  std::optional<std::string> ref; // "origin/main"
  std::string branch;             // "main"
  std::string oid;
  std::string abbrev;
  std::optional<std::string> commit_message;
  SectionData unpulled;
  SectionData unmerged;
};

struct PushRemoteInfo {
  std::optional<std::string> ref;
  std::string abbrev;
  std::optional<std::string> commit_message;
  SectionData unpulled;
  SectionData unmerged;
};

struct RebaseInfo {
  std::optional<std::string> head;
  SectionData items;
};

struct SequencerInfo {
  std::optional<std::string> head; // REVERT_HEAD | CHERRY_PICK_HEAD
  SectionData items;
};

// Everything the git layer reports for one refresh.
struct RepositorySnapshot {
  std::filesystem::path root;
  HeadInfo head;
  UpstreamInfo upstream;
  PushRemoteInfo push_remote;
  RebaseInfo rebase;
  SequencerInfo sequencer;
  SectionData untracked;
  SectionData unstaged;
  SectionData staged;
  SectionData stashes;
  SectionData recent;
};

} // namespace gitstage

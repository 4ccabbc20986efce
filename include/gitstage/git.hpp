#pragma once
#include "gitstage/snapshot.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace gitstage {

struct ApplyFlags {
  bool cached{false};  // --cached: index only
  bool reverse{false}; // --reverse
  bool index{false};   // --index: index and worktree
};

class GitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Repository I/O the status buffer depends on. Every call may block.
class GitBackend {
public:
  virtual ~GitBackend() = default;

  [[nodiscard]] virtual const std::filesystem::path &root() const = 0;

  virtual RepositorySnapshot load_snapshot() = 0;

  // Pipe a patch into `git apply`.
  virtual void apply(const std::string &patch, const ApplyFlags &flags) = 0;

  // Whole-file operations.
  virtual void stage(const std::vector<std::string> &files) = 0;
  virtual void unstage(const std::vector<std::string> &files) = 0;
  virtual void add(const std::vector<std::string> &files) = 0;
  virtual void checkout(const std::vector<std::string> &files) = 0;
  virtual void reset(const std::vector<std::string> &files) = 0;
  virtual void remove_untracked(const std::string &file) = 0;

  virtual void stage_modified() = 0;
  virtual void stage_all() = 0;
  virtual void unstage_all() = 0;
};

// Backend that runs the `git` executable inside `root`.
std::unique_ptr<GitBackend> make_git_cli(std::filesystem::path root);

// Walk up from `start` to the directory holding `.git`. Throws GitError.
std::filesystem::path find_repository_root(const std::filesystem::path &start);

} // namespace gitstage

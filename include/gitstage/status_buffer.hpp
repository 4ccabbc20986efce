#pragma once
#include "gitstage/config.hpp"
#include "gitstage/git.hpp"
#include "gitstage/refresh.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace gitstage {

// Where "go to file" leads from a line of the status buffer.
struct GotoTarget {
  enum class Kind : std::uint8_t { None, File, Submodule, Revision };

  Kind kind{Kind::None};
  std::filesystem::path path; // File, Submodule
  std::optional<int> row;     // File: 1-based line, when the cursor was inside a hunk
  int column{0};
  std::string revision; // Revision: commit, stash or ref to show
};

// Asked before a destructive command runs; false cancels it.
using ConfirmFn = std::function<bool(const std::string &prompt)>;

/**
 * One repository's status buffer: the rendered tree, the cursor and the
 * commands that act on line ranges of it.
 *
 * Mutating commands refresh afterwards. When a change fails the exception
 * is rethrown once the refresh has run.
 */
class StatusBuffer {
public:
  StatusBuffer(std::unique_ptr<GitBackend> git, RenderConfig config, RefreshOptions options = {});

  StatusBuffer(const StatusBuffer &) = delete;
  StatusBuffer &operator=(const StatusBuffer &) = delete;

  [[nodiscard]] const std::filesystem::path &root() const { return git_->root(); }
  [[nodiscard]] std::shared_ptr<const StatusView> view() const { return refresh_.view(); }
  [[nodiscard]] RefreshCoordinator &coordinator() { return refresh_; }

  [[nodiscard]] int cursor() const { return refresh_.cursor(); }
  void set_cursor(int line) { refresh_.set_cursor(line); }

  bool refresh(const std::string &reason) { return refresh_.refresh(reason); }
  bool dispatch_refresh(const std::string &reason) { return refresh_.dispatch_refresh(reason); }

  // Drop the tree; refreshes again when auto_refresh is on.
  void reset();

  // Flip the fold of the hunks under the range, else the focal item, else the section.
  void toggle(int first, int last);

  // 1: sections folded, 2: files folded, 3: hunks folded, 4: everything open.
  void set_folds(int depth);

  // Both return false when the range holds nothing they can act on.
  bool stage(int first, int last, bool partial);
  bool unstage(int first, int last, bool partial);

  // Returns false when nothing was selected or the prompt was declined.
  bool discard(int first, int last, bool partial, const ConfirmFn &confirm);

  void stage_modified();
  void stage_all();
  void unstage_all();

  [[nodiscard]] GotoTarget goto_file(int line, int column) const;

  // Object id, file name or ref under the range.
  [[nodiscard]] std::optional<std::string> yank(int first, int last) const;

  [[nodiscard]] std::optional<int> next_hunk_header(int line) const;
  [[nodiscard]] std::optional<int> previous_hunk_header(int line) const;

  // Selection::format() of the range against the current view.
  [[nodiscard]] std::string describe_selection(int first, int last) const;

private:
  void mutate(const std::string &reason, const std::function<void()> &fn);

  std::unique_ptr<GitBackend> git_;
  RefreshCoordinator refresh_;
};

} // namespace gitstage

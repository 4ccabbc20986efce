#pragma once
#include "gitstage/builder.hpp"
#include "gitstage/config.hpp"
#include "gitstage/consts.hpp"
#include "gitstage/git.hpp"
#include "gitstage/line_index.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace gitstage {

class RefreshLock;

// Move-only guard for the refresh slot. Releasing twice, or after the
// watchdog already took the slot back, is a no-op.
class Permit {
public:
  Permit(Permit &&other) noexcept;
  Permit &operator=(Permit &&other) noexcept;
  Permit(const Permit &) = delete;
  Permit &operator=(const Permit &) = delete;
  ~Permit();

  void release();

private:
  friend class RefreshLock;
  Permit(RefreshLock *lock, std::uint64_t ticket) : lock_(lock), ticket_(ticket) {}

  RefreshLock *lock_{nullptr};
  std::uint64_t ticket_{0};
};

// Counting permit capped at 1, with a watchdog that force-releases a permit
// still held after `watchdog` has elapsed.
class RefreshLock {
public:
  explicit RefreshLock(std::chrono::milliseconds watchdog = consts::kRefreshWatchdog);
  ~RefreshLock();

  RefreshLock(const RefreshLock &) = delete;
  RefreshLock &operator=(const RefreshLock &) = delete;

  // std::nullopt when the slot is taken; never blocks.
  std::optional<Permit> try_acquire(const std::string &reason);

  [[nodiscard]] bool is_locked() const;
  [[nodiscard]] int permits() const;

private:
  friend class Permit;
  void release(std::uint64_t ticket);
  void watch(std::uint64_t ticket, std::string reason);

  const std::chrono::milliseconds timeout_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int permits_{1};
  std::uint64_t ticket_{0};
  bool stopping_{false};

  std::mutex watchdog_mutex_;
  std::thread watchdog_;
};

// A completed build, shared with readers. Never mutated once published.
struct StatusView {
  StatusTree tree;
  RenderedBuffer buffer;
};

struct RefreshOptions {
  std::chrono::milliseconds watchdog{consts::kRefreshWatchdog};
};

/**
 * Serializes rebuilds of one repository's status tree.
 *
 * A refresh snapshots the cursor as a key path, loads repository data, builds
 * against the previous tree, publishes the result and puts the cursor back.
 * A request arriving while a refresh holds the permit is dropped.
 */
class RefreshCoordinator {
public:
  RefreshCoordinator(GitBackend &git, RenderConfig config, RefreshOptions options = {});
  ~RefreshCoordinator();

  RefreshCoordinator(const RefreshCoordinator &) = delete;
  RefreshCoordinator &operator=(const RefreshCoordinator &) = delete;

  // Start a refresh on a background task. false if it was dropped.
  bool dispatch_refresh(const std::string &reason);

  // Refresh on the calling thread. false if it was dropped.
  bool refresh(const std::string &reason);

  // Re-render from the last loaded snapshot, e.g. after a fold change.
  void redraw();

  // Replace fold state through `edit` on a copy of the tree, then redraw.
  void edit_folds(const std::function<void(StatusTree &)> &edit);

  // Forget the tree and the cached repository data.
  void reset();

  // Wait for background refreshes started so far.
  void wait_idle();

  [[nodiscard]] std::shared_ptr<const StatusView> view() const;
  [[nodiscard]] bool is_refreshing() const { return lock_.is_locked(); }
  [[nodiscard]] int permits() const { return lock_.permits(); }

  [[nodiscard]] int cursor() const;
  void set_cursor(int line);

  [[nodiscard]] const RenderConfig &config() const { return config_; }

private:
  void run_cycle(Permit permit, const std::string &reason);
  void publish(BuildResult result, const std::optional<CursorLocation> &restore);

  GitBackend &git_;
  const RenderConfig config_;
  RefreshLock lock_;

  mutable std::mutex view_mutex_;
  std::shared_ptr<const StatusView> view_;
  std::shared_ptr<const RepositorySnapshot> snapshot_;
  int cursor_{1};

  std::mutex tasks_mutex_;
  std::vector<std::future<void>> tasks_;
};

} // namespace gitstage

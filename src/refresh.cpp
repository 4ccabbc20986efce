#include "gitstage/refresh.hpp"

#include "gitstage/log.hpp"

#include <algorithm>
#include <utility>

namespace gitstage {

namespace {
std::shared_ptr<spdlog::logger> refresh_log() {
  static auto logger = log::category("refresh");
  return logger;
}
} // namespace

// Permit

Permit::Permit(Permit &&other) noexcept
    : lock_(std::exchange(other.lock_, nullptr)), ticket_(other.ticket_) {}

Permit &Permit::operator=(Permit &&other) noexcept {
  if (this != &other) {
    release();
    lock_ = std::exchange(other.lock_, nullptr);
    ticket_ = other.ticket_;
  }
  return *this;
}

Permit::~Permit() { release(); }

void Permit::release() {
  if (lock_) {
    std::exchange(lock_, nullptr)->release(ticket_);
  }
}

// RefreshLock

RefreshLock::RefreshLock(std::chrono::milliseconds watchdog) : timeout_(watchdog) {}

RefreshLock::~RefreshLock() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  std::lock_guard<std::mutex> guard(watchdog_mutex_);
  if (watchdog_.joinable())
    watchdog_.join();
}

std::optional<Permit> RefreshLock::try_acquire(const std::string &reason) {
  std::uint64_t ticket = 0;
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (permits_ == 0)
      return std::nullopt;
    permits_ = 0;
    ticket = ++ticket_;
  }
  cv_.notify_all(); // wakes a watchdog still waiting on an older ticket
  refresh_log()->debug("acquired refresh lock: {}", reason);

  {
    std::lock_guard<std::mutex> guard(watchdog_mutex_);
    if (watchdog_.joinable())
      watchdog_.join();
    watchdog_ = std::thread(&RefreshLock::watch, this, ticket, reason);
  }
  return Permit{this, ticket};
}

bool RefreshLock::is_locked() const { return permits() == 0; }

int RefreshLock::permits() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return permits_;
}

void RefreshLock::release(std::uint64_t ticket) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (ticket != ticket_ || permits_ == 1)
      return; // already taken back by the watchdog
    permits_ = 1;
  }
  cv_.notify_all();
}

void RefreshLock::watch(std::uint64_t ticket, std::string reason) {
  std::unique_lock<std::mutex> lk(mutex_);
  const bool settled = cv_.wait_for(
      lk, timeout_, [&] { return stopping_ || ticket_ != ticket || permits_ == 1; });
  if (settled)
    return;
  permits_ = 1;
  lk.unlock();
  cv_.notify_all();
  refresh_log()->warn("refresh lock for {} expired after {} ms", reason, timeout_.count());
}

// RefreshCoordinator

RefreshCoordinator::RefreshCoordinator(GitBackend &git, RenderConfig config,
                                       RefreshOptions options)
    : git_(git), config_(std::move(config)), lock_(options.watchdog),
      view_(std::make_shared<const StatusView>()) {}

RefreshCoordinator::~RefreshCoordinator() { wait_idle(); }

bool RefreshCoordinator::dispatch_refresh(const std::string &reason) {
  auto permit = lock_.try_acquire(reason);
  if (!permit) {
    refresh_log()->debug("refresh lock is active, skipping refresh from {}", reason);
    return false;
  }

  std::lock_guard<std::mutex> lk(tasks_mutex_);
  std::erase_if(tasks_, [](const std::future<void> &f) {
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
  });
  tasks_.push_back(std::async(std::launch::async,
                              [this, p = std::move(*permit), reason]() mutable {
                                run_cycle(std::move(p), reason);
                              }));
  return true;
}

bool RefreshCoordinator::refresh(const std::string &reason) {
  auto permit = lock_.try_acquire(reason);
  if (!permit) {
    refresh_log()->debug("refresh lock is active, skipping refresh from {}", reason);
    return false;
  }
  run_cycle(std::move(*permit), reason);
  return true;
}

void RefreshCoordinator::run_cycle(Permit permit, const std::string &reason) {
  refresh_log()->debug("redrawing ({})", reason);

  CursorLocation saved;
  {
    std::lock_guard<std::mutex> lk(view_mutex_);
    saved = save_cursor_location(view_->tree, cursor_);
  }

  try {
    auto snapshot = std::make_shared<const RepositorySnapshot>(git_.load_snapshot());

    std::lock_guard<std::mutex> lk(view_mutex_);
    snapshot_ = snapshot;
    publish(build_status(view_->tree, *snapshot_, config_), saved);
    refresh_log()->debug("finished redrawing ({})", reason);
  } catch (const std::exception &e) {
    // The previous view stays in place; the next refresh will correct it.
    refresh_log()->error("refresh ({}) failed: {}", reason, e.what());
  }

  permit.release();
  refresh_log()->info("refresh lock is now free");
}

void RefreshCoordinator::publish(BuildResult result, const std::optional<CursorLocation> &restore) {
  auto next = std::make_shared<StatusView>();
  next->tree = std::move(result.tree);
  next->buffer = std::move(result.buffer);
  view_ = std::move(next);

  if (restore) {
    cursor_ = restore_cursor_location(view_->tree, *restore);
  } else {
    cursor_ = std::clamp(cursor_, 1, std::max(1, view_->buffer.line_count()));
  }
}

void RefreshCoordinator::redraw() {
  std::lock_guard<std::mutex> lk(view_mutex_);
  if (!snapshot_)
    return;
  publish(build_status(view_->tree, *snapshot_, config_), std::nullopt);
}

void RefreshCoordinator::edit_folds(const std::function<void(StatusTree &)> &edit) {
  std::lock_guard<std::mutex> lk(view_mutex_);
  StatusTree tree = view_->tree;
  edit(tree);
  if (!snapshot_) {
    auto next = std::make_shared<StatusView>();
    next->tree = std::move(tree);
    next->buffer = view_->buffer;
    view_ = std::move(next);
    return;
  }
  publish(build_status(tree, *snapshot_, config_), std::nullopt);
}

void RefreshCoordinator::reset() {
  std::lock_guard<std::mutex> lk(view_mutex_);
  view_ = std::make_shared<const StatusView>();
  snapshot_.reset();
  cursor_ = 1;
}

void RefreshCoordinator::wait_idle() {
  std::vector<std::future<void>> pending;
  {
    std::lock_guard<std::mutex> lk(tasks_mutex_);
    pending.swap(tasks_);
  }
  for (auto &f : pending)
    f.get();
}

std::shared_ptr<const StatusView> RefreshCoordinator::view() const {
  std::lock_guard<std::mutex> lk(view_mutex_);
  return view_;
}

int RefreshCoordinator::cursor() const {
  std::lock_guard<std::mutex> lk(view_mutex_);
  return cursor_;
}

void RefreshCoordinator::set_cursor(int line) {
  std::lock_guard<std::mutex> lk(view_mutex_);
  cursor_ = std::max(1, line);
}

} // namespace gitstage

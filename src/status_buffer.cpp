#include "gitstage/status_buffer.hpp"

#include "gitstage/consts.hpp"
#include "gitstage/line_index.hpp"
#include "gitstage/log.hpp"
#include "gitstage/patch.hpp"
#include "gitstage/selection.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace gitstage {

namespace {

std::shared_ptr<spdlog::logger> status_log() {
  static auto logger = log::category("status");
  return logger;
}

Item *find_item(StatusTree &tree, std::string_view section, std::string_view name) {
  Section *s = tree.find_section(section);
  if (!s)
    return nullptr;
  auto it = std::ranges::find_if(s->items, [&](const Item &i) { return i.name == name; });
  return it == s->items.end() ? nullptr : &*it;
}

Hunk *find_hunk(Item &item, std::string_view hash) {
  auto it = std::ranges::find_if(item.hunks, [&](const Hunk &h) { return h.hash == hash; });
  return it == item.hunks.end() ? nullptr : &*it;
}

std::string discard_prompt(bool partial, std::size_t hunk_count,
                           const std::vector<std::string> &files) {
  if (partial)
    return "Discard selection?";
  if (hunk_count > 0)
    return "Discard " + std::to_string(hunk_count) + " hunks?";
  if (files.size() > 1)
    return "Discard " + std::to_string(files.size()) + " files?";
  return "Discard \"" + files.front() + "\"?";
}

// Rendered hunk headers in buffer order.
std::vector<int> hunk_headers(const StatusTree &tree) {
  std::vector<int> out;
  for (const auto &s : tree.sections)
    for (const auto &i : s.items)
      for (const auto &h : i.hunks)
        if (h.rendered())
          out.push_back(h.first);
  return out;
}

} // namespace

StatusBuffer::StatusBuffer(std::unique_ptr<GitBackend> git, RenderConfig config,
                           RefreshOptions options)
    : git_(std::move(git)), refresh_(*git_, std::move(config), options) {}

void StatusBuffer::reset() {
  refresh_.reset();
  if (refresh_.config().auto_refresh)
    refresh_.refresh("reset");
}

void StatusBuffer::mutate(const std::string &reason, const std::function<void()> &fn) {
  try {
    fn();
  } catch (const std::exception &e) {
    status_log()->error("{} failed: {}", reason, e.what());
    refresh_.refresh(reason);
    throw;
  }
  refresh_.refresh(reason);
}

void StatusBuffer::toggle(int first, int last) {
  const auto view = refresh_.view();
  const Selection sel = select(view->tree, first, last);

  if (sel.item) {
    const Section *owner = nullptr;
    for (const auto &s : sel.sections)
      if (std::ranges::find(s.items, sel.item) != s.items.end())
        owner = s.section;

    const auto hunks = hunks_in_range(*sel.item, sel.first_line, sel.last_line, false);
    const std::string section = owner ? owner->name : std::string();
    const std::string item = sel.item->name;

    if (!hunks.empty()) {
      std::vector<std::string> hashes;
      for (const auto &h : hunks)
        hashes.push_back(h.hunk->hash);
      const int target = hunks.front().hunk->first;

      refresh_.edit_folds([&](StatusTree &tree) {
        if (Item *i = find_item(tree, section, item))
          for (const auto &hash : hashes)
            if (Hunk *h = find_hunk(*i, hash))
              h->folded = !h->folded;
      });
      refresh_.set_cursor(target);
      return;
    }

    refresh_.edit_folds([&](StatusTree &tree) {
      if (Item *i = find_item(tree, section, item))
        i->folded = !i->folded;
    });
    return;
  }

  if (sel.section) {
    const std::string section = sel.section->name;
    refresh_.edit_folds([&](StatusTree &tree) {
      if (Section *s = tree.find_section(section))
        s->folded = !s->folded;
    });
  }
}

void StatusBuffer::set_folds(int depth) {
  static constexpr bool kFolds[4][3] = {
      {true, true, false},
      {false, true, false},
      {false, false, true},
      {false, false, false},
  };
  if (depth < 1 || depth > 4)
    throw std::invalid_argument("fold depth must be between 1 and 4");
  const bool *to = kFolds[depth - 1];

  refresh_.edit_folds([to](StatusTree &tree) {
    for (auto &s : tree.sections) {
      if (s.ignore_sign)
        continue;
      s.folded = to[0];
      for (auto &i : s.items) {
        i.folded = to[1];
        for (auto &h : i.hunks)
          h.folded = to[2];
      }
    }
  });
  refresh_.refresh("set_folds");
}

bool StatusBuffer::stage(int first, int last, bool partial) {
  const auto view = refresh_.view();
  const Selection sel = select(view->tree, first, last);
  bool acted = false;

  mutate("stage", [&] {
    std::vector<std::string> untracked;
    for (const auto &sec : sel.sections) {
      const std::string &name = sec.section->name;
      for (const Item *item : sec.items) {
        if (name != consts::kUnstaged && name != consts::kUntracked) {
          status_log()->debug("not staging {} in {}", item->name, name);
          continue;
        }

        const auto hunks = hunks_in_range(*item, sel.first_line, sel.last_line, partial);
        for (const auto &h : hunks)
          git_->apply(generate_patch(*item, *h.hunk, h.from, h.to), {.cached = true});

        acted = true;
        if (!hunks.empty())
          continue;
        if (name == consts::kUnstaged)
          git_->stage({item->name});
        else
          untracked.push_back(item->name);
      }
    }
    if (!untracked.empty())
      git_->add(untracked);
  });
  return acted;
}

bool StatusBuffer::unstage(int first, int last, bool partial) {
  const auto view = refresh_.view();
  const Selection sel = select(view->tree, first, last);
  bool acted = false;

  mutate("unstage", [&] {
    std::vector<std::string> files;
    for (const auto &sec : sel.sections) {
      if (sec.section->name != consts::kStaged)
        continue;
      for (const Item *item : sec.items) {
        acted = true;
        const auto hunks = hunks_in_range(*item, sel.first_line, sel.last_line, partial);
        for (const auto &h : hunks) {
          status_log()->debug("unstaging {}..{} of {}..{} in {}", h.from, h.to, h.hunk->diff_from,
                              h.hunk->diff_to, item->name);
          git_->apply(generate_patch(*item, *h.hunk, h.from, h.to, true), {.cached = true});
        }
        if (hunks.empty())
          files.push_back(item->name);
      }
    }
    if (!files.empty())
      git_->unstage(files);
  });
  return acted;
}

bool StatusBuffer::discard(int first, int last, bool partial, const ConfirmFn &confirm) {
  const auto view = refresh_.view();
  const Selection sel = select(view->tree, first, last);

  std::vector<std::function<void()>> jobs;
  std::vector<std::string> files;
  std::size_t hunk_count = 0;

  for (const auto &sec : sel.sections) {
    const std::string section = sec.section->name;
    if (sec.section->kind != SectionKind::DiffBearing)
      continue;

    for (const Item *item : sec.items) {
      files.push_back(item->name);
      const auto hunks = hunks_in_range(*item, sel.first_line, sel.last_line, partial);

      if (!hunks.empty()) {
        status_log()->debug("discarding {} hunks from {}", hunks.size(), item->name);
        hunk_count += hunks.size();
        for (const auto &h : hunks) {
          const std::string patch = generate_patch(*item, *h.hunk, h.from, h.to, true);
          // Staged hunks are undone in the index and the worktree, others in the worktree.
          const ApplyFlags flags{.index = section == consts::kStaged};
          jobs.emplace_back([this, patch, flags] { git_->apply(patch, flags); });
        }
        continue;
      }

      const std::string file = item->name;
      if (section == consts::kUntracked) {
        jobs.emplace_back([this, file] { git_->remove_untracked(file); });
      } else if (section == consts::kUnstaged) {
        jobs.emplace_back([this, file] { git_->checkout({file}); });
      } else if (section == consts::kStaged) {
        jobs.emplace_back([this, file] {
          git_->reset({file});
          git_->checkout({file});
        });
      }
    }
  }

  if (jobs.empty())
    return false;
  if (!confirm(discard_prompt(partial, hunk_count, files)))
    return false;

  mutate("discard", [&] {
    for (std::size_t i = 0; i < jobs.size(); ++i) {
      status_log()->debug("discard job {}", i + 1);
      jobs[i]();
    }
  });
  return true;
}

void StatusBuffer::stage_modified() {
  mutate("stage_modified", [this] { git_->stage_modified(); });
}

void StatusBuffer::stage_all() {
  mutate("stage_all", [this] { git_->stage_all(); });
}

void StatusBuffer::unstage_all() {
  mutate("unstage_all", [this] { git_->unstage_all(); });
}

GotoTarget StatusBuffer::goto_file(int line, int column) const {
  const auto view = refresh_.view();
  const LineHit hit = resolve(view->tree, line);
  GotoTarget target;
  if (!hit.section)
    return target;

  if (!hit.item) {
    if (hit.section->kind == SectionKind::Header) {
      if (auto rev = hit.section->ref ? hit.section->ref : hit.section->commit_oid;
          rev && !rev->empty()) {
        target.kind = GotoTarget::Kind::Revision;
        target.revision = *rev;
      }
    }
    return target;
  }

  const Item &item = *hit.item;
  if (hit.section->kind == SectionKind::CommitBearing) {
    target.kind = GotoTarget::Kind::Revision;
    target.revision = item.commit ? item.commit->oid : item.name.substr(0, item.name.find(' '));
    return target;
  }

  if (item.absolute_path.empty())
    throw std::runtime_error("cannot open file, no path found");

  target.path = item.absolute_path;
  if (item.submodule) {
    target.kind = GotoTarget::Kind::Submodule;
    return target;
  }

  target.kind = GotoTarget::Kind::File;
  if (hit.hunk && item.diff) {
    const Hunk &h = *hit.hunk;
    const int offset = line - h.first;
    int row = h.disk_from + offset - 1;
    // Deleted lines do not exist on disk.
    for (int k = 1; k <= offset; ++k) {
      const std::size_t idx = h.diff_from + static_cast<std::size_t>(k);
      if (idx < item.diff->lines.size() && item.diff->lines[idx].starts_with(consts::kDelStart))
        --row;
    }
    target.row = std::max(1, row);
    target.column = std::max(0, column - 1);
  }
  return target;
}

std::optional<std::string> StatusBuffer::yank(int first, int last) const {
  const auto view = refresh_.view();
  const Selection sel = select(view->tree, first, last);

  if (sel.item)
    return sel.item->oid ? *sel.item->oid : sel.item->name;
  if (sel.commit)
    return sel.commit->oid;
  if (sel.section && sel.section->ref)
    return *sel.section->ref;
  if (sel.section && sel.section->commit_oid && !sel.section->commit_oid->empty())
    return *sel.section->commit_oid;
  return std::nullopt;
}

std::optional<int> StatusBuffer::next_hunk_header(int line) const {
  const auto view = refresh_.view();
  if (!resolve(view->tree, line).section)
    return std::nullopt;
  const auto headers = hunk_headers(view->tree);
  auto it = std::ranges::upper_bound(headers, line);
  if (it == headers.end())
    return std::nullopt;
  return *it;
}

std::optional<int> StatusBuffer::previous_hunk_header(int line) const {
  const auto view = refresh_.view();
  if (!resolve(view->tree, line).section)
    return std::nullopt;
  const auto headers = hunk_headers(view->tree);
  auto it = std::ranges::lower_bound(headers, line);
  if (it == headers.begin())
    return std::nullopt;
  return *std::prev(it);
}

std::string StatusBuffer::describe_selection(int first, int last) const {
  const auto view = refresh_.view();
  return select(view->tree, first, last).format();
}

} // namespace gitstage

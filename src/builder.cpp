#include "gitstage/builder.hpp"

#include "gitstage/consts.hpp"
#include "gitstage/log.hpp"

#include <array>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace gitstage {

namespace {

struct ModeText {
  std::string_view code;
  std::string_view text;
};

constexpr std::array kModeText = {
    ModeText{"M", "Modified"}, ModeText{"N", "New file"}, ModeText{"A", "Added"},
    ModeText{"D", "Deleted"},  ModeText{"C", "Copied"},   ModeText{"U", "Updated"},
    ModeText{"UU", "Both Modified"}, ModeText{"R", "Renamed"},
};

std::optional<std::string_view> mode_text(std::string_view code) {
  for (const auto &m : kModeText)
    if (m.code == code)
      return m.text;
  return std::nullopt;
}

std::string pad_right(std::string s, std::size_t width) {
  if (s.size() < width)
    s.append(width - s.size(), ' ');
  return s;
}

std::string trim_right(std::string s) {
  while (!s.empty() && s.back() == ' ')
    s.pop_back();
  return s;
}

LineTag tag_for_body_line(const std::string &line) {
  if (line.empty())
    return LineTag::Context;
  switch (line.front()) {
  case consts::kAddStart:
    return LineTag::Add;
  case consts::kDelStart:
    return LineTag::Delete;
  default:
    return LineTag::Context;
  }
}

class TreeBuilder {
public:
  TreeBuilder(const StatusTree &previous, const RepositorySnapshot &repo, const RenderConfig &cfg)
      : repo_(repo), cfg_(cfg) {
    for (const auto &s : previous.sections)
      previous_sections_.emplace(s.name, &s);
  }

  BuildResult run() {
    if (!cfg_.disable_hint) {
      append(hint_line(), LineTag::Hint);
      append("", LineTag::Blank);
    }

    header_rows();

    if (repo_.rebase.head) {
      section("Rebasing: " + *repo_.rebase.head, consts::kRebase, repo_.rebase.items);
    } else if (repo_.sequencer.head == consts::kRevertHead) {
      section("Reverting", consts::kSequencer, repo_.sequencer.items);
    } else if (repo_.sequencer.head == consts::kCherryPickHead) {
      section("Picking", consts::kSequencer, repo_.sequencer.items);
    }

    section("Untracked files", consts::kUntracked, repo_.untracked);
    section("Unstaged changes", consts::kUnstaged, repo_.unstaged);
    section("Staged changes", consts::kStaged, repo_.staged);
    section("Stashes", consts::kStashes, repo_.stashes);

    const auto &push = repo_.push_remote.ref;
    const auto &upstream = repo_.upstream.ref;

    if (push && upstream != push) {
      section("Unpulled from " + *push, consts::kUnpulledPushRemote, repo_.push_remote.unpulled);
      section("Unpushed to " + *push, consts::kUnmergedPushRemote, repo_.push_remote.unmerged);
    }
    if (upstream) {
      section("Unpulled from " + *upstream, consts::kUnpulledUpstream, repo_.upstream.unpulled);
      section("Unmerged into " + *upstream, consts::kUnmergedUpstream, repo_.upstream.unmerged);
    }

    section("Recent commits", consts::kRecent, repo_.recent);

    if (cfg_.disable_signs) {
      for (auto &info : out_.buffer.info)
        info.sign = FoldSign::None;
    }
    return std::move(out_);
  }

private:
  int append(std::string line, LineTag tag) {
    out_.buffer.lines.push_back(std::move(line));
    out_.buffer.info.push_back(LineInfo{.tag = tag});
    return out_.buffer.line_count();
  }

  void sign(int line, bool folded) {
    out_.buffer.info[static_cast<std::size_t>(line - 1)].sign =
        folded ? FoldSign::Closed : FoldSign::Open;
  }

  std::string hint_line() const {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 6> kHints = {{
        {"Toggle", "toggle diff"},
        {"Stage", "stage"},
        {"Unstage", "unstage"},
        {"Discard", "discard"},
        {"CommitPopup", "commit"},
        {"HelpPopup", "help"},
    }};

    std::string out = "Hint: ";
    bool first = true;
    for (const auto &[action, hint] : kHints) {
      if (!first)
        out += " | ";
      first = false;
      const auto keys = cfg_.keys_for(action);
      std::string joined;
      for (const auto &k : keys) {
        if (!joined.empty())
          joined += ' ';
        joined += k;
      }
      out += "[" + (joined.empty() ? std::string("<unmapped>") : joined) + "] ";
      out += hint;
    }
    return out;
  }

  void header_row(std::string text, std::string_view key, std::optional<std::string> commit_oid,
                  std::optional<std::string> ref) {
    const int line = append(std::move(text), LineTag::HeaderRow);
    Section s;
    s.name = std::string(key);
    s.kind = SectionKind::Header;
    s.first = line;
    s.last = line;
    s.ignore_sign = true;
    s.commit_oid = std::move(commit_oid);
    s.ref = std::move(ref);
    out_.tree.sections.push_back(std::move(s));
  }

  static std::string with_abbrev(const std::string &abbrev, const std::string &name) {
    return abbrev.empty() ? name : abbrev + " " + name;
  }

  void header_rows() {
    const auto &head = repo_.head;
    header_row("Head:     " + with_abbrev(head.abbrev, head.branch) + " " +
                   head.commit_message.value_or("(no commits)"),
               consts::kHeadHeader, head.oid, std::nullopt);

    if (!head.detached) {
      const auto &up = repo_.upstream;
      if (up.ref) {
        header_row("Merge:    " + with_abbrev(up.abbrev, *up.ref) + " " +
                       up.commit_message.value_or("(no commits)"),
                   consts::kUpstreamHeader, up.oid, std::nullopt);
      }

      const auto &push = repo_.push_remote;
      if (push.ref && !push.abbrev.empty()) {
        header_row("Push:     " + with_abbrev(push.abbrev, *push.ref) + " " +
                       push.commit_message.value_or("(does not exist)"),
                   consts::kPushHeader, std::nullopt, *push.ref);
      }
    }

    if (head.tag.name) {
      header_row("Tag:      " + *head.tag.name + " (" + std::to_string(head.tag.distance) + ")",
                 consts::kTagHeader, std::nullopt, *head.tag.name);
    }

    append("", LineTag::Blank);
  }

  std::string item_line(const StatusEntry &f) const {
    std::string label = pad_right(format_mode(f.mode), consts::kModeLabelWidth);
    if (cfg_.columns < consts::kWideColumns)
      label = trim_right(std::move(label));

    std::string line;
    if (f.mode && f.original_name)
      line = label + " " + *f.original_name + " -> " + f.name;
    else if (f.mode)
      line = label + " " + f.name;
    else
      line = f.name;

    if (f.submodule)
      line += " " + format_submodule_mode(*f.submodule);
    return line;
  }

  // Hunks are rebuilt from the fresh diff; only `folded` is looked up by hash.
  void hunks(Item &item, const StatusEntry &f, const Item *prev, bool render) {
    if (!f.has_diff || !f.diff)
      return;

    std::unordered_map<std::string_view, const Hunk *> previous_hunks;
    if (prev) {
      for (const auto &h : prev->hunks)
        previous_hunks.emplace(h.hash, &h);
    }

    for (const auto &dh : f.diff->hunks) {
      Hunk h;
      h.hash = dh.hash;
      h.diff_from = dh.diff_from;
      h.diff_to = dh.diff_to;
      h.index_from = dh.index_from;
      h.index_len = dh.index_len;
      h.disk_from = dh.disk_from;
      h.disk_len = dh.disk_len;
      if (const auto it = previous_hunks.find(dh.hash); it != previous_hunks.end())
        h.folded = it->second->folded;

      if (render) {
        h.first = append(f.diff->lines[dh.diff_from], LineTag::HunkHeader);
        if (!h.folded) {
          for (std::size_t i = dh.diff_from + 1; i <= dh.diff_to; ++i)
            append(f.diff->lines[i], tag_for_body_line(f.diff->lines[i]));
        }
        h.last = out_.buffer.line_count();
        sign(h.first, h.folded);
      }
      item.hunks.push_back(std::move(h));
    }
  }

  void section(const std::string &header, std::string_view key, const SectionData &data) {
    const SectionConfig sc = cfg_.section(key);
    if (sc.hidden || data.items.empty())
      return;

    const auto count = std::to_string(data.items.size());
    Section s;
    s.name = std::string(key);
    s.kind = section_kind_for(key);
    s.first = append(data.current ? header + " (" + std::to_string(*data.current) + "/" + count + ")"
                                  : header + " (" + count + ")",
                     LineTag::SectionHeader);

    const Section *prev = nullptr;
    if (const auto it = previous_sections_.find(key); it != previous_sections_.end())
      prev = it->second;
    s.folded = prev ? prev->folded : sc.folded;
    sign(s.first, s.folded);

    std::unordered_map<std::string_view, const Item *> previous_items;
    if (prev) {
      for (const auto &i : prev->items)
        previous_items.emplace(i.name, &i);
    }

    for (const auto &f : data.items) {
      Item item;
      item.name = f.name;
      item.diff = f.diff;
      item.oid = f.oid;
      item.commit = f.commit;
      item.mode = f.mode;
      item.original_name = f.original_name;
      item.submodule = f.submodule;
      item.absolute_path = f.absolute_path;
      item.has_diff = f.has_diff;
      item.done = f.done;

      const Item *prev_item = nullptr;
      if (const auto it = previous_items.find(f.name); it != previous_items.end())
        prev_item = it->second;
      item.folded = prev_item ? prev_item->folded : cfg_.fold_items;

      if (!s.folded) {
        item.first = append(item_line(f), LineTag::Item);
        out_.buffer.info.back().done = f.done;
        hunks(item, f, prev_item, !item.folded);
        item.last = out_.buffer.line_count();
        if (!item.hunks.empty())
          sign(item.first, item.folded);
      } else {
        hunks(item, f, prev_item, false);
      }
      s.items.push_back(std::move(item));
    }

    s.last = out_.buffer.line_count();
    if (!s.folded)
      append("", LineTag::Blank);

    out_.tree.sections.push_back(std::move(s));
  }

  const RepositorySnapshot &repo_;
  const RenderConfig &cfg_;
  std::unordered_map<std::string_view, const Section *> previous_sections_;
  BuildResult out_;
};

} // namespace

std::string format_mode(const std::optional<std::string> &mode) {
  if (!mode)
    return {};
  if (const auto text = mode_text(*mode))
    return std::string(*text);
  if (!mode->empty()) {
    if (const auto text = mode_text(mode->substr(0, 1)))
      return std::string(*text) + " by us";
  }
  return *mode;
}

std::string format_submodule_mode(const SubmoduleState &state) {
  std::string res;
  auto add = [&res](std::string_view part) {
    if (!res.empty())
      res += ", ";
    res += part;
  };
  if (state.commit_changed)
    add("new commits");
  if (state.has_tracked_changes)
    add("modified content");
  if (state.has_untracked_changes)
    add("untracked content");
  return res.empty() ? "(malformed submodule)" : "(" + res + ")";
}

BuildResult build_status(const StatusTree &previous, const RepositorySnapshot &snapshot,
                         const RenderConfig &config) {
  auto result = TreeBuilder{previous, snapshot, config}.run();
  log::category("status")->debug("built {} sections, {} lines", result.tree.sections.size(),
                                 result.buffer.line_count());
  return result;
}

} // namespace gitstage

#include "gitstage/git.hpp"

#include "gitstage/consts.hpp"
#include "gitstage/diff.hpp"
#include "gitstage/fs.hpp"
#include "gitstage/log.hpp"
#include "gitstage/process.hpp"

#include <charconv>
#include <sstream>
#include <string_view>
#include <utility>

namespace stdfs = std::filesystem;

namespace gitstage {

namespace {

constexpr std::string_view kLogFormat = "--format=%H%x00%h%x00%s";
constexpr int kMaxLogEntries = 256;
constexpr int kRecentCount = 10;

std::vector<std::string> split_nul(std::string_view text) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto end = text.find('\0', start);
    if (end == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      break;
    }
    out.emplace_back(text.substr(start, end - start));
    start = end + 1;
  }
  return out;
}

// Split off `n` space-separated fields; the remainder (a path) may hold spaces.
std::vector<std::string> fields(std::string_view record, std::size_t n) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < n; ++i) {
    const auto sp = record.find(' ');
    if (sp == std::string_view::npos) {
      out.emplace_back(record);
      record = {};
      continue;
    }
    out.emplace_back(record.substr(0, sp));
    record.remove_prefix(sp + 1);
  }
  out.emplace_back(record);
  return out;
}

std::optional<SubmoduleState> parse_submodule(std::string_view sub) {
  if (sub.size() != 4 || sub[0] != 'S')
    return std::nullopt;
  return SubmoduleState{.commit_changed = sub[1] == 'C',
                        .has_tracked_changes = sub[2] == 'M',
                        .has_untracked_changes = sub[3] == 'U'};
}

std::string first_line_of(std::string s) {
  if (const auto nl = s.find('\n'); nl != std::string::npos)
    s.erase(nl);
  return s;
}

class GitCli final : public GitBackend {
public:
  explicit GitCli(stdfs::path root) : root_(std::move(root)) {}

  [[nodiscard]] const stdfs::path &root() const override { return root_; }

  RepositorySnapshot load_snapshot() override {
    RepositorySnapshot snap;
    snap.root = root_;
    const stdfs::path git_dir = first_line_of(git({"rev-parse", "--absolute-git-dir"}));

    load_status(snap);
    load_head(snap);
    load_upstream(snap);
    load_push_remote(snap);
    load_rebase(snap, git_dir);
    load_sequencer(snap, git_dir);
    snap.stashes.items = stash_entries();
    if (!snap.head.oid.empty())
      snap.recent.items = log_entries({"--max-count=" + std::to_string(kRecentCount), "HEAD"});
    return snap;
  }

  void apply(const std::string &patch, const ApplyFlags &flags) override {
    std::vector<std::string> args{"apply"};
    if (flags.cached)
      args.emplace_back("--cached");
    if (flags.index)
      args.emplace_back("--index");
    if (flags.reverse)
      args.emplace_back("--reverse");
    args.emplace_back("-");
    git(args, patch);
  }

  void stage(const std::vector<std::string> &files) override { with_files({"add"}, files); }
  void unstage(const std::vector<std::string> &files) override { with_files({"reset"}, files); }
  void add(const std::vector<std::string> &files) override { with_files({"add"}, files); }
  void checkout(const std::vector<std::string> &files) override {
    with_files({"checkout"}, files);
  }
  void reset(const std::vector<std::string> &files) override { with_files({"reset"}, files); }

  void remove_untracked(const std::string &file) override { fs::remove_file(root_ / file); }

  void stage_modified() override { git({"add", "--update"}); }
  void stage_all() override { git({"add", "--all"}); }
  void unstage_all() override { git({"reset"}); }

private:
  ProcessResult run(std::vector<std::string> args, const std::string &input = {}) {
    args.insert(args.begin(), {"git", "--no-pager", "-c", "core.quotepath=false"});
    log::category("git")->debug("running: {}", join(args));
    return run_process(args, root_, input);
  }

  // Runs git and returns stdout; any non-zero exit raises GitError.
  std::string git(std::vector<std::string> args, const std::string &input = {}) {
    auto res = run(args, input);
    if (res.exit_code != 0)
      throw GitError(join(args) + " failed (" + std::to_string(res.exit_code) +
                     "): " + first_line_of(res.err));
    return std::move(res.out);
  }

  std::optional<std::string> git_optional(std::vector<std::string> args) {
    auto res = run(std::move(args));
    if (res.exit_code != 0 || res.out.empty())
      return std::nullopt;
    return first_line_of(std::move(res.out));
  }

  void with_files(std::vector<std::string> args, const std::vector<std::string> &files) {
    if (files.empty())
      return;
    args.emplace_back("--");
    args.insert(args.end(), files.begin(), files.end());
    git(std::move(args));
  }

  static std::string join(const std::vector<std::string> &args) {
    std::string s;
    for (const auto &a : args) {
      if (!s.empty())
        s += ' ';
      s += a;
    }
    return s;
  }

  std::optional<Diff> load_diff(std::vector<std::string> args, bool no_index = false) {
    std::string text;
    if (no_index) {
      // --no-index exits 1 when the files differ
      auto res = run(std::move(args));
      if (res.exit_code > 1)
        throw GitError("git diff --no-index failed: " + first_line_of(res.err));
      text = std::move(res.out);
    } else {
      text = git(std::move(args));
    }
    try {
      return diff::parse_diff(text);
    } catch (const DiffParseError &e) {
      log::category("git")->warn("unreadable diff: {}", e.what());
      return std::nullopt;
    }
  }

  StatusEntry file_entry(std::string path, std::string mode) {
    StatusEntry e;
    e.absolute_path = root_ / path;
    e.name = std::move(path);
    e.mode = std::move(mode);
    return e;
  }

  void attach_diff(StatusEntry &e, std::vector<std::string> args, bool no_index = false) {
    e.diff = load_diff(std::move(args), no_index);
    e.has_diff = e.diff.has_value();
  }

  void load_status(RepositorySnapshot &snap) {
    const auto out = git({"status", "--porcelain=v2", "--branch", "-z", "--untracked-files=all"});
    const auto records = split_nul(out);

    for (std::size_t i = 0; i < records.size(); ++i) {
      const std::string_view rec = records[i];
      if (rec.empty())
        continue;

      if (rec.starts_with("# ")) {
        const auto f = fields(rec.substr(2), 1);
        if (f[0] == "branch.oid")
          snap.head.oid = f[1] == "(initial)" ? std::string() : f[1];
        else if (f[0] == "branch.head") {
          snap.head.detached = f[1] == "(detached)";
          snap.head.branch = f[1];
        } else if (f[0] == "branch.upstream") {
          snap.upstream.ref = f[1];
        }
        continue;
      }

      const char kind = rec.front();
      if (kind == '?') {
        auto e = file_entry(std::string(rec.substr(2)), "");
        e.mode.reset();
        attach_diff(e, {"diff", "--no-ext-diff", "--no-color", "--no-index", "--", "/dev/null", e.name},
                    true);
        snap.untracked.items.push_back(std::move(e));
        continue;
      }
      if (kind == 'u') {
        // u XY sub m1 m2 m3 mW h1 h2 h3 path
        const auto f = fields(rec, 10);
        snap.unstaged.items.push_back(file_entry(f[10], f[1]));
        continue;
      }
      if (kind != '1' && kind != '2')
        continue;

      // 1 XY sub mH mI mW hH hI path
      // 2 XY sub mH mI mW hH hI Xscore path \0 orig
      const auto f = fields(rec, kind == '1' ? 8 : 9);
      const std::string &xy = f[1];
      const std::string path = f.back();
      std::optional<std::string> orig;
      if (kind == '2' && i + 1 < records.size())
        orig = records[++i];
      const auto sub = parse_submodule(f[2]);

      if (xy[0] != '.') {
        auto e = file_entry(path, std::string(1, xy[0]));
        e.original_name = orig;
        e.submodule = sub;
        std::vector<std::string> args{"diff", "--no-ext-diff", "--no-color", "--cached", "--"};
        if (orig)
          args.push_back(*orig);
        args.push_back(path);
        attach_diff(e, std::move(args));
        snap.staged.items.push_back(std::move(e));
      }
      if (xy[1] != '.') {
        auto e = file_entry(path, std::string(1, xy[1]));
        e.submodule = sub;
        attach_diff(e, {"diff", "--no-ext-diff", "--no-color", "--", path});
        snap.unstaged.items.push_back(std::move(e));
      }
    }
  }

  void load_head(RepositorySnapshot &snap) {
    if (snap.head.oid.empty())
      return;
    if (const auto line = git_optional({"log", "-1", std::string(kLogFormat), "HEAD"})) {
      const auto parts = split_nul(*line);
      if (parts.size() == 3) {
        snap.head.abbrev = parts[1];
        snap.head.commit_message = parts[2];
      }
    }
    if (auto tag = git_optional({"describe", "--tags", "--abbrev=0"})) {
      snap.head.tag.name = *tag;
      if (const auto n = git_optional({"rev-list", "--count", *tag + "..HEAD"})) {
        int distance = 0;
        std::from_chars(n->data(), n->data() + n->size(), distance);
        snap.head.tag.distance = distance;
      }
    }
  }

  void load_upstream(RepositorySnapshot &snap) {
    auto &up = snap.upstream;
    if (!up.ref || snap.head.detached)
      return;
    const auto slash = up.ref->find('/');
    up.branch = slash == std::string::npos ? *up.ref : up.ref->substr(slash + 1);
    if (const auto line = git_optional({"log", "-1", std::string(kLogFormat), *up.ref})) {
      const auto parts = split_nul(*line);
      if (parts.size() == 3) {
        up.oid = parts[0];
        up.abbrev = parts[1];
        up.commit_message = parts[2];
      }
    }
    up.unpulled.items = log_entries({"HEAD.." + *up.ref});
    up.unmerged.items = log_entries({*up.ref + "..HEAD"});
  }

  void load_push_remote(RepositorySnapshot &snap) {
    if (snap.head.detached || snap.head.branch.empty())
      return;
    auto remote = git_optional({"config", "--get", "branch." + snap.head.branch + ".pushRemote"});
    if (!remote)
      remote = git_optional({"config", "--get", "remote.pushDefault"});
    if (!remote)
      return;

    auto &push = snap.push_remote;
    push.ref = *remote + "/" + snap.head.branch;
    if (!git_optional({"rev-parse", "--verify", "--quiet", "refs/remotes/" + *push.ref}))
      return;
    if (const auto line = git_optional({"log", "-1", std::string(kLogFormat), *push.ref})) {
      const auto parts = split_nul(*line);
      if (parts.size() == 3) {
        push.abbrev = parts[1];
        push.commit_message = parts[2];
      }
    }
    push.unpulled.items = log_entries({"HEAD.." + *push.ref});
    push.unmerged.items = log_entries({*push.ref + "..HEAD"});
  }

  // Steps from a rebase/sequencer todo file: "pick <oid> <subject>".
  static std::vector<StatusEntry> todo_entries(const std::string &text, bool done) {
    std::vector<StatusEntry> out;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
      if (line.empty() || line[0] == '#')
        continue;
      const auto f = fields(line, 2);
      if (f.size() < 3 || f[1].empty())
        continue;
      StatusEntry e;
      e.name = f[1] + " " + f[2];
      e.oid = f[1];
      e.commit = CommitEntry{.oid = f[1], .abbrev = f[1], .subject = f[2]};
      e.done = done;
      out.push_back(std::move(e));
    }
    return out;
  }

  void load_rebase(RepositorySnapshot &snap, const stdfs::path &git_dir) {
    for (const char *dir : {"rebase-merge", "rebase-apply"}) {
      const stdfs::path base = git_dir / dir;
      const auto head_name = fs::read_state_file(base / "head-name");
      if (!head_name)
        continue;
      std::string head = *head_name;
      if (head.starts_with("refs/heads/"))
        head.erase(0, std::string_view("refs/heads/").size());
      snap.rebase.head = head;

      if (const auto done = fs::read_state_file(base / "done")) {
        for (auto &e : todo_entries(*done, true))
          snap.rebase.items.items.push_back(std::move(e));
      }
      if (const auto todo = fs::read_state_file(base / "git-rebase-todo")) {
        for (auto &e : todo_entries(*todo, false))
          snap.rebase.items.items.push_back(std::move(e));
      }
      const auto msgnum = fs::read_state_file(base / "msgnum");
      const auto next = fs::read_state_file(base / "next");
      if (const auto &pos = msgnum ? msgnum : next) {
        int current = 0;
        std::from_chars(pos->data(), pos->data() + pos->size(), current);
        snap.rebase.items.current = current;
      }
      return;
    }
  }

  void load_sequencer(RepositorySnapshot &snap, const stdfs::path &git_dir) {
    for (const auto head : {consts::kRevertHead, consts::kCherryPickHead}) {
      if (fs::exists(git_dir / head)) {
        snap.sequencer.head = std::string(head);
        break;
      }
    }
    if (!snap.sequencer.head)
      return;
    if (const auto todo = fs::read_state_file(git_dir / "sequencer" / "todo"))
      snap.sequencer.items.items = todo_entries(*todo, false);
  }

  std::vector<StatusEntry> stash_entries() {
    std::vector<StatusEntry> out;
    const auto text = git({"stash", "list", "--format=%gd%x00%H%x00%s"});
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
      const auto parts = split_nul(line);
      if (parts.size() != 3)
        continue;
      StatusEntry e;
      e.name = parts[0] + " " + parts[2];
      e.oid = parts[1];
      out.push_back(std::move(e));
    }
    return out;
  }

  std::vector<StatusEntry> log_entries(std::vector<std::string> range) {
    std::vector<std::string> args{"log", "--max-count=" + std::to_string(kMaxLogEntries),
                                  std::string(kLogFormat)};
    args.insert(args.end(), range.begin(), range.end());
    auto res = run(std::move(args));
    std::vector<StatusEntry> out;
    if (res.exit_code != 0) {
      log::category("git")->debug("log {} failed: {}", join(range), first_line_of(res.err));
      return out;
    }
    std::istringstream iss(res.out);
    std::string line;
    while (std::getline(iss, line)) {
      const auto parts = split_nul(line);
      if (parts.size() != 3)
        continue;
      StatusEntry e;
      e.name = parts[1] + " " + parts[2];
      e.oid = parts[0];
      e.commit = CommitEntry{.oid = parts[0], .abbrev = parts[1], .subject = parts[2]};
      out.push_back(std::move(e));
    }
    return out;
  }

  stdfs::path root_;
};

} // namespace

std::unique_ptr<GitBackend> make_git_cli(stdfs::path root) {
  return std::make_unique<GitCli>(std::move(root));
}

stdfs::path find_repository_root(const stdfs::path &start) {
  std::error_code ec;
  stdfs::path dir = stdfs::absolute(start, ec);
  if (ec)
    throw GitError("cannot resolve " + start.string() + ": " + ec.message());
  while (true) {
    if (fs::exists(dir / ".git"))
      return dir;
    if (!dir.has_parent_path() || dir.parent_path() == dir)
      throw GitError("not a git repository: " + start.string());
    dir = dir.parent_path();
  }
}

} // namespace gitstage

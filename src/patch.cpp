#include "gitstage/patch.hpp"

#include "gitstage/consts.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <utility>

namespace gitstage {

namespace {

struct Body {
  std::vector<std::string> lines;
  int old_len{0};
  int new_len{0};
};

void count(Body &b, char op) {
  if (op != consts::kAddStart)
    ++b.old_len;
  if (op != consts::kDelStart)
    ++b.new_len;
}

// Range start for a side of `len` lines, given the first line the hunk touches.
int range_start(int first_line, int len) { return len > 0 ? first_line : first_line - 1; }

Body cut_body(const std::vector<std::string> &lines, const Hunk &hunk, std::size_t from,
              std::size_t to, bool reverse) {
  Body b;
  bool dropped_previous = false;
  // Context line that ends the old side without a newline, if any.
  std::optional<std::size_t> open_end;

  for (std::size_t k = hunk.diff_from + 1; k <= hunk.diff_to && k < lines.size(); ++k) {
    const std::string &v = lines[k];
    const char op = v.empty() ? consts::kCtxStart : v.front();
    const std::string rest = v.empty() ? std::string() : v.substr(1);

    if (op == '\\') {
      // "\ No newline at end of file" belongs to the line before it
      if (!dropped_previous) {
        if (!b.lines.empty() && b.lines.back().front() == consts::kCtxStart)
          open_end = b.lines.size() - 1;
        b.lines.push_back(v);
      }
      continue;
    }

    dropped_previous = false;
    if (op == consts::kAddStart || op == consts::kDelStart) {
      if (from <= k && k <= to) {
        char out = op;
        if (reverse)
          out = op == consts::kAddStart ? consts::kDelStart : consts::kAddStart;
        if (out == consts::kAddStart && open_end) {
          // Adding past a line that had no newline: re-add that line with one.
          const std::string text = b.lines[*open_end].substr(1);
          b.lines[*open_end] = consts::kDelStart + text;
          b.lines.push_back(consts::kAddStart + text);
          open_end.reset();
        }
        b.lines.push_back(out + rest);
        count(b, out);
      } else if (op == (reverse ? consts::kAddStart : consts::kDelStart)) {
        // The line exists on the side we apply to: keep it as context.
        b.lines.push_back(consts::kCtxStart + rest);
        count(b, consts::kCtxStart);
      } else {
        dropped_previous = true;
      }
    } else {
      b.lines.push_back(consts::kCtxStart + rest);
      count(b, consts::kCtxStart);
    }
  }
  return b;
}

std::string file_mode(const std::vector<std::string> &header, std::string_view marker) {
  for (const auto &line : header)
    if (line.starts_with(marker))
      return line.substr(marker.size());
  return "100644";
}

std::vector<std::string> plain_header(const std::string &path) {
  return {"diff --git a/" + path + " b/" + path, "--- a/" + path, "+++ b/" + path};
}

std::vector<std::string> patch_header(const Diff &diff, const Body &body, bool reverse) {
  const std::string old_path = diff.old_path();
  const std::string new_path = diff.new_path();

  if (!reverse) {
    // A partial removal no longer deletes the file.
    if (new_path.empty() && body.new_len > 0)
      return plain_header(old_path);
    std::vector<std::string> out;
    for (const auto &line : diff.header)
      if (line.starts_with("diff --git") || line.starts_with("--- ") ||
          line.starts_with("+++ ") || line.starts_with("new file mode") ||
          line.starts_with("deleted file mode"))
        out.push_back(line);
    return out;
  }

  const std::string path = new_path.empty() ? old_path : new_path;
  if (old_path.empty() && body.new_len == 0) {
    // Undoing every line of a created file removes it again.
    return {"diff --git a/" + path + " b/" + path,
            "deleted file mode " + file_mode(diff.header, "new file mode "), "--- a/" + path,
            "+++ /dev/null"};
  }
  return plain_header(path);
}

} // namespace

std::vector<SelectedHunk> hunks_in_range(const Item &item, int first_line, int last_line,
                                         bool partial) {
  std::vector<SelectedHunk> out;
  if (item.folded || !item.rendered() || !item.diff)
    return out;

  const auto &lines = item.diff->lines;
  for (const auto &h : item.hunks) {
    if (!h.rendered() || h.first > last_line || h.last < first_line)
      continue;

    SelectedHunk sel;
    sel.hunk = &h;
    if (partial && !h.folded) {
      const int lo = std::max(first_line, h.first);
      const int hi = std::min(last_line, h.last);
      sel.from = h.diff_from + static_cast<std::size_t>(lo - h.first);
      sel.to = h.diff_from + static_cast<std::size_t>(hi - h.first);
    } else {
      sel.from = h.diff_from + 1;
      sel.to = h.diff_to;
    }
    for (std::size_t i = sel.from; i <= sel.to && i < lines.size(); ++i)
      sel.lines.push_back(lines[i]);
    out.push_back(std::move(sel));
  }
  return out;
}

std::string generate_patch(const Item &item, const Hunk &hunk, std::size_t from, std::size_t to,
                           bool reverse) {
  if (!item.diff)
    throw PatchError("no diff loaded for " + item.name);
  if (hunk.diff_to >= item.diff->lines.size() || hunk.diff_from > hunk.diff_to)
    throw PatchError("hunk out of range for " + item.name);
  if (from > to)
    std::swap(from, to);

  const Body body = cut_body(item.diff->lines, hunk, from, to, reverse);

  const int old_start = reverse ? hunk.disk_from : hunk.index_from;
  const int old_len = reverse ? hunk.disk_len : hunk.index_len;
  const int first_line = old_len > 0 ? old_start : old_start + 1;

  std::ostringstream out;
  for (const auto &line : patch_header(*item.diff, body, reverse))
    out << line << '\n';
  out << "@@ -" << range_start(first_line, body.old_len) << ',' << body.old_len << " +"
      << range_start(first_line, body.new_len) << ',' << body.new_len << " @@\n";
  for (const auto &line : body.lines)
    out << line << '\n';
  return out.str();
}

} // namespace gitstage

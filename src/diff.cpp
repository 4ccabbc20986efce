#include "gitstage/diff.hpp"

#include "gitstage/consts.hpp"
#include "gitstage/hash.hpp"

#include <charconv>

namespace gitstage {

namespace {

std::string header_path(const std::vector<std::string> &header, std::string_view marker,
                        std::string_view prefix) {
  for (const auto &line : header) {
    if (!line.starts_with(marker))
      continue;
    std::string_view p{line};
    p.remove_prefix(marker.size());
    if (const auto tab = p.find('\t'); tab != std::string_view::npos)
      p = p.substr(0, tab);
    if (p == "/dev/null")
      return {};
    if (p.starts_with(prefix))
      p.remove_prefix(prefix.size());
    return std::string(p);
  }
  return {};
}

// Reads "<n>[,<m>]" from the front of `sv`; the count defaults to 1.
bool read_operands(std::string_view &sv, int &start, int &count) {
  const char *first = sv.data();
  const char *last = sv.data() + sv.size();
  auto [p, ec] = std::from_chars(first, last, start);
  if (ec != std::errc{})
    return false;
  count = 1;
  if (p != last && *p == ',') {
    auto [q, ec2] = std::from_chars(p + 1, last, count);
    if (ec2 != std::errc{})
      return false;
    p = q;
  }
  sv.remove_prefix(static_cast<std::size_t>(p - first));
  return true;
}

} // namespace

std::string Diff::old_path() const { return header_path(header, "--- ", "a/"); }

std::string Diff::new_path() const { return header_path(header, "+++ ", "b/"); }

namespace diff {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (const char c : text) {
    if (c == '\n') {
      out.push_back(std::move(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

void parse_range_line(std::string_view line, DiffHunk &out) {
  std::string_view sv = line;
  if (!sv.starts_with("@@ -"))
    throw DiffParseError("not a hunk header: " + std::string(line));
  sv.remove_prefix(4);
  if (!read_operands(sv, out.index_from, out.index_len))
    throw DiffParseError("bad old range in: " + std::string(line));
  if (!sv.starts_with(" +"))
    throw DiffParseError("missing new range in: " + std::string(line));
  sv.remove_prefix(2);
  if (!read_operands(sv, out.disk_from, out.disk_len))
    throw DiffParseError("bad new range in: " + std::string(line));
  if (!sv.starts_with(" @@"))
    throw DiffParseError("unterminated hunk header: " + std::string(line));
}

Diff parse_diff(std::string_view text) {
  Diff d;
  bool in_hunks = false;

  auto close_hunk = [&d] {
    if (d.hunks.empty())
      return;
    auto &h = d.hunks.back();
    h.diff_to = d.lines.size() - 1;
    h.hash = hunk_hash(d.lines, h.diff_from, h.diff_to);
  };

  for (auto &line : split_lines(text)) {
    if (!line.empty() && line.front() == consts::kHunkStart && line.starts_with("@@")) {
      close_hunk();
      DiffHunk h;
      parse_range_line(line, h);
      h.diff_from = d.lines.size();
      d.hunks.push_back(std::move(h));
      d.lines.push_back(std::move(line));
      in_hunks = true;
    } else if (!in_hunks) {
      d.header.push_back(std::move(line));
    } else if (line.starts_with("diff --git")) {
      throw DiffParseError("more than one file in diff output");
    } else {
      d.lines.push_back(std::move(line));
    }
  }
  close_hunk();
  return d;
}

} // namespace diff

} // namespace gitstage

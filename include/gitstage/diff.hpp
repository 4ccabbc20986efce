#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gitstage {

struct DiffHunk {
  std::string hash;         // content-derived key, see hunk_hash()
  std::size_t diff_from{0}; // index of the "@@" line in Diff::lines
  std::size_t diff_to{0};   // index of the last body line (inclusive)
  int index_from{0};        // old side: "-a,b"
  int index_len{0};
  int disk_from{0};         // new side: "+c,d"
  int disk_len{0};
};

struct Diff {
  std::vector<std::string> header; // "diff --git", "index", "--- a/x", "+++ b/x", ...
  std::vector<std::string> lines;  // everything from the first "@@" on
  std::vector<DiffHunk> hunks;

  // Path on the old/new side as named by the "---"/"+++" header lines.
  // Returns an empty string for /dev/null or a missing header.
  [[nodiscard]] std::string old_path() const;
  [[nodiscard]] std::string new_path() const;
};

class DiffParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

namespace diff {

// Parse the output of `git diff` for a single file.
Diff parse_diff(std::string_view text);

// Parse "@@ -a,b +c,d @@ ..." into the hunk's operands. Throws DiffParseError.
void parse_range_line(std::string_view line, DiffHunk &out);

// Utility to split raw text into lines (keeps newlines trimmed).
std::vector<std::string> split_lines(std::string_view text);

} // namespace diff

} // namespace gitstage

#pragma once
#include "gitstage/tree.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace gitstage {

// A hunk cut down to the diff lines a command acts on.
struct SelectedHunk {
  const Hunk *hunk{nullptr};
  std::size_t from{0}; // first selected index into Diff::lines
  std::size_t to{0};   // last selected index (inclusive)
  std::vector<std::string> lines;
};

class PatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Hunks of `item` whose rendered extent meets [first_line, last_line].
 *
 * Without `partial` every hit hunk is taken whole (diff_from + 1 .. diff_to).
 * With `partial` the extent is clipped to the range and shifted into diff-line
 * coordinates; a folded hunk is still taken whole since none of its body is
 * visible. A folded or unrendered item yields nothing.
 */
std::vector<SelectedHunk> hunks_in_range(const Item &item, int first_line, int last_line,
                                         bool partial);

/**
 * Standalone patch for diff lines [from, to] of `hunk`.
 *
 * Unselected "-" lines turn into context and unselected "+" lines are dropped,
 * so the patch applies to the side the diff was taken from. With `reverse`
 * the patch undoes the selection instead: signs are swapped, the range
 * operands are taken from the new side, unselected "+" lines become context
 * and unselected "-" lines are dropped, so it applies to the current state.
 */
std::string generate_patch(const Item &item, const Hunk &hunk, std::size_t from, std::size_t to,
                           bool reverse = false);

} // namespace gitstage

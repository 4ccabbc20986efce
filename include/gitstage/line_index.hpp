#pragma once
#include "gitstage/tree.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace gitstage {

// What lives at a line. Pointers borrow from the tree passed to resolve().
struct LineHit {
  const Section *section{nullptr};
  const Item *item{nullptr};
  const Hunk *hunk{nullptr};
};

// Smallest Section/Item/Hunk containing `line`; partial on header and gap lines.
LineHit resolve(const StatusTree &tree, int line);

struct KeyRef {
  std::size_t index{0}; // position among siblings, used when the key is gone
  std::string key;
};

// Cursor position expressed as keys so it survives a rebuild.
struct CursorLocation {
  std::optional<KeyRef> section;
  std::optional<KeyRef> item;
  std::optional<KeyRef> hunk;
  int first{0}; // range of the smallest node found, 0 when none
  int last{0};
};

CursorLocation save_cursor_location(const StatusTree &tree, int line);

/**
 * Line to put the cursor on after a rebuild.
 * A missing hunk falls back to its item, a missing item to its section, a
 * missing section to the one at the same position (or the last). An empty
 * tree yields line 1; no saved section picks the first foldable section.
 */
int restore_cursor_location(const StatusTree &tree, const CursorLocation &loc);

// first..last of the smallest node under `line`, for context highlighting.
std::optional<std::pair<int, int>> context_range(const StatusTree &tree, int line);

} // namespace gitstage

#pragma once
#include "gitstage/patch.hpp"
#include "gitstage/tree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gitstage {

struct SectionSelection {
  const Section *section{nullptr};
  std::vector<const Item *> items;
};

/**
 * Entities touched by a cursor or visual range.
 * Pointers borrow from the tree handed to select(); keep that tree alive
 * (the StatusView shared_ptr) for as long as the selection is used.
 */
struct Selection {
  std::vector<SectionSelection> sections;
  int first_line{0};
  int last_line{0};
  const Section *section{nullptr}; // section containing the whole range
  const Item *item{nullptr};       // focal item: first item containing the whole range
  std::optional<CommitEntry> commit;
  std::vector<const Item *> items;
  std::vector<CommitEntry> commits;

  [[nodiscard]] bool empty() const { return items.empty() && section == nullptr; }

  // Debug dump of the selection and the hunk lines it reaches.
  [[nodiscard]] std::string format() const;
};

// Lines may be given in either order.
Selection select(const StatusTree &tree, int range_start_line, int range_end_line);

struct ItemHunks {
  const Item *item{nullptr};
  std::vector<const Hunk *> hunks;
  std::vector<std::string> lines;
};

// Per selected item, the first hunk of the focal item that meets the range.
std::vector<ItemHunks> selection_hunks(const Selection &selection);

} // namespace gitstage

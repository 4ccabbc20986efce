#include "gitstage/line_index.hpp"

#include <algorithm>
#include <iterator>
#include <vector>

namespace gitstage {

namespace {

// Last node whose `first` is <= line, if it also contains the line.
// Valid because rendered siblings are sorted and disjoint.
template <typename Node> const Node *containing(const std::vector<Node> &nodes, int line) {
  const auto it = std::upper_bound(nodes.begin(), nodes.end(), line,
                                   [](int l, const Node &n) { return l < n.first; });
  if (it == nodes.begin())
    return nullptr;
  const Node &candidate = *std::prev(it);
  return candidate.contains(line) ? &candidate : nullptr;
}

template <typename Node> std::size_t index_of(const std::vector<Node> &nodes, const Node *n) {
  return static_cast<std::size_t>(n - nodes.data());
}

} // namespace

LineHit resolve(const StatusTree &tree, int line) {
  LineHit hit;
  hit.section = containing(tree.sections, line);
  if (!hit.section || hit.section->folded)
    return hit;
  hit.item = containing(hit.section->items, line);
  if (!hit.item || hit.item->folded)
    return hit;
  hit.hunk = containing(hit.item->hunks, line);
  return hit;
}

CursorLocation save_cursor_location(const StatusTree &tree, int line) {
  CursorLocation loc;
  const LineHit hit = resolve(tree, line);
  if (!hit.section)
    return loc;

  loc.section = KeyRef{index_of(tree.sections, hit.section), hit.section->name};
  if (line == hit.section->first) {
    loc.first = hit.section->first;
    loc.last = hit.section->last;
  }
  if (hit.item) {
    loc.item = KeyRef{index_of(hit.section->items, hit.item), hit.item->name};
    loc.first = hit.item->first;
    loc.last = hit.item->last;
  }
  if (hit.hunk) {
    loc.hunk = KeyRef{index_of(hit.item->hunks, hit.hunk), hit.hunk->hash};
    loc.first = hit.hunk->first;
    loc.last = hit.hunk->last;
  }
  return loc;
}

int restore_cursor_location(const StatusTree &tree, const CursorLocation &loc) {
  if (tree.empty())
    return 1;

  if (!loc.section) {
    // Skip the header rows and land on the first foldable region
    const auto it = std::ranges::find_if(tree.sections, [](const Section &s) { return !s.ignore_sign; });
    return it == tree.sections.end() ? tree.sections.front().first : it->first;
  }

  const Section *section = tree.find_section(loc.section->key);
  if (!section) {
    const auto idx = std::min(loc.section->index, tree.sections.size() - 1);
    return tree.sections[idx].first;
  }

  if (!loc.item || section->folded || section->items.empty())
    return section->first;

  const Item *item = section->find_item(loc.item->key);
  if (!item || !item->rendered())
    return section->first;

  if (!loc.hunk || item->folded || item->hunks.empty())
    return item->first;

  const Hunk *hunk = item->find_hunk(loc.hunk->key);
  if (!hunk || !hunk->rendered())
    return item->first;
  return hunk->first;
}

std::optional<std::pair<int, int>> context_range(const StatusTree &tree, int line) {
  const CursorLocation loc = save_cursor_location(tree, line);
  if (loc.first == 0)
    return std::nullopt;
  return std::make_pair(loc.first, loc.last);
}

} // namespace gitstage

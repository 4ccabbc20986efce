#include "gitstage/selection.hpp"

#include <algorithm>
#include <sstream>

namespace gitstage {

Selection select(const StatusTree &tree, int range_start_line, int range_end_line) {
  Selection res;
  res.first_line = std::min(range_start_line, range_end_line);
  res.last_line = std::max(range_start_line, range_end_line);
  const int first_line = res.first_line;
  const int last_line = res.last_line;

  for (const auto &section : tree.sections) {
    if (section.first > last_line)
      break;
    if (section.last < first_line)
      continue;

    if (section.first <= first_line && section.last >= last_line)
      res.section = &section;

    // A single line on the header acts on the whole section, folded or not.
    const bool entire_section = section.first == first_line && first_line == last_line;

    SectionSelection sel{.section = &section, .items = {}};
    for (const auto &item : section.items) {
      const bool hit = item.rendered() && item.first <= last_line && item.last >= first_line;
      if (!entire_section && !hit)
        continue;

      if (!res.item && item.rendered() && item.first <= first_line && item.last >= last_line) {
        res.item = &item;
        res.commit = item.commit;
      }
      if (item.commit)
        res.commits.push_back(*item.commit);

      res.items.push_back(&item);
      sel.items.push_back(&item);
    }
    res.sections.push_back(std::move(sel));
  }
  return res;
}

std::string Selection::format() const {
  std::ostringstream out;
  out << first_line << ',' << last_line << ":\n";
  for (const auto &sec : sections) {
    out << sec.section->name << ":\n";
    for (const Item *i : sec.items) {
      out << "  " << (i == item ? "*" : "") << i->name << ":\n";
      for (const auto &h : hunks_in_range(*i, first_line, last_line, true)) {
        out << "    " << h.from << ',' << h.to << ":\n";
        for (const auto &line : h.lines)
          out << "      " << line << '\n';
      }
    }
  }
  return out.str();
}

std::vector<ItemHunks> selection_hunks(const Selection &selection) {
  std::vector<ItemHunks> res;
  for (const Item *item : selection.items) {
    ItemHunks entry{.item = item, .hunks = {}, .lines = {}};
    if (selection.item && selection.item->diff) {
      const auto &lines = selection.item->diff->lines;
      for (const auto &h : selection.item->hunks) {
        if (h.rendered() && h.first <= selection.last_line && h.last >= selection.first_line) {
          entry.hunks.push_back(&h);
          for (std::size_t i = h.diff_from; i <= h.diff_to && i < lines.size(); ++i)
            entry.lines.push_back(lines[i]);
          break;
        }
      }
    }
    res.push_back(std::move(entry));
  }
  return res;
}

} // namespace gitstage

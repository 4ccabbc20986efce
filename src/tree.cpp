#include "gitstage/tree.hpp"

#include "gitstage/consts.hpp"

#include <algorithm>
#include <array>

namespace gitstage {

const Hunk *Item::find_hunk(std::string_view hash) const {
  const auto it = std::ranges::find(hunks, hash, &Hunk::hash);
  return it == hunks.end() ? nullptr : &*it;
}

const Item *Section::find_item(std::string_view item_name) const {
  const auto it = std::ranges::find(items, item_name, &Item::name);
  return it == items.end() ? nullptr : &*it;
}

const Section *StatusTree::find_section(std::string_view name) const {
  const auto it = std::ranges::find(sections, name, &Section::name);
  return it == sections.end() ? nullptr : &*it;
}

Section *StatusTree::find_section(std::string_view name) {
  const auto it = std::ranges::find(sections, name, &Section::name);
  return it == sections.end() ? nullptr : &*it;
}

SectionKind section_kind_for(std::string_view key) {
  static constexpr std::array kHeaders = {consts::kHeadHeader, consts::kUpstreamHeader,
                                          consts::kPushHeader, consts::kTagHeader};
  static constexpr std::array kDiffs = {consts::kUntracked, consts::kUnstaged, consts::kStaged};

  if (std::ranges::find(kHeaders, key) != kHeaders.end())
    return SectionKind::Header;
  if (std::ranges::find(kDiffs, key) != kDiffs.end())
    return SectionKind::DiffBearing;
  // stashes, recent, unpulled/unmerged, rebase and sequencer steps are commits
  return SectionKind::CommitBearing;
}

} // namespace gitstage

#pragma once
#include "gitstage/diff.hpp"
#include "gitstage/snapshot.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitstage {

// Decided once by the builder from the section key.
enum class SectionKind : std::uint8_t { Header, DiffBearing, CommitBearing };

// Line ranges are 1-based and inclusive. A node whose ancestor is folded is
// not rendered and keeps first == last == 0.
struct Hunk {
  std::string hash;
  int first{0};
  int last{0};
  std::size_t diff_from{0};
  std::size_t diff_to{0};
  int index_from{0};
  int index_len{0};
  int disk_from{0};
  int disk_len{0};
  bool folded{false};

  [[nodiscard]] bool rendered() const { return first > 0; }
  [[nodiscard]] bool contains(int line) const { return first <= line && line <= last; }
};

struct Item {
  std::string name;
  int first{0};
  int last{0};
  bool folded{true};
  std::vector<Hunk> hunks;
  std::optional<Diff> diff;
  std::optional<std::string> oid;
  std::optional<CommitEntry> commit;
  std::optional<std::string> mode;
  std::optional<std::string> original_name;
  std::optional<SubmoduleState> submodule;
  std::filesystem::path absolute_path;
  bool has_diff{false};
  bool done{false};

  [[nodiscard]] bool rendered() const { return first > 0; }
  [[nodiscard]] bool contains(int line) const { return first <= line && line <= last; }
  [[nodiscard]] const Hunk *find_hunk(std::string_view hash) const;
};

struct Section {
  std::string name;
  SectionKind kind{SectionKind::DiffBearing};
  int first{0};
  int last{0};
  std::vector<Item> items;
  bool folded{false};
  bool ignore_sign{false}; // header rows carry no fold marker
  std::optional<std::string> ref;        // header rows: ref the row points at
  std::optional<std::string> commit_oid; // header rows: commit the row points at

  [[nodiscard]] bool contains(int line) const { return first <= line && line <= last; }
  [[nodiscard]] const Item *find_item(std::string_view name) const;
};

struct StatusTree {
  std::vector<Section> sections;

  [[nodiscard]] bool empty() const { return sections.empty(); }
  [[nodiscard]] const Section *find_section(std::string_view name) const;
  [[nodiscard]] Section *find_section(std::string_view name);
};

SectionKind section_kind_for(std::string_view key);

} // namespace gitstage

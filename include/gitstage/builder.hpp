#pragma once
#include "gitstage/config.hpp"
#include "gitstage/snapshot.hpp"
#include "gitstage/tree.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gitstage {

// Semantic tag of one rendered line, consumed by the decoration layer.
enum class LineTag : std::uint8_t {
  Hint,
  Blank,
  HeaderRow,
  SectionHeader,
  Item,
  HunkHeader,
  Add,
  Delete,
  Context,
};

enum class FoldSign : std::uint8_t { None, Open, Closed };

struct LineInfo {
  LineTag tag{LineTag::Blank};
  FoldSign sign{FoldSign::None};
  bool done{false}; // applied rebase step
};

struct RenderedBuffer {
  std::vector<std::string> lines; // line N lives at lines[N - 1]
  std::vector<LineInfo> info;     // parallel to lines

  [[nodiscard]] int line_count() const { return static_cast<int>(lines.size()); }
};

struct BuildResult {
  StatusTree tree;
  RenderedBuffer buffer;
};

/**
 * Build a fresh tree and its text from repository data.
 *
 * `previous` is only consulted for fold state: sections are matched by name,
 * items by name within their section and hunks by hash within their item.
 * Deterministic for identical inputs.
 */
BuildResult build_status(const StatusTree &previous, const RepositorySnapshot &snapshot,
                         const RenderConfig &config);

// "M" -> "Modified", "AU" -> "Added by us", unknown codes verbatim, none -> "".
std::string format_mode(const std::optional<std::string> &mode);

// "(new commits, untracked content)" or "(malformed submodule)".
std::string format_submodule_mode(const SubmoduleState &state);

} // namespace gitstage

#pragma once
#include <chrono>
#include <cstddef>
#include <string_view>

namespace gitstage::consts {

// ——— Section keys (stable across rebuilds) ———
inline constexpr std::string_view kHeadHeader     = "head_branch_header";
inline constexpr std::string_view kUpstreamHeader = "upstream_header";
inline constexpr std::string_view kPushHeader     = "push_branch_header";
inline constexpr std::string_view kTagHeader      = "tag_header";

inline constexpr std::string_view kRebase              = "rebase";
inline constexpr std::string_view kSequencer           = "sequencer";
inline constexpr std::string_view kUntracked           = "untracked";
inline constexpr std::string_view kUnstaged            = "unstaged";
inline constexpr std::string_view kStaged              = "staged";
inline constexpr std::string_view kStashes             = "stashes";
inline constexpr std::string_view kUnpulledPushRemote  = "unpulled_pushRemote";
inline constexpr std::string_view kUnmergedPushRemote  = "unmerged_pushRemote";
inline constexpr std::string_view kUnpulledUpstream    = "unpulled_upstream";
inline constexpr std::string_view kUnmergedUpstream    = "unmerged_upstream";
inline constexpr std::string_view kRecent              = "recent";

// ——— Sequencer heads ———
inline constexpr std::string_view kRevertHead     = "REVERT_HEAD";
inline constexpr std::string_view kCherryPickHead = "CHERRY_PICK_HEAD";

// ——— Rendering ———
inline constexpr std::string_view kWidestModeLabel = "Modified by us";
inline constexpr std::size_t kModeLabelWidth = kWidestModeLabel.size();
inline constexpr int kWideColumns = 120; // below this, mode labels are not padded

// ——— Diff line prefixes ———
inline constexpr char kHunkStart = '@';
inline constexpr char kAddStart  = '+';
inline constexpr char kDelStart  = '-';
inline constexpr char kCtxStart  = ' ';

// ——— Refresh ———
inline constexpr std::chrono::milliseconds kRefreshWatchdog{10000};

// ——— Config ———
inline constexpr std::string_view kConfigFile = "gitstage.conf";

} // namespace gitstage::consts

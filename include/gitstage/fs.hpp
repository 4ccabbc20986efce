#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace gitstage::fs {

bool exists(const std::filesystem::path& p);

std::string read_text(const std::filesystem::path& p);

// Read a small state file (e.g. ".git/rebase-merge/msgnum"), trailing newlines
// stripped. std::nullopt if the file does not exist.
std::optional<std::string> read_state_file(const std::filesystem::path& p);

// Remove a worktree file; a missing file is not an error.
void remove_file(const std::filesystem::path& p);

} // namespace gitstage::fs

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitstage {

// Raw 20-byte SHA-1 digest (binary, not hex)
using digest = std::array<std::uint8_t, 20>;

/** Compute SHA-1 of arbitrary bytes. */
digest sha1(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha1(std::string_view s) {
  return sha1(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Convert a binary digest to 40-char lowercase hex. */
std::string to_hex(const digest &id);

/**
 * Content-derived identity of a hunk: hex SHA-1 over lines [from, to] joined
 * by '\n'. Identical hunk text always yields the same key.
 */
std::string hunk_hash(const std::vector<std::string> &lines, std::size_t from, std::size_t to);

} // namespace gitstage

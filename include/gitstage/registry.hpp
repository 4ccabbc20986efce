#pragma once
#include "gitstage/config.hpp"
#include "gitstage/git.hpp"
#include "gitstage/line_index.hpp"
#include "gitstage/refresh.hpp"
#include "gitstage/status_buffer.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace gitstage {

/**
 * Open status buffers, one per repository root.
 *
 * Closing a buffer keeps its cursor as a key path; the next buffer created
 * for the same root starts there.
 */
class BufferRegistry {
public:
  using BackendFactory = std::function<std::unique_ptr<GitBackend>(const std::filesystem::path &)>;

  explicit BufferRegistry(BackendFactory factory = make_git_cli);

  [[nodiscard]] StatusBuffer *find(const std::filesystem::path &root);

  // Existing buffer for `root`, or a new one after its first refresh.
  StatusBuffer &create(const std::filesystem::path &root, RenderConfig config,
                       RefreshOptions options = {});

  void close(const std::filesystem::path &root);
  void close_all();

  void refresh_all(const std::string &reason);
  void reset_all();

  [[nodiscard]] std::size_t size() const { return buffers_.size(); }

private:
  BackendFactory factory_;
  std::map<std::filesystem::path, std::unique_ptr<StatusBuffer>> buffers_;
  std::map<std::filesystem::path, CursorLocation> cursors_;
};

} // namespace gitstage

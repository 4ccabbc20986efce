#include "gitstage/registry.hpp"

#include "gitstage/log.hpp"

#include <utility>

namespace gitstage {

namespace {
std::filesystem::path key_for(const std::filesystem::path &root) {
  auto p = root.lexically_normal();
  if (!p.has_filename() && p.has_parent_path() && p != p.root_path())
    p = p.parent_path(); // "repo/" and "repo" are the same buffer
  return p;
}
} // namespace

BufferRegistry::BufferRegistry(BackendFactory factory) : factory_(std::move(factory)) {}

StatusBuffer *BufferRegistry::find(const std::filesystem::path &root) {
  const auto it = buffers_.find(key_for(root));
  return it == buffers_.end() ? nullptr : it->second.get();
}

StatusBuffer &BufferRegistry::create(const std::filesystem::path &root, RenderConfig config,
                                     RefreshOptions options) {
  const auto key = key_for(root);
  if (auto *existing = find(key))
    return *existing;

  auto buffer = std::make_unique<StatusBuffer>(factory_(key), std::move(config), options);
  buffer->refresh("open");
  if (const auto it = cursors_.find(key); it != cursors_.end()) {
    const auto view = buffer->view();
    buffer->set_cursor(restore_cursor_location(view->tree, it->second));
  }

  log::category("status")->debug("opened status buffer for {}", key.string());
  auto &ref = *buffer;
  buffers_.emplace(key, std::move(buffer));
  return ref;
}

void BufferRegistry::close(const std::filesystem::path &root) {
  const auto it = buffers_.find(key_for(root));
  if (it == buffers_.end())
    return;
  const auto view = it->second->view();
  cursors_[it->first] = save_cursor_location(view->tree, it->second->cursor());
  buffers_.erase(it);
}

void BufferRegistry::close_all() {
  while (!buffers_.empty())
    close(buffers_.begin()->first);
}

void BufferRegistry::refresh_all(const std::string &reason) {
  for (auto &[root, buffer] : buffers_)
    buffer->dispatch_refresh(reason);
}

void BufferRegistry::reset_all() {
  for (auto &[root, buffer] : buffers_)
    buffer->reset();
}

} // namespace gitstage

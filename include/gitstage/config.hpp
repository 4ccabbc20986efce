#pragma once
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace gitstage {

struct SectionConfig {
  bool hidden{false};
  bool folded{false};
};

struct RenderConfig {
  bool disable_hint{false};
  bool disable_signs{false};
  bool auto_refresh{true};
  bool fold_items{true}; // default fold state for items seen for the first time
  int columns{120};
  std::string log_level{"warn"};
  std::map<std::string, SectionConfig, std::less<>> sections;
  // action -> keys, used by the hint line
  std::map<std::string, std::vector<std::string>, std::less<>> mappings;

  [[nodiscard]] SectionConfig section(std::string_view key) const;
  [[nodiscard]] std::vector<std::string> keys_for(std::string_view action) const;
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Defaults used when no config file exists.
RenderConfig default_render_config();

// Read "key: value" lines (with '#' comments) on top of the defaults.
// A missing file yields the defaults; a malformed value throws ConfigError.
RenderConfig load_render_config(const std::filesystem::path &path);

// Apply a single "key: value" pair; exposed for the CLI overrides.
void apply_config_value(RenderConfig &cfg, std::string_view key, std::string_view value);

} // namespace gitstage

#include "gitstage/fs.hpp"

#include <fstream>
#include <stdexcept>

namespace gitstage::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::string read_text(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  auto n = static_cast<std::size_t>(ifs.tellg());
  ifs.seekg(0);
  std::string buf(n, '\0');
  if (n)
    ifs.read(buf.data(), static_cast<std::streamsize>(n));
  return buf;
}

std::optional<std::string> read_state_file(const std::filesystem::path &p) {
  if (!gitstage::fs::exists(p))
    return std::nullopt;
  std::string s = read_text(p);
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r'))
    s.pop_back();
  return s;
}

void remove_file(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::remove(p, ec);
  if (ec)
    throw std::runtime_error("remove failed: " + p.string() + ": " + ec.message());
}

} // namespace gitstage::fs

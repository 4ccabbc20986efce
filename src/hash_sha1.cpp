#include "gitstage/hash.hpp"

#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace gitstage {

digest sha1(std::span<const std::uint8_t> data) {
  digest out{};

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha1(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestInit_ex(EVP_sha1) failed");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx, data.data(), data.size()) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  EVP_MD_CTX_free(ctx);

  if (len != out.size()) {
    throw std::runtime_error("SHA-1 produced unexpected length");
  }
  return out;
}

std::string to_hex(const digest &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(id.size() * 2);
  for (std::size_t i = 0; i < id.size(); ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::string hunk_hash(const std::vector<std::string> &lines, std::size_t from, std::size_t to) {
  std::string joined;
  for (std::size_t i = from; i <= to && i < lines.size(); ++i) {
    if (i != from)
      joined.push_back('\n');
    joined.append(lines[i]);
  }
  return to_hex(sha1(joined));
}

} // namespace gitstage

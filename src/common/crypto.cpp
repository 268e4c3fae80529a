#include "warden/common/crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <vector>

namespace warden::common {

namespace {

std::string to_hex(const unsigned char *bytes, const std::size_t size) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(HEX[bytes[i] >> 4U]);
    out.push_back(HEX[bytes[i] & 0x0FU]);
  }
  return out;
}

} // namespace

Result<std::string> sha256_hex(const std::string_view data) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) !=
      1) {
    return Result<std::string>::failure("sha256 digest failed");
  }
  return Result<std::string>::success(to_hex(digest.data(), digest_len));
}

Result<std::string> random_hex(const std::size_t byte_count) {
  std::vector<unsigned char> bytes(byte_count);
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return Result<std::string>::failure("random generator unavailable");
  }
  return Result<std::string>::success(to_hex(bytes.data(), bytes.size()));
}

} // namespace warden::common

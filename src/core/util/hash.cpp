#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

namespace rowkeep::util {
namespace {

std::string to_hex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
    out.push_back(kHex[bytes[i] & 0x0FU]);
  }
  return out;
}

}  // namespace

bool sodium_ready() {
  static const bool ready = sodium_init() >= 0;
  return ready;
}

std::string sha256_hex(std::string_view payload) {
  if (!sodium_ready()) {
    return {};
  }
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(digest.data(), digest.size());
}

std::uint32_t random_below(std::uint32_t upper) {
  if (upper == 0 || !sodium_ready()) {
    return 0;
  }
  return randombytes_uniform(upper);
}

}  // namespace rowkeep::util

#include "core/util/compression.hpp"

#include <zstd.h>

namespace rowkeep::util {
namespace {

// Archives hold a few small JSON documents; anything claiming more is corrupt.
constexpr unsigned long long kMaxDecompressedBytes = 512ULL * 1024ULL * 1024ULL;

}  // namespace

std::optional<std::string> zstd_compress(std::string_view data, int level) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  const std::size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), level);
  if (ZSTD_isError(n) != 0U) {
    return std::nullopt;
  }
  out.resize(n);
  return out;
}

std::optional<std::string> zstd_decompress(std::string_view frame) {
  const unsigned long long expected = ZSTD_getFrameContentSize(frame.data(), frame.size());
  if (expected == ZSTD_CONTENTSIZE_ERROR || expected == ZSTD_CONTENTSIZE_UNKNOWN ||
      expected > kMaxDecompressedBytes) {
    return std::nullopt;
  }

  std::string out;
  out.resize(static_cast<std::size_t>(expected));
  const std::size_t n = ZSTD_decompress(out.data(), out.size(), frame.data(), frame.size());
  if (ZSTD_isError(n) != 0U || n != out.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace rowkeep::util

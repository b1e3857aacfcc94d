#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rowkeep::util {

std::optional<std::string> zstd_compress(std::string_view data, int level);
std::optional<std::string> zstd_decompress(std::string_view frame);

}  // namespace rowkeep::util

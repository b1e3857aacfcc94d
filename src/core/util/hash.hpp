#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace rowkeep::util {

bool sodium_ready();

std::string sha256_hex(std::string_view payload);

// Uniform in [0, upper); 0 when upper is 0.
std::uint32_t random_below(std::uint32_t upper);

}  // namespace rowkeep::util

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rowkeep::util {

std::int64_t steady_now_ms();

// 2026-10-19T12:00:00.123Z
std::string iso8601_utc(std::chrono::system_clock::time_point when);
// 20261019T120000123Z, sortable and safe for file names.
std::string compact_utc_stamp(std::chrono::system_clock::time_point when);

std::string lowercase_copy(std::string_view value);
std::string trim_copy(std::string_view value);

std::optional<std::int64_t> parse_int64(std::string_view text);

// key=value lines, '#' comments, backslash escapes for newlines.
std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload);

}  // namespace rowkeep::util

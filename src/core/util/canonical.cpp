#include "core/util/canonical.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rowkeep::util {
namespace {

std::tm utc_parts(std::chrono::system_clock::time_point when) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm parts{};
  gmtime_r(&seconds, &parts);
  return parts;
}

int millis_part(std::chrono::system_clock::time_point when) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
  return static_cast<int>(((ms % 1000) + 1000) % 1000);
}

}  // namespace

std::int64_t steady_now_ms() {
  const auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
}

std::string iso8601_utc(std::chrono::system_clock::time_point when) {
  const std::tm parts = utc_parts(when);
  std::ostringstream out;
  out << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_part(when) << 'Z';
  return out.str();
}

std::string compact_utc_stamp(std::chrono::system_clock::time_point when) {
  const std::tm parts = utc_parts(when);
  std::ostringstream out;
  out << std::put_time(&parts, "%Y%m%dT%H%M%S") << std::setw(3) << std::setfill('0')
      << millis_part(when) << 'Z';
  return out.str();
}

std::string lowercase_copy(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  std::ranges::transform(value, std::back_inserter(out), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::optional<std::int64_t> parse_int64(std::string_view text) {
  const std::string trimmed = trim_copy(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto result = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
  if (result.ec != std::errc() || result.ptr != trimmed.data() + trimmed.size()) {
    return std::nullopt;
  }
  return value;
}

std::unordered_map<std::string, std::string> parse_canonical_map(std::string_view payload) {
  std::unordered_map<std::string, std::string> parsed;

  std::string key;
  std::string value;
  key.reserve(64);
  value.reserve(payload.size());

  bool reading_key = true;
  bool escaping = false;
  bool comment = false;
  for (char c : payload) {
    if (comment) {
      if (c == '\n') {
        comment = false;
      }
      continue;
    }

    if (reading_key) {
      if (c == '#' && key.empty()) {
        comment = true;
        continue;
      }
      if (c == '=') {
        reading_key = false;
        continue;
      }
      if (c == '\n') {
        key.clear();
        continue;
      }
      key.push_back(c);
      continue;
    }

    if (escaping) {
      if (c == 'n') {
        value.push_back('\n');
      } else {
        value.push_back(c);
      }
      escaping = false;
      continue;
    }

    if (c == '\\') {
      escaping = true;
      continue;
    }

    if (c == '\n') {
      const std::string trimmed_key = trim_copy(key);
      if (!trimmed_key.empty()) {
        parsed.insert_or_assign(trimmed_key, trim_copy(value));
      }
      key.clear();
      value.clear();
      reading_key = true;
      continue;
    }

    value.push_back(c);
  }

  if (!reading_key) {
    const std::string trimmed_key = trim_copy(key);
    if (!trimmed_key.empty()) {
      parsed.insert_or_assign(trimmed_key, trim_copy(value));
    }
  }

  return parsed;
}

}  // namespace rowkeep::util

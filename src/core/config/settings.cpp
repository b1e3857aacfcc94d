#include "core/config/settings.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <optional>
#include <sstream>

#include "core/util/canonical.hpp"

extern char** environ;

namespace rowkeep::config {
namespace {

constexpr std::string_view kEnvPrefix = "ROWKEEP_";
constexpr std::string_view kConfigFileKey = "config_file";
constexpr std::string_view kCooldownPrefix = "cooldown_";
constexpr std::string_view kDefaultPrefix = "default_";
constexpr std::array<std::string_view, 8> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off",
};

// commands_per_minute -> ROWKEEP_COMMANDS_PER_MINUTE
std::string env_name(std::string_view key) {
  std::string out{kEnvPrefix};
  for (const unsigned char c : key) {
    out.push_back(static_cast<char>(std::toupper(c)));
  }
  return out;
}

std::optional<std::string> find_value(const SettingsMap& settings, std::string_view key) {
  const auto it = settings.find(std::string{key});
  if (it == settings.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result parse_number(const SettingsMap& settings, std::string_view key, std::int64_t min_value,
                    std::optional<std::int64_t>& out) {
  const auto raw = find_value(settings, key);
  if (!raw.has_value()) {
    return Result::success();
  }
  const auto parsed = util::parse_int64(*raw);
  if (!parsed.has_value() || *parsed < min_value) {
    return Result::failure("Invalid value for " + env_name(key) + ": '" + *raw +
                           "' (expected an integer >= " + std::to_string(min_value) + ").");
  }
  out = parsed;
  return Result::success();
}

template <typename T>
Result assign_number(const SettingsMap& settings, std::string_view key, std::int64_t min_value,
                     T& target, std::int64_t scale = 1) {
  std::optional<std::int64_t> value;
  const Result parsed = parse_number(settings, key, min_value, value);
  if (!parsed.ok) {
    return parsed;
  }
  if (value.has_value()) {
    target = static_cast<T>(*value * scale);
  }
  return Result::success();
}

// event_times -> event-times
std::string resource_key_from_setting(std::string_view suffix) {
  std::string out = util::lowercase_copy(suffix);
  std::ranges::replace(out, '_', '-');
  return out;
}

}  // namespace

SettingsMap environment_settings() {
  SettingsMap out;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string_view pair{*entry};
    if (!pair.starts_with(kEnvPrefix)) {
      continue;
    }
    const std::size_t eq = pair.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const std::string_view name = pair.substr(kEnvPrefix.size(), eq - kEnvPrefix.size());
    out.insert_or_assign(util::lowercase_copy(name), std::string{pair.substr(eq + 1)});
  }
  return out;
}

Result read_settings_file(std::string_view path, SettingsMap& out) {
  std::ifstream in{std::string{path}};
  if (!in) {
    return Result::failure("Unable to open config file: " + std::string{path});
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  for (auto& [key, value] : util::parse_canonical_map(buffer.str())) {
    out.insert_or_assign(util::lowercase_copy(key), value);
  }
  return Result::success("Config file loaded.", std::string{path});
}

Result apply_settings(InitConfig& config, const SettingsMap& settings) {
  if (auto value = find_value(settings, "data_dir")) {
    config.data_dir = util::trim_copy(*value);
  }
  if (auto value = find_value(settings, "log_dir")) {
    config.log_dir = util::trim_copy(*value);
  }
  if (auto value = find_value(settings, "log_level")) {
    const std::string level = util::lowercase_copy(util::trim_copy(*value));
    if (std::ranges::find(kLogLevels, level) == kLogLevels.end()) {
      return Result::failure("Invalid value for ROWKEEP_LOG_LEVEL: '" + *value + "'.");
    }
    config.log_level = level == "warning" ? "warn" : level;
  }
  if (auto value = find_value(settings, "remote_endpoint")) {
    config.remote.endpoint = util::trim_copy(*value);
  }
  if (auto value = find_value(settings, "remote_token")) {
    config.remote.token = util::trim_copy(*value);
  }
  if (auto value = find_value(settings, "backup_dir")) {
    config.backup.backup_dir = util::trim_copy(*value);
  }

  constexpr std::int64_t kMb = 1024 * 1024;
  constexpr std::int64_t kHour = 60 * 60;
  const std::array<Result, 13> numbers = {
      assign_number(settings, "remote_timeout_seconds", 1, config.remote.timeout_seconds),
      assign_number(settings, "commands_per_minute", 1, config.admission.commands_per_minute),
      assign_number(settings, "commands_per_hour", 1, config.admission.commands_per_hour),
      assign_number(settings, "buttons_per_minute", 1, config.admission.buttons_per_minute),
      assign_number(settings, "button_burst_limit", 1, config.admission.button_burst_limit),
      assign_number(settings, "button_burst_window_ms", 1, config.admission.button_burst_window_ms),
      assign_number(settings, "backup_max_count", 0, config.backup.max_backups),
      assign_number(settings, "backup_max_age_days", 0, config.backup.max_age_days),
      assign_number(settings, "backup_max_total_mb", 0, config.backup.max_total_bytes, kMb),
      assign_number(settings, "backup_interval_hours", 0, config.backup.interval_seconds, kHour),
      assign_number(settings, "sync_min_interval_ms", 0, config.sync.min_interval_ms),
      assign_number(settings, "sync_max_retries", 0, config.sync.max_retries),
      assign_number(settings, "sync_max_pending", 1, config.sync.max_pending),
  };
  for (const auto& number : numbers) {
    if (!number.ok) {
      return number;
    }
  }

  for (const auto& [key, raw] : settings) {
    if (key.starts_with(kCooldownPrefix) && key.size() > kCooldownPrefix.size()) {
      const auto seconds = util::parse_int64(raw);
      if (!seconds.has_value() || *seconds < 0) {
        return Result::failure("Invalid value for " + env_name(key) + ": '" + raw + "'.");
      }
      config.admission.cooldown_seconds[key.substr(kCooldownPrefix.size())] = *seconds;
      continue;
    }

    if (key.starts_with(kDefaultPrefix) && key.size() > kDefaultPrefix.size()) {
      Document parsed = Document::parse(raw, nullptr, false);
      if (parsed.is_discarded()) {
        return Result::failure("Invalid JSON for " + env_name(key) + ".");
      }
      config.default_overrides[resource_key_from_setting(key.substr(kDefaultPrefix.size()))] =
          std::move(parsed);
    }
  }

  return Result::success("Settings applied.");
}

Result load_from_environment(InitConfig& config) {
  const SettingsMap environment = environment_settings();

  SettingsMap merged;
  if (const auto file = find_value(environment, kConfigFileKey); file.has_value() && !file->empty()) {
    const Result loaded = read_settings_file(*file, merged);
    if (!loaded.ok) {
      return loaded;
    }
  }
  for (const auto& [key, value] : environment) {
    merged.insert_or_assign(key, value);
  }
  merged.erase(std::string{kConfigFileKey});

  return apply_settings(config, merged);
}

}  // namespace rowkeep::config

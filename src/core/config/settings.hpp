#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

#include "core/model/types.hpp"

namespace rowkeep::config {

// Settings keyed the way the config file spells them: lowercase, no
// ROWKEEP_ prefix (data_dir, commands_per_minute, cooldown_win, ...).
using SettingsMap = std::unordered_map<std::string, std::string>;

// Every ROWKEEP_* variable of the process environment.
SettingsMap environment_settings();

Result read_settings_file(std::string_view path, SettingsMap& out);

// Applies known keys onto config. Unknown keys are ignored; malformed
// values fail naming the offending key.
Result apply_settings(InitConfig& config, const SettingsMap& settings);

// File named by ROWKEEP_CONFIG_FILE first, then the environment on top.
Result load_from_environment(InitConfig& config);

}  // namespace rowkeep::config

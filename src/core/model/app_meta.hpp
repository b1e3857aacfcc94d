#pragma once

#include <string_view>

#ifndef ROWKEEP_APP_VERSION
#define ROWKEEP_APP_VERSION "1.0.2"
#endif

#ifndef ROWKEEP_BUILD_RELEASE
#define ROWKEEP_BUILD_RELEASE "Durable state core"
#endif

namespace rowkeep {

inline constexpr std::string_view kAppDisplayName = "rowkeep::event-bot state keeper";
inline constexpr std::string_view kBackupFormat = "rowkeep-backup-v1";
inline constexpr std::string_view kAppVersion = ROWKEEP_APP_VERSION;
inline constexpr std::string_view kBuildRelease = ROWKEEP_BUILD_RELEASE;

}  // namespace rowkeep

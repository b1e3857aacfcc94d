#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

#include "core/model/types.hpp"

namespace rowkeep::util {

// Installs stderr + rotating file sinks shared by every component logger.
// An empty log_dir keeps logging on stderr only.
Result init_logging(std::string_view log_dir, std::string_view level);

std::shared_ptr<spdlog::logger> component_logger(std::string_view name);

void shutdown_logging();

}  // namespace rowkeep::util

#include "core/util/logging.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rowkeep::util {
namespace {

constexpr std::string_view kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %n: %v";
constexpr std::size_t kMaxLogFileBytes = 5U * 1024U * 1024U;
constexpr std::size_t kMaxLogFiles = 3;

std::mutex& registry_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::vector<spdlog::sink_ptr>& shared_sinks() {
  static std::vector<spdlog::sink_ptr> sinks;
  return sinks;
}

spdlog::level::level_enum& shared_level() {
  static spdlog::level::level_enum level = spdlog::level::info;
  return level;
}

}  // namespace

Result init_logging(std::string_view log_dir, std::string_view level) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!log_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(std::string{log_dir}, ec);
    if (ec) {
      return Result::failure("Unable to create log directory: " + ec.message());
    }
    const std::string log_path = (std::filesystem::path{std::string{log_dir}} / "rowkeep.log").string();
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_path, kMaxLogFileBytes, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex& ex) {
      return Result::failure(std::string{"Unable to open log file: "} + ex.what());
    }
  }

  const spdlog::level::level_enum parsed = spdlog::level::from_str(std::string{level});
  for (auto& sink : sinks) {
    sink->set_pattern(std::string{kPattern});
  }

  std::lock_guard lock(registry_mutex());
  shared_sinks() = sinks;
  shared_level() = parsed;
  spdlog::apply_all([&sinks, parsed](const std::shared_ptr<spdlog::logger>& logger) {
    logger->sinks() = sinks;
    logger->set_level(parsed);
  });
  return Result::success("Logging initialized.");
}

std::shared_ptr<spdlog::logger> component_logger(std::string_view name) {
  const std::string logger_name{name};
  std::lock_guard lock(registry_mutex());
  if (auto existing = spdlog::get(logger_name)) {
    return existing;
  }

  if (shared_sinks().empty()) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(std::string{kPattern});
    shared_sinks().push_back(sink);
  }

  auto logger = std::make_shared<spdlog::logger>(logger_name, shared_sinks().begin(),
                                                 shared_sinks().end());
  logger->set_level(shared_level());
  spdlog::register_logger(logger);
  return logger;
}

void shutdown_logging() {
  std::lock_guard lock(registry_mutex());
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
}

}  // namespace rowkeep::util

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "app/command_line.hpp"
#include "core/api/core_api.hpp"
#include "core/config/settings.hpp"
#include "core/model/app_meta.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
  g_stop_requested = 1;
}

void print_usage() {
  std::cerr << "usage: rowkeepd [check|validate|backup [trigger]|backups|restore <archive> --confirm|serve]\n"
            << "configuration is read from ROWKEEP_* environment variables"
            << " (ROWKEEP_CONFIG_FILE for a key=value file)\n";
}

void print_health(const rowkeep::HealthReport& health) {
  std::cout << "Store: " << (health.store.healthy ? "healthy" : "UNHEALTHY") << " ("
            << health.store.details << ")\n";
  std::cout << "Data Dir: " << health.store.data_dir << "\n";
  std::cout << "Resources: " << health.store.resource_count << " (" << health.store.total_bytes
            << " bytes)\n";
  std::cout << "Quarantined: " << health.store.quarantine_count << "\n";
  std::cout << "Startup fixes: " << health.startup_fix_count << "\n";
  std::cout << "Mirror: " << (health.remote_configured ? "configured" : "local-only");
  if (health.remote_configured) {
    std::cout << (health.sync.connected ? ", connected" : ", disconnected")
              << ", pending=" << health.sync.pending << ", pushed=" << health.sync.pushed
              << ", dropped=" << health.sync.dropped;
  }
  std::cout << "\n";
  std::cout << "Backups: " << health.backups.total_backups << " (" << health.backups.total_size
            << " bytes), newest " << (health.backups.newest_backup.empty() ? "-" : health.backups.newest_backup)
            << "\n";
}

void print_fix_report(const rowkeep::FixReport& report) {
  if (report.empty()) {
    std::cout << "All resources valid.\n";
    return;
  }
  for (const auto& fix : report.fixes) {
    std::cout << "fixed: " << fix << "\n";
  }
  for (const auto& failure : report.failures) {
    std::cout << "FAILED: " << failure << "\n";
  }
}

int run_serve() {
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
  std::cout << rowkeep::kAppDisplayName << " " << rowkeep::kAppVersion << " ("
            << rowkeep::kBuildRelease << ") serving; Ctrl+C to stop.\n";
  while (g_stop_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + 1, argv + argc);
  const auto command = rowkeep::app::parse_command(args);
  if (!command.has_value()) {
    print_usage();
    return 2;
  }

  rowkeep::InitConfig config;
  const rowkeep::Result configured = rowkeep::config::load_from_environment(config);
  if (!configured.ok) {
    std::cerr << "rowkeepd configuration error: " << configured.message << '\n';
    return 2;
  }
  config.start_background_workers = command->needs_workers();

  rowkeep::CoreApi api;
  const rowkeep::Result init = api.init(config);
  if (!init.ok) {
    std::cerr << "rowkeepd init failed: " << init.message << '\n';
    return 1;
  }

  int status = 0;
  if (command->name == "check") {
    const auto health = api.health();
    print_health(health);
    status = health.store.healthy ? 0 : 1;
  } else if (command->name == "validate") {
    print_fix_report(api.last_fix_report());
    status = api.last_fix_report().failures.empty() ? 0 : 1;
  } else if (command->name == "backup") {
    const rowkeep::Result created = api.create_backup(command->trigger);
    std::cout << (created.ok ? created.data : created.message) << '\n';
    status = created.ok ? 0 : 1;
  } else if (command->name == "backups") {
    for (const auto& backup : api.list_backups()) {
      std::cout << backup.file_name << "  " << backup.size << " bytes";
      if (backup.metadata.has_value()) {
        std::cout << "  " << backup.metadata->timestamp << "  " << backup.metadata->trigger << "  "
                  << backup.metadata->files.size() << " resource(s)";
      }
      std::cout << '\n';
    }
  } else if (command->name == "restore") {
    const rowkeep::Result restored = api.restore_backup(command->archive, command->confirm);
    std::cout << restored.message << '\n';
    status = restored.ok ? 0 : 1;
  } else {
    status = run_serve();
  }

  api.shutdown();
  return status;
}

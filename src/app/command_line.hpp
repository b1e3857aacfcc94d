#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rowkeep::app {

struct Command {
  std::string name;
  std::string trigger;
  std::string archive;
  bool confirm = false;

  // serve and restore need the sync and backup threads running.
  [[nodiscard]] bool needs_workers() const { return name == "serve" || name == "restore"; }
};

// Empty when the arguments do not name a known subcommand.
inline std::optional<Command> parse_command(const std::vector<std::string_view>& args) {
  Command command;
  command.name = args.empty() ? "check" : std::string(args.front());

  if (command.name == "check" || command.name == "validate" || command.name == "backups" ||
      command.name == "serve") {
    return command;
  }
  if (command.name == "backup") {
    command.trigger = args.size() > 1 ? std::string(args[1]) : "manual";
    return command;
  }
  if (command.name == "restore") {
    if (args.size() < 2) {
      return std::nullopt;
    }
    command.archive = std::string(args[1]);
    command.confirm = args.size() > 2 && args[2] == "--confirm";
    return command;
  }
  return std::nullopt;
}

}  // namespace rowkeep::app

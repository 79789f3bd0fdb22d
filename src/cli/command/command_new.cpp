// FILE: src/cli/command/command_new.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/config_locator.hpp"

namespace mo {

bool handle_new(std::istringstream& iss, InteractionService& svc,
                std::string& current_doc, CliConfig& /*config*/) {
  std::string name;
  iss >> name;
  if (name.empty()) {
    std::cout << "Usage: new <name> [modern] [file]\n";
    return true;
  }
  bool legacy = true;
  std::string arg, file;
  while (iss >> arg) {
    if (arg == "modern")
      legacy = false;
    else
      file = arg;
  }
  // Without a file the per-app location MangoHud would read is used
  fs::path path = file.empty() ? default_path(name == "global" ? "" : name) : fs::path(file);
  if (!svc.cmd_new(name, legacy, path)) {
    print_last_error(svc, name, "failed to create '" + name + "'");
    return true;
  }
  current_doc = name;
  std::cout << "Created '" << name << "' (" << (legacy ? "legacy layout" : "ordered layout")
            << "), saves to " << path.string() << ".\n";
  return true;
}

void print_help_new(const CliConfig& /*config*/) {
  print_help_from_file("help_new.txt");
}

}  // namespace mo

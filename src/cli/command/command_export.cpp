// FILE: src/cli/command/command_export.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_export(std::istringstream& iss, InteractionService& svc,
                   std::string& current_doc, CliConfig& config) {
  if (!require_document(current_doc)) return true;
  std::string path, arg;
  bool only_changed = !config.show_defaults;
  while (iss >> arg) {
    if (arg == "all")
      only_changed = false;
    else if (arg == "changed")
      only_changed = true;
    else
      path = arg;
  }
  if (path.empty()) path = config.default_export_path;
  if (path == "-") {
    auto json = svc.cmd_export_json(current_doc, only_changed);
    if (!json) {
      print_last_error(svc, current_doc, "export failed");
      return true;
    }
    std::cout << *json << "\n";
    return true;
  }
  if (!svc.cmd_export_json_file(current_doc, path, only_changed)) {
    print_last_error(svc, current_doc, "export failed");
    return true;
  }
  std::cout << "Exported '" << current_doc << "' to " << path << ".\n";
  return true;
}

void print_help_export(const CliConfig& /*config*/) {
  print_help_from_file("help_export.txt");
}

}  // namespace mo

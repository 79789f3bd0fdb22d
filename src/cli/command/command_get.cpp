// FILE: src/cli/command/command_get.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/param_registry.hpp"

namespace mo {

bool handle_get(std::istringstream& iss, InteractionService& svc,
                std::string& current_doc, CliConfig& /*config*/) {
  if (!require_document(current_doc)) return true;
  std::string key;
  iss >> key;
  if (key.empty()) {
    std::cout << "Usage: get <key>\n";
    return true;
  }
  auto value = svc.cmd_get(current_doc, key);
  if (!value) {
    print_last_error(svc, current_doc, "unknown key '" + key + "'");
    return true;
  }
  const ParamSpec* spec = find_param(key);
  // Optional parameters (vsync, picmip...) have no value until set
  const bool optional_kind = spec && !spec->format(default_config());
  std::cout << key << "=" << (value->empty() && optional_kind ? "(unset)" : *value) << "\n";
  return true;
}

void print_help_get(const CliConfig& /*config*/) {
  print_help_from_file("help_get.txt");
}

}  // namespace mo

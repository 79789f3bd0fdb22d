// FILE: src/cli/command/command_env.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_env(std::istringstream& /*iss*/, InteractionService& svc,
                std::string& current_doc, CliConfig& /*config*/) {
  if (!require_document(current_doc)) return true;
  auto env = svc.cmd_env(current_doc);
  if (!env) {
    print_last_error(svc, current_doc, "env failed");
    return true;
  }
  std::cout << "MANGOHUD_CONFIG=\"" << *env << "\"\n";
  return true;
}

void print_help_env(const CliConfig& /*config*/) {
  print_help_from_file("help_env.txt");
}

}  // namespace mo

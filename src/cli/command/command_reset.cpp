// FILE: src/cli/command/command_reset.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_reset(std::istringstream& iss, InteractionService& svc,
                  std::string& current_doc, CliConfig& /*config*/) {
  if (!require_document(current_doc)) return true;
  std::string key;
  iss >> key;
  if (key.empty()) {
    std::cout << "Usage: reset <key>\n";
    return true;
  }
  if (!svc.cmd_reset(current_doc, key)) {
    print_last_error(svc, current_doc, "could not reset '" + key + "'");
    return true;
  }
  std::cout << key << " restored to its default.\n";
  return true;
}

void print_help_reset(const CliConfig& /*config*/) {
  print_help_from_file("help_reset.txt");
}

}  // namespace mo

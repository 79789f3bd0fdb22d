// FILE: src/cli/command/command_switch.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_switch(std::istringstream& iss, InteractionService& svc,
                   std::string& current_doc, CliConfig& /*config*/) {
  std::string name;
  iss >> name;
  if (name.empty()) {
    std::cout << "Usage: switch <name>\n";
    return true;
  }
  if (!svc.cmd_has_document(name)) {
    std::cout << "Document not found: " << name << "\n";
    return true;
  }
  current_doc = name;
  auto path = svc.cmd_document_path(name);
  std::cout << "Switched to '" << name << "'";
  if (path && !path->empty()) std::cout << " (" << path->string() << ")";
  std::cout << ".\n";
  return true;
}

void print_help_switch(const CliConfig& /*config*/) {
  print_help_from_file("help_switch.txt");
}

}  // namespace mo

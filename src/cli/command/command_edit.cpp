// FILE: src/cli/command/command_edit.cpp
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/hud_editor.hpp"

namespace mo {

bool handle_edit(std::istringstream& iss, InteractionService& svc,
                 std::string& current_doc, CliConfig& config) {
  std::string name;
  iss >> name;
  if (name.empty()) {
    if (!require_document(current_doc)) return true;
    name = current_doc;
  }
  run_hud_editor(svc, name, config);
  return true;
}

void print_help_edit(const CliConfig& /*config*/) {
  print_help_from_file("help_edit.txt");
}

}  // namespace mo

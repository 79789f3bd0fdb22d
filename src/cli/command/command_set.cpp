// FILE: src/cli/command/command_set.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_set(std::istringstream& iss, InteractionService& svc,
                std::string& current_doc, CliConfig& /*config*/) {
  if (!require_document(current_doc)) return true;
  std::string key;
  iss >> key;
  // "set key=value" is accepted as well as "set key value"
  std::string value;
  auto eq = key.find('=');
  if (eq != std::string::npos) {
    value = key.substr(eq + 1);
    key = key.substr(0, eq);
  } else {
    value = rest_of_line(iss);
  }
  if (key.empty()) {
    std::cout << "Usage: set <key> <value>\n";
    return true;
  }
  if (!svc.cmd_set(current_doc, key, value)) {
    print_last_error(svc, current_doc, "could not set '" + key + "'");
    return true;
  }
  std::cout << key << "=" << svc.cmd_get(current_doc, key).value_or("") << "\n";
  return true;
}

void print_help_set(const CliConfig& /*config*/) {
  print_help_from_file("help_set.txt");
}

}  // namespace mo

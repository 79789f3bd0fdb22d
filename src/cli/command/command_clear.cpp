// FILE: src/cli/command/command_clear.cpp
#include <iostream>
#include <sstream>
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_clear(std::istringstream& /*iss*/,
                  InteractionService& /*svc*/,
                  std::string& current_doc,
                  CliConfig& /*config*/) {
    std::cout << "\033[2J\033[1;1H";
    if (!current_doc.empty()) std::cout << "Current document: " << current_doc << "\n";
    return true;
}

void print_help_clear(const CliConfig& /*config*/) {
    print_help_from_file("help_clear.txt");
}

} // namespace mo

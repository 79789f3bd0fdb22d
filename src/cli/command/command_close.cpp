// FILE: src/cli/command/command_close.cpp
#include <iostream>
#include <sstream>
#include "cli/ask_yesno.hpp"
#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_close(std::istringstream& iss,
                  InteractionService& svc,
                  std::string& current_doc,
                  CliConfig& config) {
    std::string name; iss >> name;
    if (name.empty()) name = current_doc;
    if (name.empty()) { std::cout << "Usage: close <name>\n"; return true; }
    if (!svc.cmd_has_document(name)) { std::cout << "Document not found: " << name << "\n"; return true; }
    if (svc.cmd_is_dirty(name).value_or(false) && config.exit_prompt_save &&
        ask_yesno("'" + name + "' has unsaved changes. Save before closing?", true)) {
        if (!svc.cmd_save(name, {}, to_write_options(config))) {
            print_last_error(svc, name, "save failed");
            return true;
        }
    }
    svc.cmd_close(name);
    if (current_doc == name) current_doc.clear();
    std::cout << "Closed '" << name << "'.\n";
    return true;
}

void print_help_close(const CliConfig& /*config*/) {
    print_help_from_file("help_close.txt");
}

} // namespace mo

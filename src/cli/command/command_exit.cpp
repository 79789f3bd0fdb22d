// FILE: src/cli/command/command_exit.cpp
#include <sstream>
#include <iostream>
#include "cli/ask_yesno.hpp"
#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_exit(std::istringstream& /*iss*/,
                 InteractionService& svc,
                 std::string& /*current_doc*/,
                 CliConfig& config) {
    if (!config.exit_prompt_save) return false;
    for (const auto& name : svc.cmd_list_documents()) {
        if (!svc.cmd_is_dirty(name).value_or(false)) continue;
        auto path = svc.cmd_document_path(name);
        if (!path || path->empty()) {
            std::cout << "'" << name << "' has unsaved changes but no file; use 'save <file>' to keep it.\n";
            continue;
        }
        if (ask_yesno("Save changes to '" + name + "' (" + path->string() + ")?", true) &&
            !svc.cmd_save(name, {}, to_write_options(config))) {
            print_last_error(svc, name, "save failed");
        }
    }
    return false; // signal REPL exit
}

void print_help_exit(const CliConfig& /*config*/) {
    print_help_from_file("help_exit.txt");
}

} // namespace mo

// FILE: src/cli/command/command_save.cpp
#include <iostream>
#include <sstream>
#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"

namespace mo {

bool handle_save(std::istringstream& iss,
                 InteractionService& svc,
                 std::string& current_doc,
                 CliConfig& config) {
    if (!require_document(current_doc)) return true;
    WriteOptions opts = to_write_options(config);
    std::string arg, path;
    while (iss >> arg) {
        if (arg == "full") opts.mode = WriteMode::Full;
        else if (arg == "minimal") opts.mode = WriteMode::Minimal;
        else path = arg;
    }
    if (!svc.cmd_save(current_doc, path, opts)) {
        print_last_error(svc, current_doc, "save failed");
        return true;
    }
    auto saved_to = svc.cmd_document_path(current_doc);
    std::cout << "Saved '" << current_doc << "' to " << (saved_to ? saved_to->string() : path)
              << " (" << to_string(opts.mode) << ").\n";
    return true;
}

void print_help_save(const CliConfig& /*config*/) {
    print_help_from_file("help_save.txt");
}

} // namespace mo

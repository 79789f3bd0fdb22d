// FILE: include/cli/process_command.hpp
#pragma once
#include <string>

#include "cli_config.hpp"
#include "kernel/interaction.hpp"

namespace mo {

// Returns whether to continue REPL (false means exit)
bool process_command(const std::string& line, InteractionService& svc,
                     std::string& current_doc, CliConfig& config);

} // namespace mo

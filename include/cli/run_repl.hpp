// FILE: include/cli/run_repl.hpp
#pragma once
#include <string>
#include "cli_config.hpp"
#include "kernel/interaction.hpp"

namespace mo {

void run_repl(InteractionService& svc, CliConfig& config, const std::string& initial_doc);

} // namespace mo

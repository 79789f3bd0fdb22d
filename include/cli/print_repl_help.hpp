#pragma once
#include "cli_config.hpp"

namespace mo {

void print_repl_help(const CliConfig& config);

} // namespace mo

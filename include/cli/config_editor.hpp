// Tool settings editor (front-end only)
#pragma once

#include "cli_config.hpp"

namespace mo {

// Launch the TUI settings editor. The kernel does not manage these files.
void run_config_editor(CliConfig& config);

} // namespace mo

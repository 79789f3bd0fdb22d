// FILE: include/cli/command/help_utils.hpp
#pragma once
#include <string>

namespace mo {

// Print help text from <help dir>/<filename>. The directory is
// $MANGOVERLAY_HELP_DIR, else the one baked in at build time.
// If the file cannot be opened, prints a default message.
void print_help_from_file(const std::string& filename);

} // namespace mo

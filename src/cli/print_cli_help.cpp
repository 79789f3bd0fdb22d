// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

namespace mo {

void print_cli_help() {
  std::cout
      << "Usage: mangoverlay [options]\n\n"
      << "Edit MangoHud configuration files.\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -r, --read <file>          Open a MangoHud config file\n"
      << "      --app <name>           Open the config MangoHud would use for <name>\n"
      << "      --env-config <text>    Open a MANGOHUD_CONFIG string\n"
      << "  -n, --new                  Start from defaults instead of a file\n"
      << "  -s, --set <key=value>      Set a parameter (repeatable)\n"
      << "      --reset <key>          Restore a parameter's default (repeatable)\n"
      << "      --preset <n>           Apply built-in preset 0-4\n"
      << "  -g, --get <key>            Print one parameter value\n"
      << "  -p, --print                Print the config as it would be saved\n"
      << "      --full                 Write/print every parameter, not only changes\n"
      << "  -o, --output <file>        Save the config to <file>\n"
      << "      --env                  Print a MANGOHUD_CONFIG value\n"
      << "      --json <file>          Export the config as JSON ('-' for stdout)\n"
      << "      --validate             Report problems; exit status 1 on errors\n"
      << "      --settings <file>      Use a specific mangoverlay settings file\n"
      << "  -e, --edit                 Open the full-screen editor\n"
      << "  -R, --repl                 Start interactive shell (REPL)\n"
      << "\nWith no action the interactive shell starts.\n"
      << std::endl;
}

}  // namespace mo

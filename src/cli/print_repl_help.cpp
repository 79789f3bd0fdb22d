// FILE: src/cli/print_repl_help.cpp
#include <iostream>
#include "cli/print_repl_help.hpp"

namespace mo {

void print_repl_help(const CliConfig& config) {
    std::cout << "Available REPL (interactive shell) commands:\n\n"
              << "  help [command]\n"
              << "    Show this help message, or details for one command.\n\n"

              << "  clear\n"
              << "    Clear the terminal screen.\n\n"

              << "  config\n"
              << "    Open the mangoverlay settings editor.\n\n"

              << "  docs\n"
              << "    List open documents ('*' marks unsaved changes).\n\n"

              << "  open <name> [file] | open <file> | open <app>\n"
              << "    Open a MangoHud config. Without a file, MangoHud's lookup for <app> is used.\n\n"

              << "  new <name> [modern] [file]\n"
              << "    Start a config from defaults. 'modern' turns legacy_layout off.\n\n"

              << "  switch <name>\n"
              << "    Make another open document current.\n\n"

              << "  close [name]\n"
              << "    Close a document.\n\n"

              << "  show [changed|all|<section>]\n"
              << "    Print the config as it would be saved. Default: '"
              << (config.show_defaults ? "all" : "changed") << "'.\n\n"

              << "  get <key> | set <key> <value> | reset <key>\n"
              << "    Read, change or restore one parameter.\n\n"

              << "  params [section]\n"
              << "    Describe parameters with their kinds and values.\n\n"

              << "  layout [up|down <i> [n] | rm <i> | add <key> [value]]\n"
              << "    Show or change the draw order (legacy_layout=0 only).\n\n"

              << "  preset [0-4]\n"
              << "    List presets, or apply one beneath the current values.\n\n"

              << "  validate\n"
              << "    Report parse diagnostics and value problems.\n\n"

              << "  diff <a> [b]\n"
              << "    Compare two documents (or the current one with <a>).\n\n"

              << "  env\n"
              << "    Print the config as a MANGOHUD_CONFIG value.\n\n"

              << "  export [file|-] [changed|all]\n"
              << "    Export as JSON. Default file: '" << config.default_export_path << "'.\n\n"

              << "  save [file] [full|minimal]\n"
              << "    Write the config. Default mode: '" << config.write_mode
              << "', backup: " << (config.backup_on_save ? "on" : "off") << ".\n\n"

              << "  edit [name]\n"
              << "    Open the full-screen overlay editor.\n\n"

              << "  source <file>\n"
              << "    Execute commands from a script file.\n\n"

              << "  exit\n"
              << "    Quit the shell.\n"
              << "    Prompt to save changes (exit_prompt_save): "
              << (config.exit_prompt_save ? "true" : "false") << "\n";
}

} // namespace mo

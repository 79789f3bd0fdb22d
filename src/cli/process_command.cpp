// FILE: src/cli/process_command.cpp
#include "cli/process_command.hpp"

#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"
#include "cli_config.hpp"

namespace mo {

bool process_command(const std::string& line, InteractionService& svc,
                     std::string& current_doc, CliConfig& config) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if (cmd.empty() || cmd[0] == '#')
    return true;
  try {
    if (cmd == "help") {
      return handle_help(iss, svc, current_doc, config);
    } else if (cmd == "clear" || cmd == "cls") {
      return handle_clear(iss, svc, current_doc, config);
    } else if (cmd == "docs") {
      return handle_docs(iss, svc, current_doc, config);
    } else if (cmd == "open") {
      return handle_open(iss, svc, current_doc, config);
    } else if (cmd == "new") {
      return handle_new(iss, svc, current_doc, config);
    } else if (cmd == "switch") {
      return handle_switch(iss, svc, current_doc, config);
    } else if (cmd == "close") {
      return handle_close(iss, svc, current_doc, config);
    } else if (cmd == "show") {
      return handle_show(iss, svc, current_doc, config);
    } else if (cmd == "get") {
      return handle_get(iss, svc, current_doc, config);
    } else if (cmd == "set") {
      return handle_set(iss, svc, current_doc, config);
    } else if (cmd == "reset") {
      return handle_reset(iss, svc, current_doc, config);
    } else if (cmd == "params") {
      return handle_params(iss, svc, current_doc, config);
    } else if (cmd == "layout") {
      return handle_layout(iss, svc, current_doc, config);
    } else if (cmd == "preset") {
      return handle_preset(iss, svc, current_doc, config);
    } else if (cmd == "validate") {
      return handle_validate(iss, svc, current_doc, config);
    } else if (cmd == "diff") {
      return handle_diff(iss, svc, current_doc, config);
    } else if (cmd == "env") {
      return handle_env(iss, svc, current_doc, config);
    } else if (cmd == "export") {
      return handle_export(iss, svc, current_doc, config);
    } else if (cmd == "save") {
      return handle_save(iss, svc, current_doc, config);
    } else if (cmd == "edit") {
      return handle_edit(iss, svc, current_doc, config);
    } else if (cmd == "config") {
      return handle_config(iss, svc, current_doc, config);
    } else if (cmd == "source") {
      return handle_source(iss, svc, current_doc, config);
    } else if (cmd == "exit" || cmd == "quit" || cmd == "q") {
      return handle_exit(iss, svc, current_doc, config);
    } else {
      std::cout << "Unknown command: " << cmd
                << ". Type 'help' for a list of commands.\n";
    }
  } catch (const std::exception& e) {
    std::cout << "Error: " << e.what() << "\n";
  }
  return true;
}

}  // namespace mo

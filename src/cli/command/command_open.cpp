// FILE: src/cli/command/command_open.cpp
#include <iostream>
#include <sstream>

#include "cli/command/command_utils.hpp"
#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "hud/config_locator.hpp"

namespace mo {

namespace {

void print_diagnostics(InteractionService& svc, const std::string& name) {
  auto diags = svc.cmd_diagnostics(name);
  if (!diags || diags->empty()) return;
  for (const auto& d : *diags) {
    std::cout << "  " << to_string(d.severity) << ": line " << d.line << ": " << d.message << "\n";
  }
}

}  // namespace

bool handle_open(std::istringstream& iss, InteractionService& svc,
                 std::string& current_doc, CliConfig& config) {
  std::string name, file;
  iss >> name >> file;
  if (name.empty()) {
    if (config.default_app.empty()) {
      std::cout << "Usage: open <name> [file]\n";
      return true;
    }
    name = config.default_app;
  }

  fs::path path;
  if (!file.empty()) {
    path = file;
  } else if (fs::is_regular_file(name)) {
    // open <file>: document named after the file
    path = name;
    name = fs::path(name).stem().string();
  } else {
    // open <app>: MangoHud's own lookup for that application
    auto found = resolve(query_for_app(name));
    if (!found) {
      std::cout << "Error: No MangoHud config found for '" << name
                << "'. Looked in " << config_dir().string()
                << ". Use 'new " << name << "' to start one.\n";
      return true;
    }
    path = *found;
  }

  if (svc.cmd_has_document(name)) {
    std::cout << "Error: a document named '" << name
              << "' is already open. Close it first or pick another name.\n";
    return true;
  }
  if (!svc.cmd_open(name, path)) {
    print_last_error(svc, name, "failed to open " + path.string());
    return true;
  }
  current_doc = name;
  std::cout << "Opened '" << name << "' from " << path.string() << ".\n";
  print_diagnostics(svc, name);
  return true;
}

void print_help_open(const CliConfig& /*config*/) {
  print_help_from_file("help_open.txt");
}

}  // namespace mo

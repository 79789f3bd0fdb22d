// FILE: src/cli/command/command_help.cpp
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "cli/command/commands.hpp"
#include "cli/command/help_utils.hpp"
#include "cli/print_repl_help.hpp"

namespace mo {

namespace {

// Canonical command name for an alias
std::string canonicalize(const std::string& cmd) {
  static const std::unordered_map<std::string, std::string> alias = {
      {"cls", "clear"}, {"q", "exit"}, {"quit", "exit"}};
  auto it = alias.find(cmd);
  return (it == alias.end()) ? cmd : it->second;
}

using HelpPrinter = void (*)(const CliConfig&);

bool dispatch_print(const std::string& name, const CliConfig& config) {
  static const std::unordered_map<std::string, HelpPrinter> printers = {
      {"help", &print_help_help},       {"clear", &print_help_clear},
      {"docs", &print_help_docs},       {"open", &print_help_open},
      {"new", &print_help_new},         {"switch", &print_help_switch},
      {"close", &print_help_close},     {"show", &print_help_show},
      {"get", &print_help_get},         {"set", &print_help_set},
      {"reset", &print_help_reset},     {"params", &print_help_params},
      {"layout", &print_help_layout},   {"preset", &print_help_preset},
      {"validate", &print_help_validate}, {"diff", &print_help_diff},
      {"env", &print_help_env},         {"export", &print_help_export},
      {"save", &print_help_save},       {"edit", &print_help_edit},
      {"config", &print_help_config},   {"source", &print_help_source},
      {"exit", &print_help_exit}};
  auto it = printers.find(canonicalize(name));
  if (it == printers.end()) return false;
  it->second(config);
  return true;
}

}  // namespace

bool handle_help(std::istringstream& iss, InteractionService& /*svc*/,
                 std::string& /*current_doc*/, CliConfig& config) {
  std::string sub;
  if (!(iss >> sub)) {
    // No arg: print general REPL help
    print_repl_help(config);
    return true;
  }
  if (!dispatch_print(sub, config)) {
    std::cout << "Unknown command for help: '" << sub << "'\n";
  }
  return true;
}

void print_help_help(const CliConfig& /*config*/) {
  print_help_from_file("help_help.txt");
}

}  // namespace mo
